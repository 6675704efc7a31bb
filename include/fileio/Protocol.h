//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: Protocol data structures, version list, and method names
//==========================================================================================================

#pragma once

#include "fileio/JSONRPCTypes.h"
#include <array>
#include <string>
#include <vector>
#include <optional>

namespace fileio {
//==========================================================================================================
// Protocol types and constants
// Purpose: Shared protocol structures, capabilities, and method names.
//==========================================================================================================
///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
// Versions accepted during initialize; negotiation is exact match or reject.
constexpr std::array<const char*, 3> SUPPORTED_PROTOCOL_VERSIONS = {
    "2024-11-05",
    "2025-06-18",
    "2025-11-25"
};

// Used when a client omits protocolVersion.
constexpr const char* DEFAULT_PROTOCOL_VERSION = "2024-11-05";

bool IsSupportedProtocolVersion(const std::string& version);

///////////////////////////////////////// Implementation ///////////////////////////////////////////
// Implementation information
struct Implementation {
    std::string name;
    std::string version;

    Implementation() = default;
    Implementation(std::string name, std::string version)
        : name(std::move(name)), version(std::move(version)) {}
};

///////////////////////////////////////// Capabilities ///////////////////////////////////////////
struct ToolsCapability {
    bool listChanged = false;
};

struct ServerCapabilities {
    std::optional<ToolsCapability> tools;
};

JSONValue ToJSON(const ServerCapabilities& caps);

///////////////////////////////////////// Tools ///////////////////////////////////////////
// Public metadata of a tool as advertised by tools/list.
struct Tool {
    std::string name;
    std::string description;
    JSONValue inputSchema;  // JSON Schema for tool parameters
    bool dangerous = false; // advertised as annotations.destructiveHint

    Tool() = default;
    Tool(std::string name, std::string description, JSONValue inputSchema, bool dangerous = false)
        : name(std::move(name)), description(std::move(description)),
          inputSchema(std::move(inputSchema)), dangerous(dangerous) {}
};

JSONValue ToJSON(const Tool& tool);

struct CallToolResult {
    std::vector<JSONValue> content;  // Array of content items
    bool isError = false;
};

JSONValue ToJSON(const CallToolResult& result);

// {type:"text", text}
JSONValue MakeTextContent(const std::string& text);
// {type:"json", value}
JSONValue MakeJsonContent(const JSONValue& value);

CallToolResult TextResult(const std::string& text, bool isError = false);
CallToolResult JsonResult(const JSONValue& value);

///////////////////////////////////////// Method names ///////////////////////////////////////////
namespace Methods {
    // Client to server
    constexpr const char* Initialize = "initialize";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";
    constexpr const char* Shutdown = "shutdown";
    constexpr const char* Ping = "ping";

    // Notifications
    constexpr const char* Initialized = "notifications/initialized";
    constexpr const char* InitializedLegacy = "initialized";
    constexpr const char* Cancelled = "notifications/cancelled";
    constexpr const char* Exit = "exit";
}

} // namespace fileio
