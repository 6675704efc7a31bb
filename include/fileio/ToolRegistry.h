//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolRegistry.h
// Purpose: Immutable tool table: schema-checked resolution and dispatch of tools/call
//==========================================================================================================

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "fileio/JSONRPCTypes.h"
#include "fileio/Protocol.h"
#include "fileio/errors/Errors.h"

namespace fileio {

//==========================================================================================================
// ToolKind
// Purpose: Closed set of handlers. Each ToolDefinition is bound to exactly one kind at startup and
//          InvokeTool switches on it; nothing is registered at runtime.
//==========================================================================================================
enum class ToolKind {
    ReadLines,
    WriteFile,
    SetPermissions,
    SetMode,
    GetPermissions,
    Touch,
    Stat,
    MakeDirectory,
    ListDirectory,
    FindFiles,
    FindInFiles,
    EditFile,
    Copy,
    Move,
    Remove,
    RemoveDirectory,
    CreateHardLink,
    CreateSymbolicLink,
    GetBasename,
    GetDirname,
    GetCanonicalPath,
    ReadSymbolicLink,
    CreateTemporary,
    ChangeOwnership,
    GetCurrentDirectory,
    CountLines,
    CountWords
};

//==========================================================================================================
// ToolDefinition
// Purpose: Registry-owned tool entry. metadata.inputSchema is the JSON Schema arguments are checked
//          against; metadata.dangerous tags destructive or identity-changing tools.
//==========================================================================================================
struct ToolDefinition {
    ToolKind kind;
    Tool metadata;

    const std::string& name() const { return metadata.name; }
    bool dangerous() const { return metadata.dangerous; }
};

//==========================================================================================================
// Invocation
// Purpose: One resolved tools/call. Lives only for the duration of dispatch.
// Fields:
//   definition: Points into the registry; valid for the registry's lifetime.
//   arguments: Schema-validated argument object.
//   requestId: Id of the originating request, for logs.
//==========================================================================================================
struct Invocation {
    const ToolDefinition* definition{nullptr};
    JSONValue arguments;
    JSONRPCId requestId{nullptr};
};

// Either a content result or a protocol-level error; exactly one is set.
struct DispatchResult {
    std::optional<CallToolResult> result;
    std::optional<errors::McpError> error;
};

// Either a validated invocation or the protocol error that prevented it.
struct Resolution {
    std::optional<Invocation> invocation;
    std::optional<errors::McpError> error;
};

//==========================================================================================================
// InvokeTool
// Purpose: Runs the handler bound to kind. Arguments must already satisfy the tool's schema.
// Throws:
//   errors::FileIoError for single-target domain failures, errors::ToolParamError for arguments the
//   schema cannot rule out, and anything else the collaborators raise. ToolRegistry::Invoke maps these.
//==========================================================================================================
CallToolResult InvokeTool(ToolKind kind, const JSONValue& arguments);

// Definitions for every built-in tool, schemas parsed from their literal form.
std::vector<ToolDefinition> BuildToolCatalog();

//==========================================================================================================
// ToolRegistry
// Purpose: Name -> ToolDefinition table built once and shared read-only by every session. All members
//          are const after construction, so concurrent use needs no locking.
//==========================================================================================================
class ToolRegistry {
public:
    explicit ToolRegistry(std::vector<ToolDefinition> definitions);

    // Registry holding BuildToolCatalog().
    static const ToolRegistry& Default();

    // Public metadata of every tool, in catalog order.
    const std::vector<ToolDefinition>& List() const { return definitions; }

    const ToolDefinition* Find(const std::string& name) const;

    std::size_t Size() const { return definitions.size(); }

    //==================================================================================================
    // Resolve
    // Purpose: Look up name and validate arguments (absent or null arguments count as {}).
    // Returns:
    //   MethodNotFound for an unknown tool, InvalidParams for a schema violation, else an Invocation.
    //==================================================================================================
    Resolution Resolve(const std::string& name, const std::optional<JSONValue>& arguments,
                       const JSONRPCId& requestId = nullptr) const;

    //==================================================================================================
    // Invoke
    // Purpose: Run a resolved invocation. Domain failures of single-target tools become isError
    //          results; ToolParamError becomes InvalidParams; any other exception becomes InternalError.
    //          Nothing escapes.
    //==================================================================================================
    DispatchResult Invoke(const Invocation& invocation) const;

    // Resolve + Invoke.
    DispatchResult Dispatch(const std::string& name, const std::optional<JSONValue>& arguments) const;

private:
    std::vector<ToolDefinition> definitions;
    std::unordered_map<std::string, std::size_t> byName;
};

} // namespace fileio
