//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerConfig.h
// Purpose: Server configuration from FILEIO_* environment variables and --key=value options
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <stdexcept>
#include <string>

namespace fileio {

enum class TransportKind {
    Stdio,
    WebSocket
};

//==========================================================================================================
// ServerConfig
// Purpose: Everything the process needs to select a transport and size its sessions.
// Fields:
//   transport: stdio (default) or websocket
//   listen: ws://host:port or wss://host:port, used by the websocket transport
//   certFile/keyFile: PEM files for wss
//   maxInFlight: Per-session cap on concurrently running tool calls
//   shutdownTimeout: How long shutdown waits for in-flight tool calls
//   maxMessageBytes: Largest accepted inbound message on any transport
//   denyDangerous: Install the policy that rejects tools tagged dangerous
//   logLevel/logFile: Logger settings
//   showHelp/showVersion: Print and exit
//==========================================================================================================
struct ServerConfig {
    TransportKind transport{TransportKind::Stdio};
    std::string listen{"ws://127.0.0.1:9000"};
    std::string certFile;
    std::string keyFile;
    std::size_t maxInFlight{16};
    std::chrono::milliseconds shutdownTimeout{10000};
    std::size_t maxMessageBytes{4 * 1024 * 1024};
    bool denyDangerous{false};
    std::string logLevel{"INFO"};
    std::string logFile;
    bool showHelp{false};
    bool showVersion{false};
};

// Raised for an unknown option or a malformed value.
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

const char* TransportKindName(TransportKind kind);

// Defaults overlaid with FILEIO_* environment variables.
ServerConfig ConfigFromEnvironment();

//==========================================================================================================
// ApplyCommandLine
// Purpose: Overlays --key=value options (argv[1..argc)) on config. Flags (--deny-dangerous, --help,
//          --version) take no value.
// Throws:
//   ConfigError for unknown options, missing or malformed values.
//==========================================================================================================
void ApplyCommandLine(ServerConfig& config, int argc, const char* const* argv);

// ConfigFromEnvironment() then ApplyCommandLine(); the command line wins.
ServerConfig LoadServerConfig(int argc, const char* const* argv);

// Text printed for --help.
std::string UsageText(const std::string& program);

} // namespace fileio
