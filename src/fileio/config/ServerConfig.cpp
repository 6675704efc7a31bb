//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerConfig.cpp
// Purpose: Server configuration loading
//==========================================================================================================

#include <cstdint>
#include <format>
#include <optional>

#include "env/EnvVars.h"
#include "fileio/config/ServerConfig.h"

namespace fileio {

namespace {

TransportKind parseTransport(const std::string& value) {
    if (value == "stdio") {
        return TransportKind::Stdio;
    }
    if (value == "websocket" || value == "ws") {
        return TransportKind::WebSocket;
    }
    throw ConfigError("Unknown transport: " + value + " (expected stdio|websocket)");
}

std::uint64_t parsePositive(const std::string& key, const std::string& value) {
    if (value.empty() || value.size() > 18) {
        throw ConfigError(key + " expects a positive integer, got '" + value + "'");
    }
    std::uint64_t out = 0;
    for (char c : value) {
        if (c < '0' || c > '9') {
            throw ConfigError(key + " expects a positive integer, got '" + value + "'");
        }
        out = out * 10 + static_cast<std::uint64_t>(c - '0');
    }
    if (out == 0) {
        throw ConfigError(key + " must be greater than zero");
    }
    return out;
}

void checkListen(const std::string& listen) {
    if (listen.rfind("ws://", 0) != 0 && listen.rfind("wss://", 0) != 0) {
        throw ConfigError("listen address must start with ws:// or wss://: " + listen);
    }
}

} // namespace

const char* TransportKindName(TransportKind kind) {
    switch (kind) {
        case TransportKind::Stdio: return "stdio";
        case TransportKind::WebSocket: return "websocket";
    }
    return "unknown";
}

ServerConfig ConfigFromEnvironment() {
    ServerConfig config;
    const std::string transport = GetEnvOrDefault("FILEIO_TRANSPORT", "");
    if (!transport.empty()) {
        config.transport = parseTransport(transport);
    }
    config.listen = GetEnvOrDefault("FILEIO_LISTEN", config.listen);
    config.certFile = GetEnvOrDefault("FILEIO_TLS_CERT", config.certFile);
    config.keyFile = GetEnvOrDefault("FILEIO_TLS_KEY", config.keyFile);
    config.maxInFlight = static_cast<std::size_t>(GetEnvUInt64OrDefault("FILEIO_MAX_IN_FLIGHT", config.maxInFlight));
    config.shutdownTimeout = std::chrono::milliseconds(
        GetEnvUInt64OrDefault("FILEIO_SHUTDOWN_TIMEOUT_MS", static_cast<std::uint64_t>(config.shutdownTimeout.count())));
    config.maxMessageBytes = static_cast<std::size_t>(GetEnvUInt64OrDefault("FILEIO_MAX_MESSAGE_BYTES", config.maxMessageBytes));
    config.denyDangerous = GetEnvBoolOrDefault("FILEIO_DENY_DANGEROUS", config.denyDangerous);
    config.logLevel = GetEnvOrDefault("FILEIO_LOG_LEVEL", config.logLevel);
    config.logFile = GetEnvOrDefault("FILEIO_LOG_FILE", config.logFile);
    // Zero from the environment means "unset"
    if (config.maxInFlight == 0) {
        config.maxInFlight = 16;
    }
    if (config.maxMessageBytes == 0) {
        config.maxMessageBytes = 4 * 1024 * 1024;
    }
    return config;
}

void ApplyCommandLine(ServerConfig& config, int argc, const char* const* argv) {
    for (int i = 1; i < argc; ++i) {
        if (argv[i] == nullptr) {
            continue;
        }
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            config.showHelp = true;
            continue;
        }
        if (arg == "--version" || arg == "-V") {
            config.showVersion = true;
            continue;
        }
        if (arg == "--deny-dangerous") {
            config.denyDangerous = true;
            continue;
        }
        const std::size_t eq = arg.find('=');
        if (arg.rfind("--", 0) != 0 || eq == std::string::npos) {
            throw ConfigError("Unrecognized argument: " + arg + " (options use --key=value)");
        }
        const std::string key = arg.substr(0, eq);
        const std::string value = arg.substr(eq + 1);
        if (key == "--transport") {
            config.transport = parseTransport(value);
        } else if (key == "--listen") {
            checkListen(value);
            config.listen = value;
        } else if (key == "--cert") {
            config.certFile = value;
        } else if (key == "--key") {
            config.keyFile = value;
        } else if (key == "--max-in-flight") {
            config.maxInFlight = static_cast<std::size_t>(parsePositive(key, value));
        } else if (key == "--shutdown-timeout-ms") {
            config.shutdownTimeout = std::chrono::milliseconds(parsePositive(key, value));
        } else if (key == "--max-message-bytes") {
            config.maxMessageBytes = static_cast<std::size_t>(parsePositive(key, value));
        } else if (key == "--log-level") {
            config.logLevel = value;
        } else if (key == "--log-file") {
            config.logFile = value;
        } else {
            throw ConfigError("Unknown option: " + key);
        }
    }
}

ServerConfig LoadServerConfig(int argc, const char* const* argv) {
    ServerConfig config = ConfigFromEnvironment();
    ApplyCommandLine(config, argc, argv);
    if (config.transport == TransportKind::WebSocket) {
        checkListen(config.listen);
        if (config.listen.rfind("wss://", 0) == 0 && (config.certFile.empty() || config.keyFile.empty())) {
            throw ConfigError("wss:// requires --cert and --key");
        }
    }
    return config;
}

std::string UsageText(const std::string& program) {
    return std::format(
        "Usage: {} [options]\n"
        "\n"
        "Filesystem tool server speaking MCP (JSON-RPC 2.0) over stdio or WebSocket.\n"
        "\n"
        "Options (each also settable through the environment variable shown):\n"
        "  --transport=stdio|websocket   FILEIO_TRANSPORT            (default stdio)\n"
        "  --listen=ws://host:port       FILEIO_LISTEN               (default ws://127.0.0.1:9000)\n"
        "  --cert=FILE --key=FILE        FILEIO_TLS_CERT/KEY         PEM files for wss://\n"
        "  --max-in-flight=N             FILEIO_MAX_IN_FLIGHT        (default 16)\n"
        "  --shutdown-timeout-ms=N       FILEIO_SHUTDOWN_TIMEOUT_MS  (default 10000)\n"
        "  --max-message-bytes=N         FILEIO_MAX_MESSAGE_BYTES    (default 4194304)\n"
        "  --deny-dangerous              FILEIO_DENY_DANGEROUS=1     reject destructive tools\n"
        "  --log-level=LEVEL             FILEIO_LOG_LEVEL            DEBUG|INFO|WARN|ERROR\n"
        "  --log-file=FILE               FILEIO_LOG_FILE\n"
        "  --version                     print the version and exit\n"
        "  --help                        print this help and exit\n",
        program);
}

} // namespace fileio
