//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: fileio-mcp entry point: configuration, logging, transport selection
//==========================================================================================================

#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <pthread.h>
#include <unistd.h>

#include "logging/Logger.h"
#include "fileio/Server.h"
#include "fileio/ToolRegistry.h"
#include "fileio/config/ServerConfig.h"
#include "fileio/transport/StdioTransport.hpp"
#include "fileio/transport/WebSocketServer.hpp"
#include "fileio/version.h"

using namespace fileio;

namespace {

int runStdio(Server& server, const ServerConfig& config) {
    auto transport = std::make_shared<StdioTransport>(STDIN_FILENO, STDOUT_FILENO, config.maxMessageBytes);
    auto session = server.Attach(transport);
    while (!session->WaitUntilClosed(std::chrono::seconds(1))) {
    }
    LOG_INFO("stdio session finished");
    server.Stop();
    return 0;
}

int runWebSocket(Server& server, const ServerConfig& config) {
    // Block termination signals before any I/O thread exists so only sigwait below sees them
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    std::shared_ptr<WebSocketServer> acceptor;
    try {
        WebSocketServer::Options opts = WebSocketServer::ParseListenUrl(config.listen);
        opts.certFile = config.certFile;
        opts.keyFile = config.keyFile;
        opts.maxMessageBytes = config.maxMessageBytes;
        acceptor = std::make_shared<WebSocketServer>(opts);
        server.Listen(acceptor);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start WebSocket transport on {}: {}", config.listen, e.what());
        return 1;
    }
    LOG_INFO("Serving WebSocket clients on port {}", acceptor->LocalPort());

    int sig = 0;
    if (sigwait(&signals, &sig) == 0) {
        LOG_INFO("Received signal {}; shutting down", sig);
    }
    server.Stop();
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    FUNC_SCOPE();
    // A vanished peer must surface as EPIPE on write, not kill the process
    std::signal(SIGPIPE, SIG_IGN);

    ServerConfig config;
    try {
        config = LoadServerConfig(argc, argv);
    } catch (const ConfigError& e) {
        std::cerr << "fileio-mcp: " << e.what() << "\n\n" << UsageText(argv[0]);
        return 2;
    }
    if (config.showHelp) {
        std::cout << UsageText(argv[0]);
        return 0;
    }
    if (config.showVersion) {
        std::cout << SERVER_NAME << " " << getVersionString() << std::endl;
        return 0;
    }

    if (config.transport == TransportKind::Stdio) {
        // stdout carries protocol frames
        Logger::setUseStderr(true);
    }
    Logger::setLogLevelFromString(config.logLevel);
    if (!config.logFile.empty()) {
        Logger::setLogFile(config.logFile);
    }
    LOG_INFO("{} {} starting (transport={}, maxInFlight={}, denyDangerous={})", SERVER_NAME, getVersionString(),
             TransportKindName(config.transport), config.maxInFlight, config.denyDangerous);

    Server server(ToolRegistry::Default(), SessionOptionsFromConfig(config));
    if (config.transport == TransportKind::Stdio) {
        return runStdio(server, config);
    }
    return runWebSocket(server, config);
}
