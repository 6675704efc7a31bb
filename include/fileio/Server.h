//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Server.h
// Purpose: Owns the live sessions of the process and wires transports and acceptors to them
//==========================================================================================================

#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <string>

#include "fileio/Session.h"
#include "fileio/ToolRegistry.h"
#include "fileio/config/ServerConfig.h"
#include "fileio/transport/Transport.h"

namespace fileio {

// Session options derived from configuration (policy included).
SessionOptions SessionOptionsFromConfig(const ServerConfig& config);

//==========================================================================================================
// Server
// Purpose: Creates one Session per transport, keeps it alive until it closes, and tears everything down
//          in Stop(). All sessions share the read-only registry.
//==========================================================================================================
class Server {
public:
    Server(const ToolRegistry& registry, SessionOptions options);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    //==========================================================================================================
    // Attach
    // Purpose: Starts a session over an unstarted transport.
    // Returns:
    //   The running session; the server holds it until it closes.
    //==========================================================================================================
    std::shared_ptr<Session> Attach(std::shared_ptr<ITransport> transport);

    //==========================================================================================================
    // Listen
    // Purpose: Attaches every connection the acceptor produces, then starts the acceptor.
    // Throws:
    //   Whatever the acceptor's Start() future holds (e.g. bind failure).
    //==========================================================================================================
    void Listen(std::shared_ptr<ITransportAcceptor> acceptor);

    // Stops accepting, closes every live session, and releases them.
    void Stop();

    std::size_t SessionCount() const;

    // Invoked with the session id whenever a session closes.
    void SetSessionClosedHandler(std::function<void(const std::string&)> handler);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace fileio
