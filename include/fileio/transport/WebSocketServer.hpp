//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: WebSocketServer.hpp
// Purpose: Coroutine-based WebSocket (ws/wss) acceptor using Boost.Beast (TLS 1.3 only for wss)
//==========================================================================================================

#pragma once

#include <cstddef>
#include <cstdint>
#include <future>
#include <memory>
#include <string>

#include "fileio/transport/Transport.h"

namespace fileio {

// Note: WebSocketServer implements the server-side acceptor role (ITransportAcceptor); every upgraded
// connection is handed out as its own ITransport.
class WebSocketServer : public ITransportAcceptor {
public:
    //==========================================================================================================
    // Options
    // Purpose: Configuration for bind address/port, scheme, TLS files and message limits.
    // Fields:
    //   address: Bind address (default: 127.0.0.1)
    //   port: Listen port; "0" picks an ephemeral port (see LocalPort())
    //   scheme: "ws" or "wss" (TLS 1.3 only for wss)
    //   certFile/keyFile: PEM files required when scheme == wss
    //   maxMessageBytes: Largest accepted inbound message; larger ones close the connection
    //==========================================================================================================
    struct Options {
        std::string address{"127.0.0.1"};
        std::string port{"9000"};
        std::string scheme{"ws"};
        std::string certFile;
        std::string keyFile;
        std::size_t maxMessageBytes{4 * 1024 * 1024};
    };

    //==========================================================================================================
    // ParseListenUrl
    // Purpose: Splits "ws://host:port" or "wss://host:port" into Options fields. IPv6 hosts use brackets.
    // Throws:
    //   std::invalid_argument for an unknown scheme, a missing port, or a port outside [0, 65535].
    //==========================================================================================================
    static Options ParseListenUrl(const std::string& url);

    explicit WebSocketServer(const Options& opts);
    ~WebSocketServer() override;

    //==========================================================================================================
    // Binds and listens on the caller's thread, then runs the accept loop on a background I/O thread.
    // Returns:
    //   Future that is ready once accepting; holds the bind/listen exception on failure.
    //==========================================================================================================
    std::future<void> Start() override;

    //==========================================================================================================
    // Stops accepting, closes live connections, stops the I/O context, and joins the background thread.
    //==========================================================================================================
    std::future<void> Stop() override;

    void SetConnectionHandler(ConnectionHandler handler) override;
    void SetErrorHandler(ITransport::ErrorHandler handler) override;

    // Port actually bound (useful with port "0"); 0 before Start().
    std::uint16_t LocalPort() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace fileio
