//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Transport.h
// Purpose: Transport layer interfaces: one connection (ITransport) and the listener producing them
//==========================================================================================================

#pragma once

#include <memory>
#include <string>
#include <functional>
#include <future>

namespace fileio {

//==========================================================================================================
// ITransport
// Purpose: One client connection carrying discrete protocol payloads (already de-framed). Handlers must
//          be registered before Start().
//==========================================================================================================
class ITransport {
public:
    virtual ~ITransport() = default;

    /////////////////////////////////////////// Connection lifecycle ///////////////////////////////////////////
    //==========================================================================================================
    // Starts the transport I/O loops.
    // Returns:
    //   A future that completes when the transport is running.
    //==========================================================================================================
    virtual std::future<void> Start() = 0;

    //==========================================================================================================
    // Flushes queued outbound payloads (bounded by an internal deadline), then closes the connection and
    // stops the I/O loops. Safe to call from a handler running on the transport's own thread.
    // Returns:
    //   A future that completes when the transport has closed.
    //==========================================================================================================
    virtual std::future<void> Close() = 0;

    virtual bool IsConnected() const = 0;

    // Identifier used in logs ("stdio-1234", "ws-127.0.0.1:50312").
    virtual std::string GetSessionId() const = 0;

    /////////////////////////////////////////// Message sending ///////////////////////////////////////////
    //==========================================================================================================
    // Queues one payload for delivery; the transport adds its own framing.
    // Args:
    //   payload: A complete serialized JSON-RPC message.
    // Returns:
    //   false when the transport is closed or its write queue is full (the connection is then closed).
    //==========================================================================================================
    virtual bool SendMessage(const std::string& payload) = 0;

    /////////////////////////////////////////// Handlers ///////////////////////////////////////////
    // Invoked once per inbound payload, in arrival order, on the transport's reader thread.
    using MessageHandler = std::function<void(const std::string& payload)>;
    virtual void SetMessageHandler(MessageHandler handler) = 0;

    // Invoked for transport faults (framing errors, I/O errors) before the connection closes.
    using ErrorHandler = std::function<void(const std::string& error)>;
    virtual void SetErrorHandler(ErrorHandler handler) = 0;

    // Invoked exactly once when the connection goes down for any reason.
    using CloseHandler = std::function<void()>;
    virtual void SetCloseHandler(CloseHandler handler) = 0;

    // Invoked once when the peer stops sending while replies can still be delivered (stdin EOF). The
    // handler then owns calling Close(). Transports without a half-closed state ignore it, and a
    // transport with no handler registered closes itself.
    using InputEndedHandler = std::function<void()>;
    virtual void SetInputEndedHandler(InputEndedHandler handler) { (void)handler; }
};

//==========================================================================================================
// ITransportAcceptor
// Purpose: Server-side listener that produces one ITransport per accepted client.
// Notes:
//   - Implementations bind/listen in Start() and stop accepting and close live connections in Stop().
//   - The connection handler receives each new transport before it is started; it must register the
//     transport's handlers and call Start().
//==========================================================================================================
class ITransportAcceptor {
public:
    virtual ~ITransportAcceptor() = default;

    //==========================================================================================================
    // Starts the acceptor (binds/listens/spawns accept loop as needed).
    // Returns:
    //   Future that completes when the accept loop is running; holds an exception if binding failed.
    //==========================================================================================================
    virtual std::future<void> Start() = 0;

    virtual std::future<void> Stop() = 0;

    using ConnectionHandler = std::function<void(std::shared_ptr<ITransport>)>;
    virtual void SetConnectionHandler(ConnectionHandler handler) = 0;

    virtual void SetErrorHandler(ITransport::ErrorHandler handler) = 0;
};

} // namespace fileio
