//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Session.h
// Purpose: Per-connection protocol session: lifecycle state machine, request routing, and concurrent
//          tool dispatch
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "fileio/ToolPolicy.h"
#include "fileio/ToolRegistry.h"
#include "fileio/transport/Transport.h"

namespace fileio {

//==========================================================================================================
// SessionState
// Purpose: Lifecycle of one connection. Transitions only move forward:
//   Uninitialized -> Initializing  on a successful initialize request
//   Initializing  -> Ready         on the initialized notification
//   Ready         -> ShuttingDown  on a shutdown request
//   any           -> Closed        when the transport goes down
//==========================================================================================================
enum class SessionState {
    Uninitialized,
    Initializing,
    Ready,
    ShuttingDown,
    Closed
};

const char* SessionStateName(SessionState state);

//==========================================================================================================
// SessionOptions
// Fields:
//   maxInFlight: Cap on concurrently running tool invocations; further calls get ServerBusy.
//   shutdownTimeout: How long shutdown waits for in-flight invocations before acknowledging anyway.
//   policy: Consulted before each tool invocation; null allows everything.
//==========================================================================================================
struct SessionOptions {
    std::size_t maxInFlight{16};
    std::chrono::milliseconds shutdownTimeout{10000};
    std::shared_ptr<IToolPolicy> policy;
};

//==========================================================================================================
// Session
// Purpose: Owns one transport and answers every request it delivers with exactly one correlated
//          response. tools/call invocations run on their own threads so a slow handler never blocks the
//          reader; everything else is answered inline.
// Notes:
//   - The registry must outlive the session.
//   - Handlers registered on the transport hold only a weak reference to the session.
//==========================================================================================================
class Session : public std::enable_shared_from_this<Session> {
public:
    static std::shared_ptr<Session> Create(std::shared_ptr<ITransport> transport,
                                           const ToolRegistry& registry,
                                           SessionOptions options = {});
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // Registers the transport handlers and starts the transport.
    void Start();

    // Closes the transport. Invocations still running complete but their replies are dropped.
    void Close();

    // Invoked once when the session reaches Closed. Set before Start().
    void SetClosedHandler(std::function<void()> handler);

    // Processes one de-framed payload exactly as if the transport had delivered it.
    void HandlePayload(const std::string& payload);

    SessionState State() const;
    std::optional<std::string> NegotiatedVersion() const;
    std::size_t InFlight() const;
    std::string Id() const;

    // Blocks until the session is Closed or timeout elapses. Returns true when closed.
    bool WaitUntilClosed(std::chrono::milliseconds timeout) const;

private:
    Session(std::shared_ptr<ITransport> transport, const ToolRegistry& registry, SessionOptions options);

    class Impl;
    std::unique_ptr<Impl> pImpl;
    friend struct SessionTestHooks;
};

struct SessionTestHooks {
    // Occupies or frees an in-flight slot as a running invocation would.
    static void markInFlight(Session& s, const JSONRPCId& id);
    static void clearInFlight(Session& s, const JSONRPCId& id);
};

} // namespace fileio
