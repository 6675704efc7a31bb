//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryTransport.hpp
// Purpose: In-memory transport for tests and embedding
//==========================================================================================================
#pragma once

#include "fileio/transport/Transport.h"
#include <memory>
#include <utility>

namespace fileio {

//==========================================================================================================
// InMemoryTransport
// Purpose: In-process transport used for tests and embedding. Payloads sent on one end of a pair are
//          delivered, in order, on the other end's processing thread. Closing one end closes the other
//          once everything sent before the close has been delivered.
//==========================================================================================================
class InMemoryTransport : public ITransport {
public:
    InMemoryTransport();
    ~InMemoryTransport() override;

    //==========================================================================================================
    // CreatePair
    // Purpose: Creates two paired transports wired to each other in-memory.
    // Returns:
    //   pair(left,right) where sending on one delivers to the other.
    //==========================================================================================================
    static std::pair<std::shared_ptr<InMemoryTransport>, std::shared_ptr<InMemoryTransport>> CreatePair();

    ////////////////////////////////////////// ITransport //////////////////////////////////////////
    std::future<void> Start() override;
    std::future<void> Close() override;
    bool IsConnected() const override;
    std::string GetSessionId() const override;
    bool SendMessage(const std::string& payload) override;

    void SetMessageHandler(MessageHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;
    void SetCloseHandler(CloseHandler handler) override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace fileio
