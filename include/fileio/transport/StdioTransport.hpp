//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioTransport.hpp
// Purpose: Byte-stream transport over a pair of file descriptors (stdin/stdout by default)
//==========================================================================================================
#pragma once

#include "fileio/transport/Transport.h"
#include "fileio/ContentFramer.h"
#include <memory>
#include <cstdint>
#include <unistd.h>

namespace fileio {

//==========================================================================================================
// StdioTransport
// Purpose: Reads from inFd through an AutoDetectFramer and writes framed replies to outFd from a
//          dedicated writer thread with a bounded queue. A read error or any framing error closes the
//          connection. EOF on inFd closes it too unless an InputEndedHandler is registered, in which case
//          writes stay open until Close().
//==========================================================================================================
class StdioTransport : public ITransport {
public:
    explicit StdioTransport(int inFd = STDIN_FILENO, int outFd = STDOUT_FILENO,
                            std::size_t maxMessageBytes = 4 * 1024 * 1024);
    ~StdioTransport() override;

    ////////////////////////////////////////// ITransport //////////////////////////////////////////
    std::future<void> Start() override;
    std::future<void> Close() override;
    bool IsConnected() const override;
    std::string GetSessionId() const override;
    bool SendMessage(const std::string& payload) override;

    void SetMessageHandler(MessageHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;
    void SetCloseHandler(CloseHandler handler) override;
    void SetInputEndedHandler(InputEndedHandler handler) override;

    //==========================================================================================================
    // SetWriteQueueMaxBytes
    // Purpose: Backpressure clamp for pending write buffers.
    // Args:
    //   maxBytes: Maximum allowed bytes in write queue before emitting an error and closing.
    //==========================================================================================================
    void SetWriteQueueMaxBytes(std::size_t maxBytes);

    //==========================================================================================================
    // SetWriteTimeoutMs
    // Purpose: Per-frame write timeout.
    // Args:
    //   timeoutMs: Milliseconds to allow for writing a frame before error/close (0 disables).
    //==========================================================================================================
    void SetWriteTimeoutMs(uint64_t timeoutMs);

    // Framing committed on this connection so far.
    FramingDiscipline Discipline() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
    friend struct StdioTransportTestHooks;
};

struct StdioTransportTestHooks {
    // Runs the reader's de-framing step over buffer; returns false on a framing error.
    static bool drainFrames(StdioTransport& t, std::string& buffer);
    static void setConnected(StdioTransport& t, bool v);
    static bool isConnected(const StdioTransport& t);
};

} // namespace fileio
