//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioTransport.cpp
// Purpose: stdio-based transport implementation
//==========================================================================================================

#include <unistd.h>
#include <fcntl.h>
#include <errno.h>
#include <cstring>
#include <sys/epoll.h>
#include <sys/eventfd.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <future>
#include <mutex>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include "logging/Logger.h"
#include "fileio/transport/StdioTransport.hpp"

namespace fileio {

class StdioTransport::Impl {
public:
    int inFd;
    int outFd;
    std::atomic<bool> connected{false};
    std::atomic<bool> readerExited{false};
    std::atomic<bool> closeNotified{false};
    std::string sessionId;
    ITransport::MessageHandler messageHandler;
    ITransport::ErrorHandler errorHandler;
    ITransport::CloseHandler closeHandler;
    ITransport::InputEndedHandler inputEndedHandler;
    bool inputEof{false};  // reader thread only
    std::unique_ptr<AutoDetectFramer> framer;
    std::thread readerThread;
    std::thread writerThread;

    int wakeEventFd{-1};

    // Write queue/backpressure
    std::mutex writeMutex; // protects writeQueue, queuedBytes, stopWriter
    std::condition_variable cvWrite;
    std::deque<std::string> writeQueue;
    std::size_t queuedBytes{0};
    std::size_t writeQueueMaxBytes{8 * 1024 * 1024};
    std::chrono::milliseconds writeTimeout{0}; // 0 = disabled
    bool stopWriter{false};
    std::atomic<bool> abortWriter{false};

    Impl(int in, int out, std::size_t maxMessageBytes)
        : inFd(in), outFd(out), framer(MakeAutoDetectFramer(maxMessageBytes)) {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(1000, 9999);
        sessionId = "stdio-" + std::to_string(dis(gen));

        wakeEventFd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
        if (wakeEventFd < 0) {
            LOG_ERROR("StdioTransport: failed to create eventfd (errno={} msg={})", errno, ::strerror(errno));
        }
    }

    ~Impl() {
        if (wakeEventFd >= 0) { ::close(wakeEventFd); wakeEventFd = -1; }
    }

    void reportError(const std::string& msg) {
        if (errorHandler) {
            errorHandler(msg);
        }
    }

    void wake() {
        if (wakeEventFd < 0) {
            return;
        }
        uint64_t one = 1;
        ssize_t wr;
        do {
            wr = ::write(wakeEventFd, &one, sizeof(one));
        } while (wr < 0 && errno == EINTR);
        if (wr < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
            LOG_WARN("StdioTransport: eventfd write failed (errno={} msg={})", errno, ::strerror(errno));
        }
    }

    // Marks the connection down and fires the close handler once.
    void markClosed(const char* reason) {
        connected = false;
        wake();
        cvWrite.notify_all();
        if (!closeNotified.exchange(true)) {
            LOG_INFO("StdioTransport {} closed: {}", sessionId, reason);
            if (closeHandler) {
                closeHandler();
            }
        }
    }

    bool enqueueFrame(const std::string& payload) {
        std::string frame = framer->encode(payload);
        {
            std::unique_lock<std::mutex> lk(writeMutex);
            if (queuedBytes + frame.size() > writeQueueMaxBytes) {
                lk.unlock();
                LOG_ERROR("StdioTransport: write queue overflow (queued={} add={} max={})", queuedBytes, frame.size(), writeQueueMaxBytes);
                reportError("StdioTransport: write queue overflow");
                markClosed("write queue overflow");
                return false;
            }
            queuedBytes += frame.size();
            writeQueue.emplace_back(std::move(frame));
        }
        cvWrite.notify_one();
        return true;
    }

    // De-frames as many complete payloads as buffer holds and delivers them. Returns false on a framing
    // error; the offending bytes are dropped without a reply.
    bool drain(std::string& buffer) {
        while (connected) {
            auto result = framer->tryDecodeEx(buffer);
            if (result.bytesConsumed > 0) {
                buffer.erase(0, result.bytesConsumed);
            }
            switch (result.status) {
                case IContentFramer::DecodeStatus::Ok:
                    LOG_DEBUG("Received message: {}", *result.payload);
                    if (messageHandler) {
                        messageHandler(*result.payload);
                    }
                    continue;
                case IContentFramer::DecodeStatus::Incomplete:
                    return true;
                default:
                    LOG_ERROR("StdioTransport: framing error ({}) with {} framing", DecodeStatusName(result.status),
                              FramingDisciplineName(framer->discipline()));
                    reportError(std::string("StdioTransport: framing error: ") + DecodeStatusName(result.status));
                    markClosed("framing error");
                    return false;
            }
        }
        return true;
    }

    // Reads whatever is available; returns false once the stream is finished.
    bool readAvailable(std::string& buffer) {
        std::vector<char> tmp(64 * 1024);
        for (;;) {
            ssize_t n = ::read(inFd, tmp.data(), tmp.size());
            if (n > 0) {
                buffer.append(tmp.data(), tmp.data() + n);
                continue;
            }
            if (n == 0) {
                inputEof = true;
                return false;
            }
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                return true;
            }
            LOG_ERROR("StdioTransport: read error (errno={} msg={})", errno, ::strerror(errno));
            reportError("StdioTransport: read error");
            return false;
        }
    }

    void startReader() {
        readerThread = std::thread([this]() {
            constexpr int waitTimeoutMs = 100;
            std::string buffer;
            const char* reason = "stopped";

            int flags = ::fcntl(inFd, F_GETFL, 0);
            if (flags >= 0) { (void)::fcntl(inFd, F_SETFL, flags | O_NONBLOCK); }

            int ep = ::epoll_create1(EPOLL_CLOEXEC);
            bool pollable = false;
            if (ep >= 0) {
                epoll_event evIn{}; evIn.events = EPOLLIN | EPOLLRDHUP; evIn.data.fd = inFd;
                // Regular files cannot be registered (EPERM); they never block, so plain reads suffice
                pollable = ::epoll_ctl(ep, EPOLL_CTL_ADD, inFd, &evIn) == 0;
                if (wakeEventFd >= 0) {
                    epoll_event evWake{}; evWake.events = EPOLLIN; evWake.data.fd = wakeEventFd;
                    (void)::epoll_ctl(ep, EPOLL_CTL_ADD, wakeEventFd, &evWake);
                }
            }

            while (connected) {
                if (pollable) {
                    epoll_event events[2];
                    int rc = ::epoll_wait(ep, events, 2, waitTimeoutMs);
                    if (rc < 0) {
                        if (errno == EINTR) {
                            continue;
                        }
                        LOG_ERROR("StdioTransport: epoll_wait failed (errno={} msg={})", errno, ::strerror(errno));
                        reportError("StdioTransport: epoll_wait failed");
                        reason = "epoll failure";
                        break;
                    }
                    bool inputReady = false;
                    for (int i = 0; i < rc; ++i) {
                        if (events[i].data.fd == inFd) {
                            inputReady = true;
                        } else {
                            uint64_t v = 0;
                            ssize_t r;
                            do {
                                r = ::read(wakeEventFd, &v, sizeof(v));
                            } while (r < 0 && errno == EINTR);
                        }
                    }
                    if (!inputReady) {
                        continue;
                    }
                }
                const bool open = readAvailable(buffer);
                if (!drain(buffer)) {
                    reason = "framing error";
                    break;
                }
                if (!open) {
                    // Complete frames were delivered by drain(); whatever remains is a truncated one
                    if (inputEof && framing::skipStreamWhitespace(buffer, 0) < buffer.size()) {
                        LOG_WARN("StdioTransport: EOF inside a frame ({} bytes pending)", buffer.size());
                    } else if (inputEof) {
                        LOG_INFO("StdioTransport: EOF on input");
                    }
                    reason = inputEof ? "end of input" : "read error";
                    break;
                }
            }
            if (ep >= 0) {
                ::close(ep);
            }
            readerExited.store(true);
            if (inputEof && connected && inputEndedHandler) {
                LOG_INFO("StdioTransport {}: input ended; replies stay open until close", sessionId);
                inputEndedHandler();
                return;
            }
            markClosed(reason);
        });
    }

    void startWriter() {
        writerThread = std::thread([this]() {
            int flags = ::fcntl(outFd, F_GETFL, 0);
            if (flags >= 0) { (void)::fcntl(outFd, F_SETFL, flags | O_NONBLOCK); }
            for (;;) {
                std::string frame;
                {
                    std::unique_lock<std::mutex> lk(writeMutex);
                    cvWrite.wait(lk, [&]{ return stopWriter || !writeQueue.empty() || abortWriter.load(); });
                    if (abortWriter.load() || (stopWriter && writeQueue.empty())) {
                        break;
                    }
                    frame = std::move(writeQueue.front());
                    writeQueue.pop_front();
                }
                if (!writeFrame(frame)) {
                    markClosed("write failure");
                    break;
                }
                {
                    std::lock_guard<std::mutex> lk(writeMutex);
                    queuedBytes = (queuedBytes >= frame.size()) ? queuedBytes - frame.size() : 0;
                }
            }
        });
    }

    bool writeFrame(const std::string& frame) {
        std::size_t total = 0;
        auto start = std::chrono::steady_clock::now();
        while (total < frame.size()) {
            if (abortWriter.load()) {
                return false;
            }
            ssize_t w = ::write(outFd, frame.data() + total, frame.size() - total);
            if (w > 0) {
                total += static_cast<std::size_t>(w);
            } else if (w < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                if (writeTimeout.count() > 0 && (std::chrono::steady_clock::now() - start) >= writeTimeout) {
                    LOG_ERROR("StdioTransport: write timeout ({} ms)", static_cast<long long>(writeTimeout.count()));
                    reportError("StdioTransport: write timeout");
                    return false;
                }
                // Back off a bit
                std::this_thread::sleep_for(std::chrono::milliseconds(2));
            } else if (w < 0 && errno == EINTR) {
                continue;
            } else if (w == 0) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            } else {
                LOG_ERROR("StdioTransport: write error (errno={} msg={})", errno, ::strerror(errno));
                reportError("StdioTransport: write error");
                return false;
            }
        }
        return true;
    }

    void joinUnlessSelf(std::thread& t) {
        if (!t.joinable()) {
            return;
        }
        if (t.get_id() == std::this_thread::get_id()) {
            // Close() issued from a handler on this very thread; it exits on its own
            t.detach();
            return;
        }
        t.join();
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lk(writeMutex);
            stopWriter = true;
        }
        cvWrite.notify_all();

        // Give queued replies a bounded window to reach the peer
        if (writerThread.joinable() && writerThread.get_id() != std::this_thread::get_id()) {
            auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
            for (;;) {
                {
                    std::lock_guard<std::mutex> lk(writeMutex);
                    if (writeQueue.empty()) break;
                }
                if (std::chrono::steady_clock::now() >= deadline) {
                    LOG_WARN("StdioTransport: dropping {} queued bytes on close", queuedBytes);
                    abortWriter = true;
                    cvWrite.notify_all();
                    break;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
            }
        }
        joinUnlessSelf(writerThread);
        connected = false;
        wake();
        joinUnlessSelf(readerThread);
        markClosed("closed locally");
    }
};

StdioTransport::StdioTransport(int inFd, int outFd, std::size_t maxMessageBytes)
    : pImpl(std::make_unique<Impl>(inFd, outFd, maxMessageBytes)) { FUNC_SCOPE(); }

StdioTransport::~StdioTransport() {
    FUNC_SCOPE();
    pImpl->stop();
}

std::future<void> StdioTransport::Start() {
    FUNC_SCOPE();
    LOG_INFO("Starting StdioTransport {} (in fd={}, out fd={})", pImpl->sessionId, pImpl->inFd, pImpl->outFd);
    pImpl->connected = true;
    pImpl->startWriter();
    pImpl->startReader();
    std::promise<void> promise; promise.set_value(); return promise.get_future();
}

std::future<void> StdioTransport::Close() {
    FUNC_SCOPE();
    LOG_INFO("Closing StdioTransport {}", pImpl->sessionId);
    pImpl->stop();
    std::promise<void> promise; promise.set_value(); return promise.get_future();
}

bool StdioTransport::IsConnected() const {
    return pImpl->connected;
}

std::string StdioTransport::GetSessionId() const {
    return pImpl->sessionId;
}

bool StdioTransport::SendMessage(const std::string& payload) {
    FUNC_SCOPE();
    if (!pImpl->connected) {
        LOG_WARN("StdioTransport: not connected; dropping outbound message");
        return false;
    }
    LOG_DEBUG("Sending message: {}", payload);
    return pImpl->enqueueFrame(payload);
}

void StdioTransport::SetMessageHandler(MessageHandler handler) {
    pImpl->messageHandler = std::move(handler);
}

void StdioTransport::SetErrorHandler(ErrorHandler handler) {
    pImpl->errorHandler = std::move(handler);
}

void StdioTransport::SetCloseHandler(CloseHandler handler) {
    pImpl->closeHandler = std::move(handler);
}

void StdioTransport::SetInputEndedHandler(InputEndedHandler handler) {
    pImpl->inputEndedHandler = std::move(handler);
}

void StdioTransport::SetWriteQueueMaxBytes(std::size_t maxBytes) {
    std::lock_guard<std::mutex> lk(pImpl->writeMutex);
    pImpl->writeQueueMaxBytes = maxBytes;
}

void StdioTransport::SetWriteTimeoutMs(uint64_t timeoutMs) {
    pImpl->writeTimeout = std::chrono::milliseconds(timeoutMs);
}

FramingDiscipline StdioTransport::Discipline() const {
    return pImpl->framer->discipline();
}

bool StdioTransportTestHooks::drainFrames(StdioTransport& t, std::string& buffer) {
    return t.pImpl->drain(buffer);
}

void StdioTransportTestHooks::setConnected(StdioTransport& t, bool v) {
    t.pImpl->connected = v;
}

bool StdioTransportTestHooks::isConnected(const StdioTransport& t) {
    return t.pImpl->connected.load();
}

} // namespace fileio
