//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryTransport.cpp
// Purpose: In-memory transport implementation
//==========================================================================================================

#include <atomic>
#include <condition_variable>
#include <future>
#include <mutex>
#include <optional>
#include <queue>
#include <random>
#include <stop_token>
#include <string>
#include <thread>

#include "logging/Logger.h"
#include "fileio/transport/InMemoryTransport.hpp"

namespace fileio {

namespace {
// Shared between the two ends so either may outlive the other.
struct Link {
    std::mutex mutex;
    void* ends[2]{nullptr, nullptr};
};
} // namespace

class InMemoryTransport::Impl {
public:
    std::atomic<bool> connected{false};
    std::atomic<bool> closeNotified{false};
    std::string sessionId;
    ITransport::MessageHandler messageHandler;
    ITransport::ErrorHandler errorHandler;
    ITransport::CloseHandler closeHandler;

    std::shared_ptr<Link> link;
    int side{0};

    // std::nullopt marks the peer's close
    std::queue<std::optional<std::string>> messageQueue;
    std::mutex queueMutex;
    std::condition_variable queueCondition;
    std::jthread processingThread;

    Impl() {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(1000, 9999);
        sessionId = "memory-" + std::to_string(dis(gen));
    }

    ~Impl() {
        detach();
        connected = false;
        queueCondition.notify_all();
        if (processingThread.joinable()) {
            processingThread.request_stop();
            if (processingThread.get_id() == std::this_thread::get_id()) {
                processingThread.detach();
            } else {
                processingThread.join();
            }
        }
    }

    void detach() {
        if (!link) {
            return;
        }
        std::lock_guard<std::mutex> lock(link->mutex);
        link->ends[side] = nullptr;
    }

    void startProcessing() {
        processingThread = std::jthread([this](std::stop_token st) {
            std::unique_lock<std::mutex> lock(queueMutex);
            while (!st.stop_requested()) {
                queueCondition.wait(lock, [this, &st]() { return !messageQueue.empty() || !connected || st.stop_requested(); });
                if (!connected || st.stop_requested()) {
                    break;
                }
                auto item = std::move(messageQueue.front());
                messageQueue.pop();
                lock.unlock();
                if (!item) {
                    LOG_DEBUG("InMemoryTransport {}: peer closed", sessionId);
                    connected = false;
                    markClosed();
                    return;
                }
                LOG_DEBUG("Processing in-memory message: {}", *item);
                if (messageHandler) {
                    messageHandler(*item);
                }
                lock.lock();
            }
        });
    }

    void enqueue(std::optional<std::string> message) {
        {
            std::lock_guard<std::mutex> lock(queueMutex);
            messageQueue.push(std::move(message));
        }
        queueCondition.notify_one();
    }

    bool sendToPeer(std::optional<std::string> message) {
        if (!link) {
            return false;
        }
        std::lock_guard<std::mutex> lock(link->mutex);
        auto* peer = static_cast<Impl*>(link->ends[1 - side]);
        if (!peer || !peer->connected.load()) {
            return false;
        }
        peer->enqueue(std::move(message));
        return true;
    }

    void markClosed() {
        if (!closeNotified.exchange(true)) {
            LOG_INFO("InMemoryTransport {} closed", sessionId);
            if (closeHandler) {
                closeHandler();
            }
        }
    }
};

InMemoryTransport::InMemoryTransport() : pImpl(std::make_unique<Impl>()) { FUNC_SCOPE(); }

InMemoryTransport::~InMemoryTransport() {
    FUNC_SCOPE();
    (void)pImpl->sendToPeer(std::nullopt);
}

std::pair<std::shared_ptr<InMemoryTransport>, std::shared_ptr<InMemoryTransport>> InMemoryTransport::CreatePair() {
    FUNC_SCOPE();
    auto transport1 = std::make_shared<InMemoryTransport>();
    auto transport2 = std::make_shared<InMemoryTransport>();
    auto link = std::make_shared<Link>();
    link->ends[0] = transport1->pImpl.get();
    link->ends[1] = transport2->pImpl.get();
    transport1->pImpl->link = link;
    transport1->pImpl->side = 0;
    transport2->pImpl->link = link;
    transport2->pImpl->side = 1;
    return std::make_pair(std::move(transport1), std::move(transport2));
}

std::future<void> InMemoryTransport::Start() {
    FUNC_SCOPE();
    LOG_INFO("Starting InMemoryTransport {}", pImpl->sessionId);
    pImpl->connected = true;
    pImpl->startProcessing();
    std::promise<void> promise; promise.set_value(); return promise.get_future();
}

std::future<void> InMemoryTransport::Close() {
    FUNC_SCOPE();
    LOG_INFO("Closing InMemoryTransport {}", pImpl->sessionId);
    // Everything already sent is queued at the peer ahead of the close marker
    (void)pImpl->sendToPeer(std::nullopt);
    pImpl->connected = false;
    pImpl->queueCondition.notify_all();
    if (pImpl->processingThread.joinable() && pImpl->processingThread.get_id() != std::this_thread::get_id()) {
        pImpl->processingThread.request_stop();
        pImpl->processingThread.join();
    }
    pImpl->markClosed();
    std::promise<void> promise; promise.set_value(); return promise.get_future();
}

bool InMemoryTransport::IsConnected() const { return pImpl->connected; }
std::string InMemoryTransport::GetSessionId() const { return pImpl->sessionId; }

bool InMemoryTransport::SendMessage(const std::string& payload) {
    FUNC_SCOPE();
    if (!pImpl->connected) {
        LOG_WARN("InMemoryTransport: not connected; dropping message");
        return false;
    }
    LOG_DEBUG("Sending in-memory message: {}", payload);
    if (!pImpl->sendToPeer(payload)) {
        LOG_WARN("InMemoryTransport: peer not connected; dropping message");
        if (pImpl->errorHandler) {
            pImpl->errorHandler("Peer not connected");
        }
        return false;
    }
    return true;
}

void InMemoryTransport::SetMessageHandler(MessageHandler handler) {
    pImpl->messageHandler = std::move(handler);
}

void InMemoryTransport::SetErrorHandler(ErrorHandler handler) {
    pImpl->errorHandler = std::move(handler);
}

void InMemoryTransport::SetCloseHandler(CloseHandler handler) {
    pImpl->closeHandler = std::move(handler);
}

} // namespace fileio
