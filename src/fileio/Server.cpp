//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Server.cpp
// Purpose: Session ownership and transport wiring
//==========================================================================================================

#include <chrono>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "logging/Logger.h"
#include "fileio/Server.h"
#include "fileio/ToolPolicy.h"

namespace fileio {

SessionOptions SessionOptionsFromConfig(const ServerConfig& config) {
    SessionOptions options;
    options.maxInFlight = config.maxInFlight;
    options.shutdownTimeout = config.shutdownTimeout;
    options.policy = config.denyDangerous ? MakeDenyDangerousPolicy() : MakeAllowAllPolicy();
    return options;
}

class Server::Impl {
public:
    const ToolRegistry& registry;
    SessionOptions options;

    // Declared before sessions so that sessions are released first.
    std::shared_ptr<ITransportAcceptor> acceptor;

    mutable std::mutex sessionsMutex;
    std::unordered_map<Session*, std::shared_ptr<Session>> sessions;
    std::function<void(const std::string&)> closedHandler;

    Impl(const ToolRegistry& r, SessionOptions o) : registry(r), options(std::move(o)) {}

    void release(Session* session) {
        std::shared_ptr<Session> keep;
        std::function<void(const std::string&)> handler;
        {
            std::lock_guard<std::mutex> lk(sessionsMutex);
            auto it = sessions.find(session);
            if (it == sessions.end()) {
                return;
            }
            keep = std::move(it->second);
            sessions.erase(it);
            handler = closedHandler;
        }
        LOG_INFO("Session {} released", keep->Id());
        if (handler) {
            handler(keep->Id());
        }
    }
};

Server::Server(const ToolRegistry& registry, SessionOptions options)
    : pImpl(std::make_unique<Impl>(registry, std::move(options))) {}

Server::~Server() {
    Stop();
}

std::shared_ptr<Session> Server::Attach(std::shared_ptr<ITransport> transport) {
    FUNC_SCOPE();
    auto session = Session::Create(std::move(transport), pImpl->registry, pImpl->options);
    Session* key = session.get();
    {
        std::lock_guard<std::mutex> lk(pImpl->sessionsMutex);
        pImpl->sessions.emplace(key, session);
    }
    Impl* impl = pImpl.get();
    session->SetClosedHandler([impl, key]() { impl->release(key); });
    session->Start();
    return session;
}

void Server::Listen(std::shared_ptr<ITransportAcceptor> acceptor) {
    FUNC_SCOPE();
    pImpl->acceptor = std::move(acceptor);
    pImpl->acceptor->SetConnectionHandler([this](std::shared_ptr<ITransport> transport) {
        LOG_INFO("Accepted connection {}", transport->GetSessionId());
        (void)Attach(std::move(transport));
    });
    pImpl->acceptor->SetErrorHandler([](const std::string& error) {
        LOG_WARN("Acceptor error: {}", error);
    });
    pImpl->acceptor->Start().get();
}

void Server::Stop() {
    FUNC_SCOPE();
    std::vector<std::shared_ptr<Session>> live;
    {
        std::lock_guard<std::mutex> lk(pImpl->sessionsMutex);
        for (auto& [key, session] : pImpl->sessions) {
            live.push_back(session);
        }
    }
    for (auto& session : live) {
        session->Close();
    }
    for (auto& session : live) {
        if (!session->WaitUntilClosed(std::chrono::seconds(2))) {
            LOG_WARN("Session {} did not close in time", session->Id());
        }
    }
    if (pImpl->acceptor) {
        pImpl->acceptor->Stop().get();
    }
    live.clear();
    {
        std::lock_guard<std::mutex> lk(pImpl->sessionsMutex);
        pImpl->sessions.clear();
    }
    // Connections may reference the acceptor's I/O context; it goes last
    pImpl->acceptor.reset();
}

std::size_t Server::SessionCount() const {
    std::lock_guard<std::mutex> lk(pImpl->sessionsMutex);
    return pImpl->sessions.size();
}

void Server::SetSessionClosedHandler(std::function<void(const std::string&)> handler) {
    std::lock_guard<std::mutex> lk(pImpl->sessionsMutex);
    pImpl->closedHandler = std::move(handler);
}

} // namespace fileio
