//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: TestClient.h
// Purpose: In-memory client end for session tests; collects parsed replies and waits on ids
//==========================================================================================================

#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "fileio/JSONRPCTypes.h"
#include "fileio/Session.h"
#include "fileio/transport/InMemoryTransport.hpp"

namespace fileio::test {

class TestClient {
public:
    explicit TestClient(SessionOptions options = {}, const ToolRegistry& registry = ToolRegistry::Default()) {
        auto pair = InMemoryTransport::CreatePair();
        client = pair.first;
        client->SetMessageHandler([this](const std::string& payload) {
            std::lock_guard<std::mutex> lk(mtx);
            received.push_back(parseJSON(payload));
            cv.notify_all();
        });
        client->Start().get();
        session = Session::Create(pair.second, registry, std::move(options));
        session->Start();
    }

    ~TestClient() {
        session->Close();
        client->Close().get();
    }

    void send(const std::string& payload) { client->SendMessage(payload); }

    void request(int64_t id, const std::string& method, const std::string& params = std::string()) {
        std::string msg = R"({"jsonrpc":"2.0","id":)" + std::to_string(id) + R"(,"method":")" + method + "\"";
        if (!params.empty()) {
            msg += R"(,"params":)" + params;
        }
        send(msg + "}");
    }

    void notify(const std::string& method) {
        send(R"({"jsonrpc":"2.0","method":")" + method + "\"}");
    }

    void callTool(int64_t id, const std::string& name, const std::string& arguments = "{}") {
        request(id, "tools/call", R"({"name":")" + name + R"(","arguments":)" + arguments + "}");
    }

    // Reply whose id equals id, waiting up to timeout.
    std::optional<JSONValue> waitFor(const JSONValue& id, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock<std::mutex> lk(mtx);
        std::optional<JSONValue> found;
        cv.wait_for(lk, timeout, [&]() {
            for (const auto& msg : received) {
                const JSONValue* v = msg.find("id");
                if (v && *v == id) {
                    found = msg;
                    return true;
                }
            }
            return false;
        });
        return found;
    }

    std::optional<JSONValue> waitFor(int64_t id, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        return waitFor(JSONValue(id), timeout);
    }

    // Blocks until count replies have arrived in total.
    bool waitForCount(std::size_t count, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock<std::mutex> lk(mtx);
        return cv.wait_for(lk, timeout, [&]() { return received.size() >= count; });
    }

    std::vector<JSONValue> replies() {
        std::lock_guard<std::mutex> lk(mtx);
        return received;
    }

    // initialize + notifications/initialized; returns once the session is Ready.
    bool handshake(const std::string& version = "2024-11-05") {
        request(0, "initialize", R"({"protocolVersion":")" + version + R"(","capabilities":{}})");
        if (!waitFor(0)) {
            return false;
        }
        notify("notifications/initialized");
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (session->State() != SessionState::Ready && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return session->State() == SessionState::Ready;
    }

    std::shared_ptr<InMemoryTransport> client;
    std::shared_ptr<Session> session;

private:
    std::mutex mtx;
    std::condition_variable cv;
    std::vector<JSONValue> received;
};

// error.code of a reply, or 0 when it is not an error.
inline int64_t errorCode(const JSONValue& reply) {
    const JSONValue* err = reply.find("error");
    if (!err) return 0;
    return std::get<int64_t>(err->find("code")->value);
}

inline std::string errorMessage(const JSONValue& reply) {
    return std::get<std::string>(reply.find("error")->find("message")->value);
}

inline const JSONValue& result(const JSONValue& reply) {
    return *reply.find("result");
}

// First content item's JSON value of a tools/call result.
inline const JSONValue& contentValue(const JSONValue& reply) {
    const auto& content = std::get<JSONValue::Array>(result(reply).find("content")->value);
    return *content.at(0)->find("value");
}

inline bool isErrorResult(const JSONValue& reply) {
    const JSONValue* v = result(reply).find("isError");
    return v && std::get<bool>(v->value);
}

} // namespace fileio::test
