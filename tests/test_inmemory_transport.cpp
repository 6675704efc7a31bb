//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_inmemory_transport.cpp
// Purpose: InMemoryTransport basic tests
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <vector>

#include "fileio/transport/InMemoryTransport.hpp"

using namespace fileio;

TEST(InMemoryTransport, DeliversPayloadsInOrder) {
    std::mutex m;
    std::condition_variable cv;
    std::vector<std::string> received;

    auto pair = InMemoryTransport::CreatePair();
    auto client = std::move(pair.first);
    auto server = std::move(pair.second);
    server->SetMessageHandler([&](const std::string& payload){
        std::lock_guard<std::mutex> lk(m);
        received.push_back(payload);
        cv.notify_all();
    });
    client->Start().get();
    server->Start().get();

    for (int i = 0; i < 50; ++i) {
        ASSERT_TRUE(client->SendMessage("{\"n\":" + std::to_string(i) + "}"));
    }

    {
        std::unique_lock<std::mutex> lk(m);
        ASSERT_TRUE(cv.wait_for(lk, std::chrono::seconds(2), [&]{ return received.size() == 50; }));
    }
    for (int i = 0; i < 50; ++i) {
        EXPECT_EQ(received[i], "{\"n\":" + std::to_string(i) + "}");
    }

    client->Close().get();
    server->Close().get();
}

TEST(InMemoryTransport, RepliesFlowBothWays) {
    std::mutex m;
    std::condition_variable cv;
    std::string reply;

    auto pair = InMemoryTransport::CreatePair();
    auto client = pair.first;
    auto server = pair.second;
    InMemoryTransport* serverRaw = server.get();
    server->SetMessageHandler([serverRaw](const std::string& payload){ serverRaw->SendMessage("echo:" + payload); });
    client->SetMessageHandler([&](const std::string& payload){
        std::lock_guard<std::mutex> lk(m);
        reply = payload;
        cv.notify_all();
    });
    client->Start().get();
    server->Start().get();

    ASSERT_TRUE(client->SendMessage("hello"));
    std::unique_lock<std::mutex> lk(m);
    ASSERT_TRUE(cv.wait_for(lk, std::chrono::seconds(2), [&]{ return !reply.empty(); }));
    EXPECT_EQ(reply, "echo:hello");
    lk.unlock();

    client->Close().get();
    server->Close().get();
}

TEST(InMemoryTransport, PeerCloseFiresCloseHandler) {
    std::mutex m;
    std::condition_variable cv;
    bool closed = false;

    auto pair = InMemoryTransport::CreatePair();
    auto client = pair.first;
    auto server = pair.second;
    server->SetCloseHandler([&](){
        std::lock_guard<std::mutex> lk(m);
        closed = true;
        cv.notify_all();
    });
    client->Start().get();
    server->Start().get();

    client->Close().get();
    {
        std::unique_lock<std::mutex> lk(m);
        ASSERT_TRUE(cv.wait_for(lk, std::chrono::seconds(2), [&]{ return closed; }));
    }
    EXPECT_FALSE(server->IsConnected());
    server->Close().get();
}

TEST(InMemoryTransport, ErrorWhenPeerDisconnected) {
    std::atomic<bool> errored{false};

    auto pair = InMemoryTransport::CreatePair();
    auto client = pair.first;
    auto server = pair.second;
    client->SetErrorHandler([&](const std::string&){ errored = true; });
    client->Start().get();
    // The server end is never started

    EXPECT_FALSE(client->SendMessage("{}"));
    EXPECT_TRUE(errored.load());

    client->Close().get();
}

TEST(InMemoryTransport, SendAfterCloseFails) {
    auto pair = InMemoryTransport::CreatePair();
    pair.first->Start().get();
    pair.second->Start().get();
    pair.first->Close().get();
    EXPECT_FALSE(pair.first->IsConnected());
    EXPECT_FALSE(pair.first->SendMessage("{}"));
    EXPECT_FALSE(pair.first->GetSessionId().empty());
    pair.second->Close().get();
}
