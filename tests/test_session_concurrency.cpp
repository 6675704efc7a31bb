//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_session_concurrency.cpp
// Purpose: Concurrent tools/call handling: one reply per id, duplicate ids, in-flight cap, tool policy
//==========================================================================================================

#include <gtest/gtest.h>

#include <map>
#include <string>

#include "TempDir.h"
#include "TestClient.h"

using namespace fileio;
using namespace fileio::test;

TEST(SessionConcurrency, EveryRequestIsAnsweredExactlyOnce) {
    TempDir dir;
    const std::string file = dir.write("a.txt", "one\ntwo\nthree\n");
    SessionOptions options;
    options.maxInFlight = 64;
    TestClient c(options);
    ASSERT_TRUE(c.handshake());

    const int kRequests = 40;
    for (int i = 1; i <= kRequests; ++i) {
        c.callTool(i, "fileio_count_lines", R"({"path":")" + file + "\"}");
    }
    ASSERT_TRUE(c.waitForCount(1 + kRequests, std::chrono::seconds(10)));

    std::map<int64_t, int> seen;
    for (const auto& reply : c.replies()) {
        seen[std::get<int64_t>(reply.find("id")->value)]++;
    }
    for (int i = 1; i <= kRequests; ++i) {
        EXPECT_EQ(seen[i], 1) << "id " << i;
        auto reply = c.waitFor(i);
        ASSERT_TRUE(reply.has_value());
        const auto& results = std::get<JSONValue::Array>(contentValue(*reply).value);
        ASSERT_EQ(results.size(), 1u);
        EXPECT_EQ(*results[0]->find("lines"), JSONValue(static_cast<int64_t>(3)));
    }
    EXPECT_EQ(c.session->InFlight(), 0u);
}

TEST(SessionConcurrency, DuplicateInFlightIdIsRejected) {
    TestClient c;
    ASSERT_TRUE(c.handshake());
    SessionTestHooks::markInFlight(*c.session, static_cast<int64_t>(5));

    c.request(5, "ping");
    auto dup = c.waitFor(5);
    ASSERT_TRUE(dup.has_value());
    EXPECT_EQ(errorCode(*dup), JSONRPCErrorCodes::InvalidRequest);
    EXPECT_EQ(errorMessage(*dup), "Duplicate request id: 5");

    // "5" and 5 are different ids
    c.send(R"({"jsonrpc":"2.0","id":"5","method":"ping"})");
    auto other = c.waitFor(JSONValue("5"));
    ASSERT_TRUE(other.has_value());
    EXPECT_EQ(errorCode(*other), 0);

    SessionTestHooks::clearInFlight(*c.session, static_cast<int64_t>(5));
}

TEST(SessionConcurrency, SaturatedSessionRepliesBusy) {
    SessionOptions options;
    options.maxInFlight = 1;
    TestClient c(options);
    ASSERT_TRUE(c.handshake());
    SessionTestHooks::markInFlight(*c.session, static_cast<int64_t>(999));

    c.callTool(1, "fileio_get_current_directory");
    auto busy = c.waitFor(1);
    ASSERT_TRUE(busy.has_value());
    EXPECT_EQ(errorCode(*busy), JSONRPCErrorCodes::ServerBusy);
    EXPECT_EQ(*busy->find("error")->find("data")->find("maxInFlight"), JSONValue(static_cast<int64_t>(1)));

    // Requests that do not run a tool are not counted
    c.request(2, "tools/list");
    auto listed = c.waitFor(2);
    ASSERT_TRUE(listed.has_value());
    EXPECT_EQ(errorCode(*listed), 0);

    SessionTestHooks::clearInFlight(*c.session, static_cast<int64_t>(999));
    c.callTool(3, "fileio_get_current_directory");
    auto ok = c.waitFor(3);
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ(errorCode(*ok), 0);
    EXPECT_FALSE(isErrorResult(*ok));
}

TEST(SessionConcurrency, DenyDangerousPolicyBlocksDestructiveTools) {
    TempDir dir;
    const std::string file = dir.write("keep.txt", "x");
    SessionOptions options;
    options.policy = MakeDenyDangerousPolicy();
    TestClient c(options);
    ASSERT_TRUE(c.handshake());

    c.callTool(1, "fileio_remove", R"({"path":")" + file + "\"}");
    auto denied = c.waitFor(1);
    ASSERT_TRUE(denied.has_value());
    EXPECT_EQ(errorCode(*denied), 0);
    EXPECT_TRUE(isErrorResult(*denied));
    const auto& content = std::get<JSONValue::Array>(result(*denied).find("content")->value);
    EXPECT_EQ(*content.at(0)->find("text"), JSONValue(POLICY_DENIED_MESSAGE));
    EXPECT_TRUE(dir.exists("keep.txt"));

    c.callTool(3, "fileio_write_file", R"({"path":")" + file + R"(","content":"clobbered"})");
    auto overwrite = c.waitFor(3);
    ASSERT_TRUE(overwrite.has_value());
    EXPECT_TRUE(isErrorResult(*overwrite));
    EXPECT_EQ(dir.read("keep.txt"), "x");

    c.callTool(2, "fileio_count_words", R"({"path":")" + file + "\"}");
    auto allowed = c.waitFor(2);
    ASSERT_TRUE(allowed.has_value());
    EXPECT_FALSE(isErrorResult(*allowed));
}

TEST(SessionConcurrency, ArgumentErrorsAndDomainErrors) {
    TempDir dir;
    TestClient c;
    ASSERT_TRUE(c.handshake());

    c.callTool(1, "fileio_read_lines", "{}");
    auto invalid = c.waitFor(1);
    ASSERT_TRUE(invalid.has_value());
    EXPECT_EQ(errorCode(*invalid), JSONRPCErrorCodes::InvalidParams);

    c.callTool(2, "fileio_read_lines", R"({"path":")" + dir.path("missing.txt") + "\"}");
    auto missing = c.waitFor(2);
    ASSERT_TRUE(missing.has_value());
    EXPECT_EQ(errorCode(*missing), 0);
    EXPECT_TRUE(isErrorResult(*missing));

    c.callTool(3, "fileio_count_lines", R"({"path":[")" + dir.path("missing.txt") + "\"]}");
    auto partial = c.waitFor(3);
    ASSERT_TRUE(partial.has_value());
    EXPECT_FALSE(isErrorResult(*partial));
    const auto& results = std::get<JSONValue::Array>(contentValue(*partial).value);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(*results[0]->find("status"), JSONValue("error: NotFound"));
    EXPECT_TRUE(results[0]->find("lines")->isNull());
}
