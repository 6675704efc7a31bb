//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_stdio_drainframes.cpp
// Purpose: StdioTransport de-framing tests (framing errors, oversize bodies, partial frames)
//==========================================================================================================

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "fileio/transport/StdioTransport.hpp"

using namespace fileio;

TEST(StdioDrainFrames, DeliversEveryCompleteLine) {
    std::vector<std::string> received;
    StdioTransport t;
    t.SetMessageHandler([&](const std::string& payload){ received.push_back(payload); });
    StdioTransportTestHooks::setConnected(t, true);

    std::string buffer = "{\"jsonrpc\":\"2.0\",\"method\":\"ping\",\"id\":1}\n{\"jsonrpc\":\"2.0\",\"method\":\"ping\",\"id\":2}\n{\"jso";

    EXPECT_TRUE(StdioTransportTestHooks::drainFrames(t, buffer));

    ASSERT_EQ(received.size(), 2u);
    EXPECT_EQ(received[1], "{\"jsonrpc\":\"2.0\",\"method\":\"ping\",\"id\":2}");
    EXPECT_EQ(buffer, "{\"jso");
    EXPECT_EQ(t.Discipline(), FramingDiscipline::LineDelimited);
}

TEST(StdioDrainFrames, InvalidHeaderCloses) {
    bool errored = false;
    bool closed = false;
    bool delivered = false;
    StdioTransport t;
    t.SetMessageHandler([&](const std::string&){ delivered = true; });
    t.SetErrorHandler([&](const std::string&){ errored = true; });
    t.SetCloseHandler([&](){ closed = true; });
    StdioTransportTestHooks::setConnected(t, true);

    std::string buffer = "Content-Length: abc\r\n\r\n{}";

    EXPECT_FALSE(StdioTransportTestHooks::drainFrames(t, buffer));

    EXPECT_FALSE(delivered);
    EXPECT_TRUE(errored);
    EXPECT_TRUE(closed);
    EXPECT_FALSE(StdioTransportTestHooks::isConnected(t));
}

TEST(StdioDrainFrames, BodyTooLargeCloses) {
    bool errored = false;
    StdioTransport t(STDIN_FILENO, STDOUT_FILENO, 4);
    t.SetErrorHandler([&](const std::string&){ errored = true; });
    StdioTransportTestHooks::setConnected(t, true);

    std::string buffer = "Content-Length: 5\r\n\r\nabcde";

    EXPECT_FALSE(StdioTransportTestHooks::drainFrames(t, buffer));

    EXPECT_TRUE(errored);
    EXPECT_FALSE(StdioTransportTestHooks::isConnected(t));
}

TEST(StdioDrainFrames, IncompleteFrameWaits) {
    StdioTransport t;
    StdioTransportTestHooks::setConnected(t, true);

    std::string buffer = "Content-Length: 4\r\n\r\nab";

    EXPECT_TRUE(StdioTransportTestHooks::drainFrames(t, buffer));

    EXPECT_TRUE(StdioTransportTestHooks::isConnected(t));
    EXPECT_EQ(buffer, std::string("Content-Length: 4\r\n\r\nab"));
    EXPECT_EQ(t.Discipline(), FramingDiscipline::LengthPrefixed);
}

TEST(StdioDrainFrames, SwitchingFramingMidStreamCloses) {
    std::vector<std::string> received;
    bool closed = false;
    StdioTransport t;
    t.SetMessageHandler([&](const std::string& payload){ received.push_back(payload); });
    t.SetCloseHandler([&](){ closed = true; });
    StdioTransportTestHooks::setConnected(t, true);

    std::string buffer = "Content-Length: 2\r\n\r\n{}{\"jsonrpc\":\"2.0\",\"method\":\"ping\",\"id\":1}\n";

    EXPECT_FALSE(StdioTransportTestHooks::drainFrames(t, buffer));

    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(received[0], "{}");
    EXPECT_TRUE(closed);
}
