//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_stdio_transport.cpp
// Purpose: StdioTransport end-to-end over pipes (both framings, EOF handling, a full session)
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <fstream>
#include <memory>
#include <sstream>
#include <set>
#include <string>
#include <stdexcept>
#include <thread>

#include <poll.h>
#include <unistd.h>

#include "TempDir.h"
#include "fileio/JSONRPCTypes.h"
#include "fileio/Server.h"
#include "fileio/transport/StdioTransport.hpp"
#include "logging/Logger.h"

using namespace fileio;

namespace {

struct Pipes {
    int toServer[2]{-1, -1};
    int fromServer[2]{-1, -1};

    Pipes() {
        if (::pipe(toServer) != 0 || ::pipe(fromServer) != 0) {
            throw std::runtime_error("pipe() failed");
        }
    }
    ~Pipes() {
        for (int fd : {toServer[0], toServer[1], fromServer[0], fromServer[1]}) {
            if (fd >= 0) ::close(fd);
        }
    }
    void closeClientWriter() {
        ::close(toServer[1]);
        toServer[1] = -1;
    }
    void send(const std::string& bytes) {
        std::size_t off = 0;
        while (off < bytes.size()) {
            ssize_t n = ::write(toServer[1], bytes.data() + off, bytes.size() - off);
            if (n <= 0) throw std::runtime_error("write() failed");
            off += static_cast<std::size_t>(n);
        }
    }
    // Reads until at least `count` occurrences of terminator have arrived or the timeout elapses.
    std::string receive(const std::string& terminator, std::size_t count = 1,
                        std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
        std::string out;
        auto deadline = std::chrono::steady_clock::now() + timeout;
        auto occurrences = [&]() {
            std::size_t n = 0;
            for (std::size_t pos = out.find(terminator); pos != std::string::npos;
                 pos = out.find(terminator, pos + terminator.size())) {
                ++n;
            }
            return n;
        };
        while (occurrences() < count && std::chrono::steady_clock::now() < deadline) {
            pollfd pfd{fromServer[0], POLLIN, 0};
            if (::poll(&pfd, 1, 50) <= 0) continue;
            char buf[4096];
            ssize_t n = ::read(fromServer[0], buf, sizeof(buf));
            if (n <= 0) break;
            out.append(buf, static_cast<std::size_t>(n));
        }
        return out;
    }
};

bool waitFor(const std::atomic<bool>& flag, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!flag.load() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return flag.load();
}

} // namespace

TEST(StdioTransport, EchoesLineDelimitedFrames) {
    Pipes pipes;
    auto transport = std::make_shared<StdioTransport>(pipes.toServer[0], pipes.fromServer[1]);
    StdioTransport* raw = transport.get();
    transport->SetMessageHandler([raw](const std::string& payload){ raw->SendMessage(payload); });
    transport->Start().get();

    pipes.send("{\"a\":1}\n{\"b\":2}\n");
    std::string echoed = pipes.receive("\n", 2);
    EXPECT_EQ(echoed, "{\"a\":1}\n{\"b\":2}\n");
    EXPECT_EQ(transport->Discipline(), FramingDiscipline::LineDelimited);

    transport->Close().get();
    EXPECT_FALSE(transport->IsConnected());
}

TEST(StdioTransport, EchoesContentLengthFrames) {
    Pipes pipes;
    auto transport = std::make_shared<StdioTransport>(pipes.toServer[0], pipes.fromServer[1]);
    StdioTransport* raw = transport.get();
    transport->SetMessageHandler([raw](const std::string& payload){ raw->SendMessage(payload); });
    transport->Start().get();

    // Split across writes so the reader sees a partial header first
    pipes.send("Content-Len");
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    pipes.send("gth: 7\r\n\r\n{\"a\":1}");
    std::string echoed = pipes.receive("}");
    EXPECT_EQ(echoed, "Content-Length: 7\r\n\r\n{\"a\":1}");
    EXPECT_EQ(transport->Discipline(), FramingDiscipline::LengthPrefixed);

    transport->Close().get();
}

TEST(StdioTransport, EndOfInputFiresCloseHandlerOnce) {
    std::atomic<int> closes{0};
    std::atomic<bool> closed{false};
    Pipes pipes;
    auto transport = std::make_shared<StdioTransport>(pipes.toServer[0], pipes.fromServer[1]);
    transport->SetCloseHandler([&](){ closes++; closed = true; });
    transport->Start().get();

    // Truncated body: the declared length never arrives before EOF
    pipes.send("Content-Length: 100\r\n\r\n{\"a\":");
    pipes.closeClientWriter();

    ASSERT_TRUE(waitFor(closed, std::chrono::milliseconds(5000)));
    EXPECT_FALSE(transport->IsConnected());
    EXPECT_FALSE(transport->SendMessage("{}"));

    transport->Close().get();
    transport.reset();
    EXPECT_EQ(closes.load(), 1);
}

TEST(StdioTransport, ServesASessionOverPipes) {
    Pipes pipes;
    SessionOptions options;
    options.policy = MakeAllowAllPolicy();
    Server server(ToolRegistry::Default(), options);
    auto session = server.Attach(std::make_shared<StdioTransport>(pipes.toServer[0], pipes.fromServer[1]));

    pipes.send("{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"initialize\",\"params\":{\"protocolVersion\":\"2024-11-05\"}}\n");
    std::string line = pipes.receive("\n");
    ASSERT_FALSE(line.empty());
    JSONValue reply = parseJSON(line.substr(0, line.find('\n')));
    ASSERT_NE(reply.find("result"), nullptr);
    const JSONValue* version = reply.find("result")->find("protocolVersion");
    ASSERT_NE(version, nullptr);
    EXPECT_EQ(*version, JSONValue("2024-11-05"));
    EXPECT_EQ(*reply.find("id"), JSONValue(static_cast<int64_t>(1)));

    pipes.send("{\"jsonrpc\":\"2.0\",\"method\":\"notifications/initialized\"}\n");
    pipes.send("{\"jsonrpc\":\"2.0\",\"id\":2,\"method\":\"ping\"}\n");
    line = pipes.receive("\n");
    reply = parseJSON(line.substr(0, line.find('\n')));
    EXPECT_EQ(*reply.find("id"), JSONValue(static_cast<int64_t>(2)));
    EXPECT_EQ(session->State(), SessionState::Ready);

    pipes.closeClientWriter();
    EXPECT_TRUE(session->WaitUntilClosed(std::chrono::milliseconds(5000)));
    server.Stop();
    EXPECT_EQ(server.SessionCount(), 0u);
}

TEST(StdioTransport, InputEndedHandlerKeepsRepliesOpen) {
    std::atomic<bool> ended{false};
    std::atomic<bool> closed{false};
    Pipes pipes;
    auto transport = std::make_shared<StdioTransport>(pipes.toServer[0], pipes.fromServer[1]);
    transport->SetInputEndedHandler([&](){ ended = true; });
    transport->SetCloseHandler([&](){ closed = true; });
    transport->Start().get();

    pipes.send("{\"a\":1}\n");
    pipes.closeClientWriter();
    ASSERT_TRUE(waitFor(ended, std::chrono::milliseconds(5000)));
    EXPECT_FALSE(closed.load());
    EXPECT_TRUE(transport->IsConnected());
    EXPECT_TRUE(transport->SendMessage("{\"late\":true}"));
    EXPECT_EQ(pipes.receive("\n"), "{\"late\":true}\n");

    transport->Close().get();
    EXPECT_TRUE(closed.load());
}

TEST(StdioTransport, RepliesToCallsStillRunningAtEndOfInput) {
    fileio::test::TempDir dir;
    const std::string file = dir.write("a.txt", "one\ntwo\nthree\n");

    Pipes pipes;
    Server server(ToolRegistry::Default(), SessionOptions{});
    auto session = server.Attach(std::make_shared<StdioTransport>(pipes.toServer[0], pipes.fromServer[1]));

    pipes.send("{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"initialize\",\"params\":{}}\n");
    ASSERT_FALSE(pipes.receive("\n").empty());
    pipes.send("{\"jsonrpc\":\"2.0\",\"method\":\"notifications/initialized\"}\n");

    std::string calls;
    for (int id = 2; id <= 6; ++id) {
        calls += "{\"jsonrpc\":\"2.0\",\"id\":" + std::to_string(id) +
                 ",\"method\":\"tools/call\",\"params\":{\"name\":\"fileio_count_lines\",\"arguments\":{\"paths\":[\"" +
                 file + "\"]}}}\n";
    }
    pipes.send(calls);
    pipes.closeClientWriter();

    const std::string out = pipes.receive("\n", 5);
    std::set<int64_t> ids;
    std::size_t start = 0;
    for (std::size_t end = out.find('\n'); end != std::string::npos; start = end + 1, end = out.find('\n', start)) {
        JSONValue reply = parseJSON(out.substr(start, end - start));
        ASSERT_NE(reply.find("result"), nullptr);
        ids.insert(std::get<int64_t>(reply.find("id")->value));
    }
    EXPECT_EQ(ids, (std::set<int64_t>{2, 3, 4, 5, 6}));

    EXPECT_TRUE(session->WaitUntilClosed(std::chrono::milliseconds(5000)));
    server.Stop();
}

namespace {

// Feeds input, closes it, and returns what the transport logged until its close handler ran.
std::string logOfEndOfInput(const std::string& input) {
    fileio::test::TempDir dir;
    const std::string logPath = dir.path("transport.log");
    Logger::setLogLevel(LogLevel::LOG_INFO_LEVEL);
    Logger::setLogFile(logPath);

    std::atomic<bool> closed{false};
    {
        Pipes pipes;
        auto transport = std::make_shared<StdioTransport>(pipes.toServer[0], pipes.fromServer[1]);
        transport->SetMessageHandler([](const std::string&){});
        transport->SetCloseHandler([&](){ closed = true; });
        transport->Start().get();
        pipes.send(input);
        pipes.closeClientWriter();
        EXPECT_TRUE(waitFor(closed, std::chrono::milliseconds(5000)));
        transport->Close().get();
    }
    Logger::setLogFile("/dev/null");

    std::ifstream in(logPath);
    std::stringstream text;
    text << in.rdbuf();
    return text.str();
}

} // namespace

TEST(StdioTransport, EofAfterCompleteFramesIsNotATruncation) {
    const std::string log = logOfEndOfInput("{\"a\":1}\n{\"b\":2}\n{\"c\":3}\n");
    EXPECT_NE(log.find("EOF on input"), std::string::npos);
    EXPECT_EQ(log.find("EOF inside a frame"), std::string::npos);
}

TEST(StdioTransport, EofInsideAFrameIsReported) {
    const std::string log = logOfEndOfInput("{\"a\":1}\n{\"b\":");
    EXPECT_NE(log.find("EOF inside a frame (5 bytes pending)"), std::string::npos);
}
