//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_websocket_server.cpp
// Purpose: WebSocket acceptor end to end with a synchronous Beast client; listen URL parsing
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include "fileio/Server.h"
#include "fileio/ToolRegistry.h"
#include "fileio/transport/WebSocketServer.hpp"

using namespace fileio;
namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace websocket = boost::beast::websocket;
using tcp = net::ip::tcp;

namespace {

// Server plus a WebSocket acceptor on an ephemeral loopback port.
struct LiveServer {
    Server server{ToolRegistry::Default(), SessionOptions{}};
    std::shared_ptr<WebSocketServer> acceptor;

    explicit LiveServer(std::size_t maxMessageBytes = 4 * 1024 * 1024) {
        WebSocketServer::Options opts;
        opts.port = "0";
        opts.maxMessageBytes = maxMessageBytes;
        acceptor = std::make_shared<WebSocketServer>(opts);
        server.Listen(acceptor);
    }

    ~LiveServer() { server.Stop(); }

    std::string port() const { return std::to_string(acceptor->LocalPort()); }
};

struct Client {
    net::io_context ioc;
    websocket::stream<tcp::socket> ws{ioc};

    void connect(const std::string& port, const std::string& target = "/") {
        tcp::resolver resolver(ioc);
        net::connect(ws.next_layer(), resolver.resolve("127.0.0.1", port));
        ws.handshake("127.0.0.1:" + port, target);
    }

    void send(const std::string& text) {
        ws.text(true);
        ws.write(net::buffer(text));
    }

    JSONValue receive() {
        beast::flat_buffer buffer;
        ws.read(buffer);
        return parseJSON(beast::buffers_to_string(buffer.data()));
    }
};

http::response<http::string_body> plainGet(const std::string& port, const std::string& target) {
    net::io_context ioc;
    tcp::resolver resolver(ioc);
    beast::tcp_stream stream(ioc);
    stream.connect(resolver.resolve("127.0.0.1", port));
    http::request<http::string_body> req{http::verb::get, target, 11};
    req.set(http::field::host, "127.0.0.1");
    http::write(stream, req);
    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    http::read(stream, buffer, res);
    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    return res;
}

bool waitForSessions(const Server& server, std::size_t expected) {
    for (int i = 0; i < 200; ++i) {
        if (server.SessionCount() == expected) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return false;
}

} // namespace

TEST(WebSocketServer, ParseListenUrl) {
    auto plain = WebSocketServer::ParseListenUrl("ws://0.0.0.0:9100");
    EXPECT_EQ(plain.scheme, "ws");
    EXPECT_EQ(plain.address, "0.0.0.0");
    EXPECT_EQ(plain.port, "9100");

    auto secure = WebSocketServer::ParseListenUrl("WSS://[::1]:8443/ws");
    EXPECT_EQ(secure.scheme, "wss");
    EXPECT_EQ(secure.address, "::1");
    EXPECT_EQ(secure.port, "8443");

    auto defaultHost = WebSocketServer::ParseListenUrl("ws://:0");
    EXPECT_EQ(defaultHost.address, "127.0.0.1");
    EXPECT_EQ(defaultHost.port, "0");

    EXPECT_THROW(WebSocketServer::ParseListenUrl("localhost:9000"), std::invalid_argument);
    EXPECT_THROW(WebSocketServer::ParseListenUrl("http://localhost:9000"), std::invalid_argument);
    EXPECT_THROW(WebSocketServer::ParseListenUrl("ws://localhost"), std::invalid_argument);
    EXPECT_THROW(WebSocketServer::ParseListenUrl("ws://localhost:70000"), std::invalid_argument);
    EXPECT_THROW(WebSocketServer::ParseListenUrl("ws://localhost:9x"), std::invalid_argument);
    EXPECT_THROW(WebSocketServer::ParseListenUrl("ws://[::1:9000"), std::invalid_argument);
}

TEST(WebSocketServer, WssWithoutCertificateFailsToConstruct) {
    WebSocketServer::Options opts;
    opts.scheme = "wss";
    opts.certFile = "/nonexistent/cert.pem";
    opts.keyFile = "/nonexistent/key.pem";
    EXPECT_ANY_THROW(WebSocketServer server(opts));

    opts.scheme = "gopher";
    EXPECT_THROW(WebSocketServer server(opts), std::invalid_argument);
}

TEST(WebSocketServer, BindsEphemeralPort) {
    LiveServer live;
    EXPECT_NE(live.acceptor->LocalPort(), 0);
}

TEST(WebSocketServer, InitializeOverWebSocket) {
    LiveServer live;
    Client client;
    client.connect(live.port());
    ASSERT_TRUE(waitForSessions(live.server, 1));

    client.send(R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"protocolVersion":"2025-06-18"}})");
    JSONValue reply = client.receive();
    EXPECT_EQ(*reply.find("id"), JSONValue(static_cast<int64_t>(1)));
    EXPECT_EQ(*reply.find("result")->find("protocolVersion"), JSONValue("2025-06-18"));

    client.send(R"({"jsonrpc":"2.0","method":"notifications/initialized"})");
    client.send(R"({"jsonrpc":"2.0","id":2,"method":"ping"})");
    reply = client.receive();
    EXPECT_EQ(*reply.find("id"), JSONValue(static_cast<int64_t>(2)));
    ASSERT_NE(reply.find("result"), nullptr);
}

TEST(WebSocketServer, BinaryFramesAreIgnored) {
    LiveServer live;
    Client client;
    client.connect(live.port(), "/ws");

    client.ws.binary(true);
    client.ws.write(net::buffer(std::string(R"({"jsonrpc":"2.0","id":7,"method":"ping"})")));
    client.send(R"({"jsonrpc":"2.0","id":8,"method":"ping"})");

    // ping is answered in every open state; only the text frame produces a reply.
    JSONValue reply = client.receive();
    EXPECT_EQ(*reply.find("id"), JSONValue(static_cast<int64_t>(8)));
}

TEST(WebSocketServer, EachConnectionGetsItsOwnSession) {
    LiveServer live;
    Client first;
    Client second;
    first.connect(live.port());
    second.connect(live.port());
    ASSERT_TRUE(waitForSessions(live.server, 2));

    first.send(R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{}})");
    EXPECT_NE(first.receive().find("result"), nullptr);

    // The second session is still uninitialized.
    second.send(R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})");
    JSONValue reply = second.receive();
    ASSERT_NE(reply.find("error"), nullptr);

    first.ws.close(websocket::close_code::normal);
    EXPECT_TRUE(waitForSessions(live.server, 1));
}

TEST(WebSocketServer, OversizedMessageClosesConnection) {
    LiveServer live(64);
    Client client;
    client.connect(live.port());
    ASSERT_TRUE(waitForSessions(live.server, 1));

    client.send(std::string(R"({"jsonrpc":"2.0","id":1,"method":"ping","params":{"pad":")") + std::string(200, 'x') +
                R"("}})");
    beast::flat_buffer buffer;
    beast::error_code ec;
    client.ws.read(buffer, ec);
    EXPECT_TRUE(ec);
    EXPECT_TRUE(waitForSessions(live.server, 0));
}

TEST(WebSocketServer, UnknownPathIsNotFound) {
    LiveServer live;
    auto res = plainGet(live.port(), "/nope");
    EXPECT_EQ(res.result(), http::status::not_found);
    EXPECT_EQ(live.server.SessionCount(), 0u);
}

TEST(WebSocketServer, PlainHttpRequestNeedsUpgrade) {
    LiveServer live;
    auto res = plainGet(live.port(), "/");
    EXPECT_EQ(res.result(), http::status::upgrade_required);
    EXPECT_EQ(res[http::field::upgrade], "websocket");
}
