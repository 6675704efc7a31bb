//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/fileio/transport/WebSocketServer.cpp
// Purpose: WebSocket (ws/wss) acceptor and per-connection transport using Boost.Beast (TLS 1.3 only for wss)
//==========================================================================================================

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <deque>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include "logging/Logger.h"
#include "fileio/version.h"
#include "fileio/transport/WebSocketServer.hpp"

#include <openssl/ssl.h>

namespace fileio {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace websocket = boost::beast::websocket;
using tcp = net::ip::tcp;

namespace {

constexpr std::size_t WRITE_QUEUE_MAX_BYTES = 8 * 1024 * 1024;
constexpr auto CLOSE_GRACE = std::chrono::seconds(2);
constexpr auto HANDSHAKE_TIMEOUT = std::chrono::seconds(30);

// Server-side view of a live connection, independent of the stream type.
class IWebSocketConnection : public ITransport {
public:
    // Drops the socket without the closing handshake.
    virtual void Abort() = 0;
};

//==========================================================================================================
// WebSocketConnection
// Purpose: One upgraded client connection. All stream operations run on the I/O thread; SendMessage and
//          Close post onto it. Outbound payloads are written one at a time from a queue as text frames.
//==========================================================================================================
template <class WsStream>
class WebSocketConnection final : public IWebSocketConnection,
                                  public std::enable_shared_from_this<WebSocketConnection<WsStream>> {
public:
    template <class NextLayer>
    WebSocketConnection(NextLayer&& next, std::string id, std::size_t maxMessageBytes)
        : ws(std::forward<NextLayer>(next)), closeTimer(ws.get_executor()), sessionId(std::move(id)) {
        ws.read_message_max(maxMessageBytes);
    }

    ~WebSocketConnection() override = default;

    // Completes the upgrade for a request that already passed path checks.
    net::awaitable<void> accept(const http::request<http::string_body>& req) {
        beast::get_lowest_layer(ws).expires_never();
        ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
        ws.set_option(websocket::stream_base::decorator([](websocket::response_type& res) {
            res.set(http::field::server, std::string(SERVER_NAME) + "/" + getVersionString());
        }));
        co_await ws.async_accept(req, net::use_awaitable);
        LOG_INFO("WebSocket connection {} upgraded", sessionId);
    }

    ////////////////////////////////////////// ITransport //////////////////////////////////////////
    std::future<void> Start() override {
        FUNC_SCOPE();
        connected = true;
        auto self = this->shared_from_this();
        net::co_spawn(ws.get_executor(), readLoop(self), net::detached);
        std::promise<void> promise; promise.set_value(); return promise.get_future();
    }

    std::future<void> Close() override {
        FUNC_SCOPE();
        std::promise<void> promise;
        auto fut = promise.get_future();
        {
            std::lock_guard<std::mutex> lk(closeMutex);
            if (closeNotified.load()) {
                promise.set_value();
            } else {
                closeWaiters.push_back(std::move(promise));
            }
        }
        auto self = this->shared_from_this();
        net::post(ws.get_executor(), [self]() { self->beginClose(); });
        return fut;
    }

    bool IsConnected() const override { return connected.load(); }

    std::string GetSessionId() const override { return sessionId; }

    bool SendMessage(const std::string& payload) override {
        if (!connected.load()) {
            LOG_WARN("WebSocket {}: not connected; dropping outbound message", sessionId);
            return false;
        }
        if (queuedBytes.fetch_add(payload.size()) + payload.size() > WRITE_QUEUE_MAX_BYTES) {
            queuedBytes.fetch_sub(payload.size());
            LOG_ERROR("WebSocket {}: write queue overflow (max={})", sessionId, WRITE_QUEUE_MAX_BYTES);
            reportError("WebSocket write queue overflow");
            Abort();
            return false;
        }
        LOG_DEBUG("Sending message: {}", payload);
        auto self = this->shared_from_this();
        net::post(ws.get_executor(), [self, payload]() {
            self->writeQueue.push_back(payload);
            if (!self->writing) {
                self->writeNext();
            }
        });
        return true;
    }

    void SetMessageHandler(MessageHandler handler) override { messageHandler = std::move(handler); }
    void SetErrorHandler(ErrorHandler handler) override { errorHandler = std::move(handler); }
    void SetCloseHandler(CloseHandler handler) override { closeHandler = std::move(handler); }

    void Abort() override {
        auto self = this->shared_from_this();
        net::post(ws.get_executor(), [self]() { self->forceClose(); });
    }

private:
    net::awaitable<void> readLoop(std::shared_ptr<WebSocketConnection> self) {
        beast::flat_buffer buffer;
        try {
            while (connected.load()) {
                buffer.clear();
                co_await ws.async_read(buffer, net::use_awaitable);
                if (!ws.got_text()) {
                    LOG_WARN("WebSocket {}: ignoring binary message ({} bytes)", sessionId, buffer.size());
                    continue;
                }
                std::string payload = beast::buffers_to_string(buffer.data());
                LOG_DEBUG("Received message: {}", payload);
                if (messageHandler) {
                    messageHandler(payload);
                }
            }
        } catch (const boost::system::system_error& e) {
            if (e.code() == websocket::error::closed) {
                LOG_INFO("WebSocket {}: peer closed the connection", sessionId);
            } else if (e.code() == websocket::error::message_too_big) {
                LOG_ERROR("WebSocket {}: inbound message exceeds {} bytes", sessionId, ws.read_message_max());
                reportError("WebSocket message too large");
            } else if (closeStarted) {
                LOG_DEBUG("WebSocket {}: read ended during close: {}", sessionId, e.what());
            } else {
                LOG_WARN("WebSocket {}: read error: {}", sessionId, e.what());
                reportError(std::string("WebSocket read error: ") + e.what());
            }
        } catch (const std::exception& e) {
            LOG_ERROR("WebSocket {}: message handler failed: {}", sessionId, e.what());
            reportError(std::string("WebSocket message handler failed: ") + e.what());
        }
        markClosed();
        (void)self;
    }

    void writeNext() {
        if (writeQueue.empty()) {
            writing = false;
            if (closeStarted) {
                doClose();
            }
            return;
        }
        writing = true;
        ws.text(true);
        auto self = this->shared_from_this();
        ws.async_write(net::buffer(writeQueue.front()), [self](beast::error_code ec, std::size_t) {
            self->queuedBytes.fetch_sub(self->writeQueue.front().size());
            self->writeQueue.pop_front();
            if (ec) {
                LOG_WARN("WebSocket {}: write error: {}", self->sessionId, ec.message());
                self->reportError("WebSocket write error: " + ec.message());
                self->writing = false;
                self->forceClose();
                return;
            }
            self->writeNext();
        });
    }

    // Flush what is queued, then perform the closing handshake. The timer bounds the whole sequence.
    void beginClose() {
        if (closeStarted) {
            return;
        }
        closeStarted = true;
        auto self = this->shared_from_this();
        closeTimer.expires_after(CLOSE_GRACE);
        closeTimer.async_wait([self](beast::error_code ec) {
            if (!ec) {
                LOG_WARN("WebSocket {}: close did not complete in time; dropping connection", self->sessionId);
                self->forceClose();
            }
        });
        if (!writing) {
            doClose();
        }
    }

    void doClose() {
        if (closeSent || !ws.is_open()) {
            return;
        }
        closeSent = true;
        auto self = this->shared_from_this();
        ws.async_close(websocket::close_code::normal, [self](beast::error_code ec) {
            if (ec) {
                LOG_DEBUG("WebSocket {}: close handshake failed: {}", self->sessionId, ec.message());
            }
            self->closeTimer.cancel();
            self->markClosed();
        });
    }

    void forceClose() {
        closeStarted = true;
        closeTimer.cancel();
        beast::get_lowest_layer(ws).close();
        writeQueue.clear();
        markClosed();
    }

    void reportError(const std::string& msg) {
        if (errorHandler) {
            errorHandler(msg);
        }
    }

    void markClosed() {
        connected = false;
        if (closeNotified.exchange(true)) {
            return;
        }
        LOG_INFO("WebSocket connection {} closed", sessionId);
        if (closeHandler) {
            closeHandler();
        }
        std::lock_guard<std::mutex> lk(closeMutex);
        for (auto& waiter : closeWaiters) {
            waiter.set_value();
        }
        closeWaiters.clear();
    }

    WsStream ws;
    net::steady_timer closeTimer;
    std::string sessionId;

    std::atomic<bool> connected{false};
    std::atomic<bool> closeNotified{false};
    std::mutex closeMutex;
    std::vector<std::promise<void>> closeWaiters;

    // I/O thread only
    std::deque<std::string> writeQueue;
    bool writing{false};
    bool closeStarted{false};
    bool closeSent{false};
    std::atomic<std::size_t> queuedBytes{0};

    MessageHandler messageHandler;
    ErrorHandler errorHandler;
    CloseHandler closeHandler;
};

using PlainWebSocket = websocket::stream<beast::tcp_stream>;
using TlsWebSocket = websocket::stream<beast::ssl_stream<beast::tcp_stream>>;

std::string requestPath(const http::request<http::string_body>& req) {
    std::string target(req.target());
    auto q = target.find('?');
    if (q != std::string::npos) {
        target.erase(q);
    }
    return target;
}

} // namespace

class WebSocketServer::Impl {
public:
    WebSocketServer::Options opts;
    std::atomic<bool> running{false};
    std::atomic<std::uint16_t> localPort{0};

    net::io_context ioc;
    std::unique_ptr<tcp::acceptor> acceptor;
    std::unique_ptr<ssl::context> sslCtx; // present when scheme==wss
    std::thread ioThread;

    ITransportAcceptor::ConnectionHandler connectionHandler;
    ITransport::ErrorHandler errorHandler;

    std::mutex liveMutex;
    std::vector<std::weak_ptr<IWebSocketConnection>> live;

    explicit Impl(const WebSocketServer::Options& o) : opts(o) {
        if (opts.scheme == "wss") {
            sslCtx = std::make_unique<ssl::context>(ssl::context::tls_server);
            // TLS 1.3 only
            ::SSL_CTX_set_min_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            ::SSL_CTX_set_max_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            try {
                sslCtx->use_certificate_chain_file(opts.certFile);
                sslCtx->use_private_key_file(opts.keyFile, ssl::context::file_format::pem);
            } catch (const std::exception& e) {
                LOG_ERROR("WebSocketServer: failed to load certificate/key: {}", e.what());
                throw;
            }
            sslCtx->set_options(
                ssl::context::default_workarounds | ssl::context::no_sslv2 | ssl::context::no_sslv3 |
                ssl::context::no_tlsv1 | ssl::context::no_tlsv1_1 | ssl::context::no_tlsv1_2);
        } else if (opts.scheme != "ws") {
            throw std::invalid_argument("WebSocketServer: unsupported scheme: " + opts.scheme);
        }
    }

    ~Impl() {
        if (ioThread.joinable()) {
            ioc.stop();
            ioThread.join();
        }
    }

    void setError(const std::string& msg) {
        if (errorHandler) { errorHandler(msg); }
    }

    void bind() {
        tcp::resolver resolver(ioc);
        auto r = resolver.resolve(opts.address, opts.port);
        tcp::endpoint ep = *r.begin();

        acceptor = std::make_unique<tcp::acceptor>(ioc);
        acceptor->open(ep.protocol());
        acceptor->set_option(tcp::acceptor::reuse_address(true));
        acceptor->bind(ep);
        acceptor->listen();
        localPort = acceptor->local_endpoint().port();
        LOG_INFO("WebSocketServer listening on {}://{}:{}", opts.scheme, opts.address, localPort.load());
    }

    // Answers requests that are not a WebSocket upgrade on / or /ws. Returns true when rejected.
    template <class Stream>
    net::awaitable<bool> rejectUnlessUpgrade(Stream& stream, const http::request<http::string_body>& req) {
        const std::string path = requestPath(req);
        http::response<http::string_body> res;
        res.version(req.version());
        res.keep_alive(false);
        res.set(http::field::server, std::string(SERVER_NAME) + "/" + getVersionString());
        res.set(http::field::content_type, "text/plain");
        if (path != "/" && path != "/ws") {
            res.result(http::status::not_found);
            res.body() = "Not found";
        } else if (!websocket::is_upgrade(req)) {
            res.result(http::status::upgrade_required);
            res.set(http::field::upgrade, "websocket");
            res.body() = "WebSocket upgrade required";
        } else {
            co_return false;
        }
        LOG_WARN("WebSocketServer: rejecting {} {} with {}", std::string(req.method_string()), path,
                 static_cast<unsigned>(res.result_int()));
        res.prepare_payload();
        co_await http::async_write(stream, res, net::use_awaitable);
        co_return true;
    }

    void adopt(const std::shared_ptr<IWebSocketConnection>& conn) {
        {
            std::lock_guard<std::mutex> lk(liveMutex);
            live.erase(std::remove_if(live.begin(), live.end(), [](const auto& w) { return w.expired(); }), live.end());
            live.push_back(conn);
        }
        if (connectionHandler) {
            connectionHandler(conn);
        } else {
            LOG_WARN("WebSocketServer: no connection handler; closing {}", conn->GetSessionId());
            conn->Abort();
        }
    }

    void reportSessionError(const char* what, const std::exception& e) {
        if (!running.load()) {
            LOG_DEBUG("WebSocketServer {} suppressed during shutdown: {}", what, e.what());
        } else {
            LOG_WARN("WebSocketServer {} error: {}", what, e.what());
            setError(std::string("WebSocketServer ") + what + " error: " + e.what());
        }
    }

    net::awaitable<void> session_plain(tcp::socket socket, std::string id) {
        try {
            beast::tcp_stream stream(std::move(socket));
            beast::flat_buffer buffer;
            http::request<http::string_body> req;
            stream.expires_after(HANDSHAKE_TIMEOUT);
            co_await http::async_read(stream, buffer, req, net::use_awaitable);
            if (co_await rejectUnlessUpgrade(stream, req)) {
                beast::error_code ec;
                stream.socket().shutdown(tcp::socket::shutdown_send, ec);
                co_return;
            }
            auto conn = std::make_shared<WebSocketConnection<PlainWebSocket>>(std::move(stream), id, opts.maxMessageBytes);
            co_await conn->accept(req);
            adopt(conn);
        } catch (const std::exception& e) {
            reportSessionError("ws session", e);
        }
        co_return;
    }

    net::awaitable<void> session_tls(tcp::socket socket, std::string id) {
        try {
            beast::ssl_stream<beast::tcp_stream> tls(std::move(socket), *sslCtx);
            beast::get_lowest_layer(tls).expires_after(HANDSHAKE_TIMEOUT);
            co_await tls.async_handshake(ssl::stream_base::server, net::use_awaitable);
            beast::flat_buffer buffer;
            http::request<http::string_body> req;
            co_await http::async_read(tls, buffer, req, net::use_awaitable);
            if (co_await rejectUnlessUpgrade(tls, req)) {
                beast::error_code ec;
                co_await tls.async_shutdown(net::redirect_error(net::use_awaitable, ec));
                co_return;
            }
            auto conn = std::make_shared<WebSocketConnection<TlsWebSocket>>(std::move(tls), id, opts.maxMessageBytes);
            co_await conn->accept(req);
            adopt(conn);
        } catch (const std::exception& e) {
            reportSessionError("wss session", e);
        }
        co_return;
    }

    net::awaitable<void> acceptLoop() {
        try {
            while (running.load()) {
                tcp::socket socket = co_await acceptor->async_accept(net::use_awaitable);
                boost::system::error_code ec;
                auto remote = socket.remote_endpoint(ec);
                std::string id = ec ? std::string("ws-unknown")
                                    : "ws-" + remote.address().to_string() + ":" + std::to_string(remote.port());
                LOG_DEBUG("WebSocketServer: accepted {}", id);
                if (sslCtx) {
                    net::co_spawn(ioc, session_tls(std::move(socket), id), net::detached);
                } else {
                    net::co_spawn(ioc, session_plain(std::move(socket), id), net::detached);
                }
            }
        } catch (const std::exception& e) {
            reportSessionError("accept", e);
        }
        co_return;
    }

    std::vector<std::shared_ptr<IWebSocketConnection>> liveConnections() {
        std::vector<std::shared_ptr<IWebSocketConnection>> out;
        std::lock_guard<std::mutex> lk(liveMutex);
        for (auto& w : live) {
            if (auto c = w.lock()) {
                out.push_back(std::move(c));
            }
        }
        return out;
    }
};

WebSocketServer::Options WebSocketServer::ParseListenUrl(const std::string& url) {
    Options opts;
    auto sep = url.find("://");
    if (sep == std::string::npos) {
        throw std::invalid_argument("listen address must look like ws://host:port: " + url);
    }
    opts.scheme = url.substr(0, sep);
    std::transform(opts.scheme.begin(), opts.scheme.end(), opts.scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (opts.scheme != "ws" && opts.scheme != "wss") {
        throw std::invalid_argument("unsupported listen scheme: " + opts.scheme);
    }
    std::string rest = url.substr(sep + 3);
    auto slash = rest.find('/');
    if (slash != std::string::npos) {
        rest.erase(slash);
    }
    std::string host;
    std::string port;
    if (!rest.empty() && rest.front() == '[') {
        auto close = rest.find(']');
        if (close == std::string::npos) {
            throw std::invalid_argument("unterminated IPv6 address in: " + url);
        }
        host = rest.substr(1, close - 1);
        if (close + 1 < rest.size() && rest[close + 1] == ':') {
            port = rest.substr(close + 2);
        }
    } else {
        auto colon = rest.rfind(':');
        if (colon != std::string::npos) {
            host = rest.substr(0, colon);
            port = rest.substr(colon + 1);
        } else {
            host = rest;
        }
    }
    // Validate port strictly: numeric and within [0, 65535]
    if (port.empty()) {
        throw std::invalid_argument("listen address has no port: " + url);
    }
    bool allDigits = std::all_of(port.begin(), port.end(), [](unsigned char ch){ return std::isdigit(ch) != 0; });
    if (!allDigits || port.size() > 5 || std::stoul(port) > 65535ul) {
        throw std::invalid_argument("invalid listen port: " + port);
    }
    if (!host.empty()) {
        opts.address = host;
    }
    opts.port = port;
    return opts;
}

WebSocketServer::WebSocketServer(const Options& opts)
    : pImpl(std::make_unique<Impl>(opts)) {}

WebSocketServer::~WebSocketServer() {
    if (pImpl->running.load()) {
        Stop().wait();
    }
}

std::future<void> WebSocketServer::Start() {
    FUNC_SCOPE();
    std::promise<void> ready; auto fut = ready.get_future();
    try {
        pImpl->bind();
    } catch (const std::exception& e) {
        LOG_ERROR("WebSocketServer: failed to listen on {}:{}: {}", pImpl->opts.address, pImpl->opts.port, e.what());
        pImpl->setError(std::string("WebSocketServer listen error: ") + e.what());
        ready.set_exception(std::current_exception());
        return fut;
    }
    pImpl->running.store(true);
    net::co_spawn(pImpl->ioc, pImpl->acceptLoop(), net::detached);
    pImpl->ioThread = std::thread([this]() {
        try {
            pImpl->ioc.run();
        } catch (const std::exception& e) {
            LOG_ERROR("WebSocketServer I/O loop failed: {}", e.what());
            pImpl->setError(e.what());
        }
    });
    ready.set_value();
    return fut;
}

std::future<void> WebSocketServer::Stop() {
    FUNC_SCOPE();
    std::promise<void> done; auto fut = done.get_future();
    pImpl->running.store(false);
    net::post(pImpl->ioc, [impl = pImpl.get()]() {
        if (impl->acceptor) {
            boost::system::error_code ec;
            impl->acceptor->close(ec);
        }
    });
    auto conns = pImpl->liveConnections();
    for (auto& c : conns) {
        c->Abort();
    }
    // Let the aborts run before the context stops
    auto deadline = std::chrono::steady_clock::now() + CLOSE_GRACE;
    while (std::chrono::steady_clock::now() < deadline &&
           std::any_of(conns.begin(), conns.end(), [](const auto& c) { return c->IsConnected(); })) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    conns.clear();
    pImpl->ioc.stop();
    if (pImpl->ioThread.joinable() && pImpl->ioThread.get_id() != std::this_thread::get_id()) {
        pImpl->ioThread.join();
    }
    LOG_INFO("WebSocketServer stopped");
    done.set_value();
    return fut;
}

void WebSocketServer::SetConnectionHandler(ConnectionHandler handler) {
    pImpl->connectionHandler = std::move(handler);
}

void WebSocketServer::SetErrorHandler(ITransport::ErrorHandler handler) {
    pImpl->errorHandler = std::move(handler);
}

std::uint16_t WebSocketServer::LocalPort() const {
    return pImpl->localPort.load();
}

} // namespace fileio
