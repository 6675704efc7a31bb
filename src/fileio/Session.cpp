//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Session.cpp
// Purpose: Per-connection protocol session implementation
//==========================================================================================================

#include <condition_variable>
#include <mutex>
#include <thread>
#include <unordered_set>

#include "logging/Logger.h"
#include "fileio/MessageCodec.h"
#include "fileio/Protocol.h"
#include "fileio/Session.h"
#include "fileio/version.h"

namespace fileio {

const char* SessionStateName(SessionState state) {
    switch (state) {
        case SessionState::Uninitialized: return "Uninitialized";
        case SessionState::Initializing: return "Initializing";
        case SessionState::Ready: return "Ready";
        case SessionState::ShuttingDown: return "ShuttingDown";
        case SessionState::Closed: return "Closed";
    }
    return "Unknown";
}

namespace {

constexpr const char* NOT_INITIALIZED_MESSAGE = "Server not initialized. Call 'initialize' first.";
constexpr const char* SHUTTING_DOWN_MESSAGE = "Server is shutting down";

JSONValue emptyObject() {
    return JSONValue{JSONValue::Object{}};
}

} // namespace

class Session::Impl {
public:
    Session* owner;
    std::shared_ptr<ITransport> transport;
    const ToolRegistry& registry;
    SessionOptions options;
    std::function<void()> closedHandler;

    mutable std::mutex stateMutex;            // guards everything below
    mutable std::condition_variable stateCv;  // signalled on in-flight completion and on close
    SessionState state{SessionState::Uninitialized};
    std::optional<std::string> negotiatedVersion;
    JSONValue clientCapabilities;
    std::unordered_set<std::string> inFlight;

    Impl(Session* s, std::shared_ptr<ITransport> t, const ToolRegistry& r, SessionOptions o)
        : owner(s), transport(std::move(t)), registry(r), options(std::move(o)) {
        if (!options.policy) {
            options.policy = MakeAllowAllPolicy();
        }
        if (options.maxInFlight == 0) {
            options.maxInFlight = 1;
        }
    }

    // Caller holds stateMutex.
    void transition(SessionState next) {
        if (state == next) {
            return;
        }
        LOG_INFO("Session {}: {} -> {}", transport->GetSessionId(), SessionStateName(state), SessionStateName(next));
        state = next;
        stateCv.notify_all();
    }

    void send(const JSONRPCResponse& response) {
        if (!transport->SendMessage(response.Serialize())) {
            LOG_WARN("Session {}: could not deliver response for id {}", transport->GetSessionId(), idToString(response.id));
        }
    }

    void reply(const JSONRPCId& id, JSONValue result) {
        send(JSONRPCResponse(id, std::move(result)));
    }

    void replyError(const JSONRPCId& id, const errors::McpError& err) {
        LOG_DEBUG("Session {}: error {} for id {}: {}", transport->GetSessionId(), err.code, idToString(id), err.message);
        send(*errors::makeErrorResponse(id, err));
    }

    void onPayload(const std::string& payload) {
        {
            std::lock_guard<std::mutex> lk(stateMutex);
            if (state == SessionState::Closed) {
                LOG_DEBUG("Session {}: dropping payload received after close", transport->GetSessionId());
                return;
            }
        }
        DecodeOutcome decoded = MessageCodec::Decode(payload);
        if (decoded.error) {
            LOG_WARN("Session {}: rejected payload: {}", transport->GetSessionId(), decoded.error->message);
            if (decoded.replyExpected) {
                replyError(decoded.id, *decoded.error);
            }
            return;
        }
        Message& message = *decoded.message;
        switch (kindOf(message)) {
            case MessageKind::Request:
                onRequest(std::get<JSONRPCRequest>(message));
                break;
            case MessageKind::Notification:
                onNotification(std::get<JSONRPCNotification>(message));
                break;
            case MessageKind::Response:
            case MessageKind::ErrorResponse:
                // The server never issues requests, so there is nothing to correlate
                LOG_DEBUG("Session {}: ignoring client response for id {}", transport->GetSessionId(),
                          idToString(std::get<JSONRPCResponse>(message).id));
                break;
        }
    }

    void onNotification(const JSONRPCNotification& note) {
        const std::string& method = note.method;
        if (method == Methods::Initialized || method == Methods::InitializedLegacy) {
            std::lock_guard<std::mutex> lk(stateMutex);
            if (state == SessionState::Initializing) {
                transition(SessionState::Ready);
            } else {
                LOG_WARN("Session {}: {} received in state {}; ignored", transport->GetSessionId(), method,
                         SessionStateName(state));
            }
            return;
        }
        if (method == Methods::Exit) {
            LOG_INFO("Session {}: exit notification", transport->GetSessionId());
            (void)transport->Close();
            return;
        }
        if (method == Methods::Cancelled) {
            LOG_DEBUG("Session {}: cancellation is not supported; invocation keeps running", transport->GetSessionId());
            return;
        }
        LOG_DEBUG("Session {}: ignoring notification {}", transport->GetSessionId(), method);
    }

    void onRequest(const JSONRPCRequest& req) {
        const std::string& method = req.method;
        LOG_DEBUG("Session {}: request {} (id={})", transport->GetSessionId(), method, idToString(req.id));

        std::unique_lock<std::mutex> lk(stateMutex);
        if (inFlight.count(idToString(req.id)) != 0) {
            lk.unlock();
            replyError(req.id, errors::makeError(JSONRPCErrorCodes::InvalidRequest,
                                                 "Duplicate request id: " + idToString(req.id)));
            return;
        }

        if (method == Methods::Ping) {
            lk.unlock();
            reply(req.id, emptyObject());
            return;
        }

        if (method == Methods::Initialize) {
            if (state != SessionState::Uninitialized) {
                lk.unlock();
                replyError(req.id, errors::makeError(JSONRPCErrorCodes::InvalidRequest, "Server already initialized"));
                return;
            }
            handleInitialize(req, lk);
            return;
        }

        if (state == SessionState::Uninitialized || state == SessionState::Initializing) {
            lk.unlock();
            replyError(req.id, errors::makeError(JSONRPCErrorCodes::ServerNotInitialized, NOT_INITIALIZED_MESSAGE));
            return;
        }
        if (state == SessionState::ShuttingDown) {
            lk.unlock();
            replyError(req.id, errors::makeError(JSONRPCErrorCodes::ServerShuttingDown, SHUTTING_DOWN_MESSAGE));
            return;
        }

        if (method == Methods::ListTools) {
            lk.unlock();
            reply(req.id, listTools());
            return;
        }
        if (method == Methods::CallTool) {
            handleCallTool(req, lk);
            return;
        }
        if (method == Methods::Shutdown) {
            transition(SessionState::ShuttingDown);
            lk.unlock();
            beginShutdown(req.id);
            return;
        }
        lk.unlock();
        replyError(req.id, errors::makeError(JSONRPCErrorCodes::MethodNotFound, "Method not found: " + method));
    }

    void handleInitialize(const JSONRPCRequest& req, std::unique_lock<std::mutex>& lk) {
        std::string requested = DEFAULT_PROTOCOL_VERSION;
        if (req.params.has_value()) {
            if (!req.params->isObject()) {
                lk.unlock();
                replyError(req.id, errors::makeError(JSONRPCErrorCodes::InvalidParams, "initialize params must be an object"));
                return;
            }
            if (const JSONValue* v = req.params->find("protocolVersion")) {
                if (!v->isString()) {
                    lk.unlock();
                    replyError(req.id, errors::makeError(JSONRPCErrorCodes::InvalidParams, "protocolVersion must be a string"));
                    return;
                }
                requested = std::get<std::string>(v->value);
            }
            if (const JSONValue* caps = req.params->find("capabilities")) {
                clientCapabilities = *caps;
            }
            if (const JSONValue* info = req.params->find("clientInfo")) {
                LOG_INFO("Session {}: client {}", transport->GetSessionId(), serializeJSONValue(*info));
            }
        }

        if (!IsSupportedProtocolVersion(requested)) {
            lk.unlock();
            JSONValue::Array supported;
            for (const char* v : SUPPORTED_PROTOCOL_VERSIONS) {
                supported.push_back(std::make_shared<JSONValue>(v));
            }
            JSONValue::Object data;
            data["requested"] = std::make_shared<JSONValue>(requested);
            data["supported"] = std::make_shared<JSONValue>(std::move(supported));
            LOG_WARN("Session {}: unsupported protocol version {}", transport->GetSessionId(), requested);
            replyError(req.id, errors::makeError(JSONRPCErrorCodes::InvalidParams,
                                                 "Unsupported protocol version: " + requested, JSONValue{std::move(data)}));
            return;
        }

        negotiatedVersion = requested;
        transition(SessionState::Initializing);
        lk.unlock();

        ServerCapabilities caps;
        caps.tools = ToolsCapability{};
        JSONValue::Object serverInfo;
        serverInfo["name"] = std::make_shared<JSONValue>(SERVER_NAME);
        serverInfo["version"] = std::make_shared<JSONValue>(getVersionString());
        JSONValue::Object result;
        result["protocolVersion"] = std::make_shared<JSONValue>(requested);
        result["capabilities"] = std::make_shared<JSONValue>(ToJSON(caps));
        result["serverInfo"] = std::make_shared<JSONValue>(std::move(serverInfo));
        reply(req.id, JSONValue{std::move(result)});
    }

    JSONValue listTools() const {
        JSONValue::Array tools;
        for (const auto& def : registry.List()) {
            tools.push_back(std::make_shared<JSONValue>(ToJSON(def.metadata)));
        }
        JSONValue::Object result;
        result["tools"] = std::make_shared<JSONValue>(std::move(tools));
        return JSONValue{std::move(result)};
    }

    void handleCallTool(const JSONRPCRequest& req, std::unique_lock<std::mutex>& lk) {
        const JSONValue* nameVal = req.params.has_value() ? req.params->find("name") : nullptr;
        if (!nameVal || !nameVal->isString()) {
            lk.unlock();
            replyError(req.id, errors::makeError(JSONRPCErrorCodes::InvalidParams, "Missing required parameter: name"));
            return;
        }
        std::optional<JSONValue> arguments;
        if (const JSONValue* a = req.params->find("arguments")) {
            arguments = *a;
        }
        Resolution resolved = registry.Resolve(std::get<std::string>(nameVal->value), arguments, req.id);
        if (resolved.error) {
            lk.unlock();
            replyError(req.id, *resolved.error);
            return;
        }
        Invocation invocation = std::move(*resolved.invocation);
        if (!options.policy->Allows(*invocation.definition)) {
            lk.unlock();
            LOG_WARN("Session {}: {} denied by policy {}", transport->GetSessionId(), invocation.definition->name(),
                     options.policy->Name());
            reply(req.id, ToJSON(TextResult(POLICY_DENIED_MESSAGE, true)));
            return;
        }
        if (inFlight.size() >= options.maxInFlight) {
            lk.unlock();
            JSONValue::Object data;
            data["maxInFlight"] = std::make_shared<JSONValue>(static_cast<int64_t>(options.maxInFlight));
            replyError(req.id, errors::makeError(JSONRPCErrorCodes::ServerBusy,
                                                 "Server busy: too many requests in flight", JSONValue{std::move(data)}));
            return;
        }
        inFlight.insert(idToString(req.id));
        lk.unlock();

        LOG_INFO("Session {}: dispatching {} (id={})", transport->GetSessionId(), invocation.definition->name(),
                 idToString(req.id));
        std::shared_ptr<Session> self = owner->shared_from_this();
        std::thread([self, invocation = std::move(invocation)]() {
            self->pImpl->runInvocation(invocation);
        }).detach();
    }

    void runInvocation(const Invocation& invocation) {
        DispatchResult outcome = registry.Invoke(invocation);
        if (outcome.error) {
            replyError(invocation.requestId, *outcome.error);
        } else {
            reply(invocation.requestId, ToJSON(*outcome.result));
        }
        std::lock_guard<std::mutex> lk(stateMutex);
        inFlight.erase(idToString(invocation.requestId));
        stateCv.notify_all();
    }

    // Blocks until running invocations have replied, the transport closed, or shutdownTimeout elapsed.
    void drainInFlight(const char* why) {
        std::unique_lock<std::mutex> lk(stateMutex);
        const bool drained = stateCv.wait_for(lk, options.shutdownTimeout, [this]() {
            return inFlight.empty() || state == SessionState::Closed;
        });
        if (!drained) {
            LOG_WARN("Session {}: {} timed out with {} invocation(s) still running", transport->GetSessionId(), why,
                     inFlight.size());
        }
    }

    // Waits off the reader thread so pending replies and further requests keep flowing.
    void beginShutdown(const JSONRPCId& id) {
        std::shared_ptr<Session> self = owner->shared_from_this();
        std::thread([self, id]() {
            Impl& impl = *self->pImpl;
            impl.drainInFlight("shutdown");
            impl.reply(id, emptyObject());
            (void)impl.transport->Close();
        }).detach();
    }

    // The peer sent its last request; answer what is still running, then close.
    void onInputEnded() {
        std::shared_ptr<Session> self = owner->shared_from_this();
        std::thread([self]() {
            Impl& impl = *self->pImpl;
            impl.drainInFlight("draining after end of input");
            (void)impl.transport->Close();
        }).detach();
    }

    void onTransportClosed() {
        std::function<void()> handler;
        {
            std::lock_guard<std::mutex> lk(stateMutex);
            if (state == SessionState::Closed) {
                return;
            }
            transition(SessionState::Closed);
            handler = closedHandler;
        }
        if (handler) {
            handler();
        }
    }
};

Session::Session(std::shared_ptr<ITransport> transport, const ToolRegistry& registry, SessionOptions options)
    : pImpl(std::make_unique<Impl>(this, std::move(transport), registry, std::move(options))) {}

std::shared_ptr<Session> Session::Create(std::shared_ptr<ITransport> transport, const ToolRegistry& registry,
                                         SessionOptions options) {
    return std::shared_ptr<Session>(new Session(std::move(transport), registry, std::move(options)));
}

Session::~Session() = default;

void Session::Start() {
    FUNC_SCOPE();
    std::weak_ptr<Session> weak = weak_from_this();
    pImpl->transport->SetMessageHandler([weak](const std::string& payload) {
        if (auto self = weak.lock()) {
            self->pImpl->onPayload(payload);
        }
    });
    pImpl->transport->SetErrorHandler([weak](const std::string& error) {
        if (auto self = weak.lock()) {
            LOG_WARN("Session {}: transport error: {}", self->Id(), error);
        }
    });
    pImpl->transport->SetCloseHandler([weak]() {
        if (auto self = weak.lock()) {
            self->pImpl->onTransportClosed();
        }
    });
    pImpl->transport->SetInputEndedHandler([weak]() {
        if (auto self = weak.lock()) {
            self->pImpl->onInputEnded();
        }
    });
    LOG_INFO("Session {} starting (policy={}, maxInFlight={})", Id(), pImpl->options.policy->Name(),
             pImpl->options.maxInFlight);
    pImpl->transport->Start().get();
}

void Session::Close() {
    FUNC_SCOPE();
    (void)pImpl->transport->Close();
}

void Session::SetClosedHandler(std::function<void()> handler) {
    std::lock_guard<std::mutex> lk(pImpl->stateMutex);
    pImpl->closedHandler = std::move(handler);
}

void Session::HandlePayload(const std::string& payload) {
    pImpl->onPayload(payload);
}

SessionState Session::State() const {
    std::lock_guard<std::mutex> lk(pImpl->stateMutex);
    return pImpl->state;
}

std::optional<std::string> Session::NegotiatedVersion() const {
    std::lock_guard<std::mutex> lk(pImpl->stateMutex);
    return pImpl->negotiatedVersion;
}

std::size_t Session::InFlight() const {
    std::lock_guard<std::mutex> lk(pImpl->stateMutex);
    return pImpl->inFlight.size();
}

std::string Session::Id() const {
    return pImpl->transport->GetSessionId();
}

bool Session::WaitUntilClosed(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lk(pImpl->stateMutex);
    return pImpl->stateCv.wait_for(lk, timeout, [this]() { return pImpl->state == SessionState::Closed; });
}

void SessionTestHooks::markInFlight(Session& s, const JSONRPCId& id) {
    std::lock_guard<std::mutex> lk(s.pImpl->stateMutex);
    s.pImpl->inFlight.insert(idToString(id));
}

void SessionTestHooks::clearInFlight(Session& s, const JSONRPCId& id) {
    std::lock_guard<std::mutex> lk(s.pImpl->stateMutex);
    s.pImpl->inFlight.erase(idToString(id));
    s.pImpl->stateCv.notify_all();
}

} // namespace fileio
