//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MessageCodec.cpp
// Purpose: JSON-RPC 2.0 envelope validation
//==========================================================================================================

#include "fileio/MessageCodec.h"
#include "logging/Logger.h"

namespace fileio {

MessageKind kindOf(const Message& message) {
    if (std::holds_alternative<JSONRPCRequest>(message)) return MessageKind::Request;
    if (std::holds_alternative<JSONRPCNotification>(message)) return MessageKind::Notification;
    return std::get<JSONRPCResponse>(message).IsError() ? MessageKind::ErrorResponse : MessageKind::Response;
}

namespace {

DecodeOutcome invalid(std::string message, JSONRPCId id = nullptr) {
    DecodeOutcome out;
    out.error = errors::makeError(JSONRPCErrorCodes::InvalidRequest, std::move(message));
    out.id = std::move(id);
    return out;
}

// Ids are strings or numbers. Anything else is not a usable correlation id.
std::optional<JSONRPCId> extractId(const JSONValue& v) {
    if (const auto* s = std::get_if<std::string>(&v.value)) {
        return JSONRPCId{*s};
    }
    if (const auto* n = std::get_if<int64_t>(&v.value)) {
        return JSONRPCId{*n};
    }
    if (const auto* d = std::get_if<double>(&v.value)) {
        return JSONRPCId{*d};
    }
    return std::nullopt;
}

} // namespace

DecodeOutcome MessageCodec::Decode(const std::string& payload) {
    JSONValue doc;
    try {
        doc = parseJSON(payload);
    } catch (const JSONParseError& e) {
        LOG_WARN("Parse error: {}", e.what());
        DecodeOutcome out;
        out.error = errors::makeError(JSONRPCErrorCodes::ParseError, "Parse error", JSONValue(std::string(e.what())));
        return out;
    }

    if (doc.isArray()) {
        return invalid("Invalid Request: batch messages are not supported");
    }
    if (!doc.isObject()) {
        return invalid("Invalid Request: message must be a JSON object");
    }

    const JSONValue* idVal = doc.find("id");
    const JSONValue* methodVal = doc.find("method");
    const JSONValue* resultVal = doc.find("result");
    const JSONValue* errorVal = doc.find("error");
    const JSONValue* paramsVal = doc.find("params");

    std::optional<JSONRPCId> id;
    if (idVal) {
        id = extractId(*idVal);
    }
    const JSONRPCId correlation = id.has_value() ? *id : JSONRPCId{nullptr};

    const JSONValue* version = doc.find("jsonrpc");
    if (!version || !version->isString() || std::get<std::string>(version->value) != "2.0") {
        return invalid("Invalid Request: jsonrpc must be \"2.0\"", correlation);
    }

    if (methodVal) {
        if (idVal && !id.has_value()) {
            // null, object, array, and bool ids are rejected
            return invalid("Invalid Request: id must be a string or number");
        }
        if (!methodVal->isString() || std::get<std::string>(methodVal->value).empty()) {
            DecodeOutcome out = invalid("Invalid Request: method must be a non-empty string", correlation);
            out.replyExpected = idVal != nullptr;
            return out;
        }
        if (resultVal || errorVal) {
            DecodeOutcome out = invalid("Invalid Request: method cannot be combined with result or error", correlation);
            out.replyExpected = idVal != nullptr;
            return out;
        }
        std::optional<JSONValue> params;
        if (paramsVal) {
            if (!paramsVal->isObject() && !paramsVal->isArray()) {
                DecodeOutcome out = invalid("Invalid Request: params must be an object or array", correlation);
                out.replyExpected = idVal != nullptr;
                return out;
            }
            params = *paramsVal;
        }
        const std::string& method = std::get<std::string>(methodVal->value);
        DecodeOutcome out;
        if (id.has_value()) {
            out.message = Message{JSONRPCRequest(*id, method, std::move(params))};
        } else {
            out.message = Message{JSONRPCNotification(method, std::move(params))};
        }
        out.id = correlation;
        return out;
    }

    // No method: this must be a response to a request we sent
    if (resultVal && errorVal) {
        DecodeOutcome out = invalid("Invalid Request: response cannot carry both result and error", correlation);
        out.replyExpected = false;
        return out;
    }
    if (!resultVal && !errorVal) {
        return invalid("Invalid Request: missing method", correlation);
    }
    if (!idVal || (!id.has_value() && !idVal->isNull())) {
        DecodeOutcome out = invalid("Invalid Request: response id must be a string, number, or null");
        out.replyExpected = false;
        return out;
    }
    JSONRPCResponse response;
    response.id = correlation;
    if (resultVal) {
        response.result = *resultVal;
    } else {
        if (!errors::mcpErrorFromErrorValue(*errorVal).has_value()) {
            DecodeOutcome out = invalid("Invalid Request: malformed error object", correlation);
            out.replyExpected = false;
            return out;
        }
        response.error = *errorVal;
    }
    DecodeOutcome out;
    out.message = Message{std::move(response)};
    out.id = correlation;
    return out;
}

std::string MessageCodec::Encode(const Message& message) {
    return std::visit([](const auto& m) { return m.Serialize(); }, message);
}

} // namespace fileio
