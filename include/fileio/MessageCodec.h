//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MessageCodec.h
// Purpose: Decode framed payloads into JSON-RPC messages with envelope validation, and encode them back
//==========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <variant>

#include "fileio/JSONRPCTypes.h"
#include "fileio/errors/Errors.h"

namespace fileio {

// Tagged union of everything that can travel over a session.
// JSONRPCResponse covers both Response and ErrorResponse; see MessageKind.
using Message = std::variant<JSONRPCRequest, JSONRPCNotification, JSONRPCResponse>;

enum class MessageKind {
    Request,
    Notification,
    Response,
    ErrorResponse
};

MessageKind kindOf(const Message& message);

//==========================================================================================================
// DecodeOutcome
// Purpose: Result of decoding one payload.
// Fields:
//   message: Set when the payload is a well-formed envelope.
//   error: Set otherwise (ParseError or InvalidRequest).
//   id: Correlation id for the error response; null when no usable id could be extracted.
//   replyExpected: False when the failing payload was recognizably a notification or response, in which
//                  case no error reply may be sent.
//==========================================================================================================
struct DecodeOutcome {
    std::optional<Message> message;
    std::optional<errors::McpError> error;
    JSONRPCId id{nullptr};
    bool replyExpected{true};
};

class MessageCodec {
public:
    static DecodeOutcome Decode(const std::string& payload);
    static std::string Encode(const Message& message);
};

} // namespace fileio
