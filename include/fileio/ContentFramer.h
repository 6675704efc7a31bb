//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ContentFramer.h
// Purpose: Message framing for byte-stream transports: Content-Length headers, newline-delimited
//          lines, and an auto-detecting framer that commits to one of the two on first input
//========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <memory>

namespace fileio {

//========================================================================================================
// IContentFramer
// Purpose: Splits a growing byte buffer into discrete payloads and wraps outbound payloads.
// Notes:
//   bytesConsumed bytes at the front of the buffer may always be discarded by the caller, whatever the
//   status. Every status other than Ok and Incomplete is a framing error and is fatal to the connection.
//========================================================================================================
class IContentFramer {
public:
    virtual ~IContentFramer() = default;
    enum class DecodeStatus {
        Ok,
        Incomplete,
        InvalidHeader,
        BodyTooLarge,
        FramingMismatch  // a frame of the other discipline arrived after the connection committed
    };
    struct DecodeResult {
        DecodeStatus status;
        std::optional<std::string> payload; // present when status==Ok
        std::size_t bytesConsumed{0};
    };
    virtual std::string encode(const std::string& payload) = 0;
    virtual std::optional<std::string> tryDecode(std::string& buffer) = 0;
    virtual DecodeResult tryDecodeEx(const std::string& buffer) = 0;
};

// Human readable status name for logs.
const char* DecodeStatusName(IContentFramer::DecodeStatus status);

//========================================================================================================
// FramingDiscipline
// Purpose: State of an auto-detecting framer. Leaves Undetected exactly once.
//========================================================================================================
enum class FramingDiscipline {
    Undetected,
    LengthPrefixed,
    LineDelimited
};

const char* FramingDisciplineName(FramingDiscipline discipline);

//========================================================================================================
// AutoDetectFramer
// Purpose: Peeks at the first non-whitespace bytes of the stream. A line beginning "Content-Length:"
//          (case-insensitive) selects length-prefixed framing, anything else selects line-delimited
//          framing. The choice is fixed for the connection's lifetime.
//========================================================================================================
class AutoDetectFramer : public IContentFramer {
public:
    explicit AutoDetectFramer(std::size_t maxMessageBytes);
    ~AutoDetectFramer() override;

    std::string encode(const std::string& payload) override;
    std::optional<std::string> tryDecode(std::string& buffer) override;
    DecodeResult tryDecodeEx(const std::string& buffer) override;

    FramingDiscipline discipline() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

std::unique_ptr<IContentFramer> MakeContentLengthFramer(std::size_t maxContentLength = 4 * 1024 * 1024);
std::unique_ptr<IContentFramer> MakeLineDelimitedFramer(std::size_t maxLineLength = 4 * 1024 * 1024);
std::unique_ptr<AutoDetectFramer> MakeAutoDetectFramer(std::size_t maxMessageBytes = 4 * 1024 * 1024);

namespace framing {
// True when the bytes at buffer[pos...] start with a Content-Length header name followed by ':'
// (case-insensitive). Partial matches at the end of the buffer report via needMore.
bool startsWithContentLengthHeader(const std::string& buffer, std::size_t pos, bool* needMore = nullptr);

// Index of the first byte that is not a space, tab, CR, or LF at or after pos.
std::size_t skipStreamWhitespace(const std::string& buffer, std::size_t pos);
} // namespace framing

} // namespace fileio
