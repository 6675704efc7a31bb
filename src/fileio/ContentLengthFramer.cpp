//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ContentLengthFramer.cpp
// Purpose: Content-Length header framing (header block, blank line, exact payload bytes)
//========================================================================================================

#include <algorithm>
#include <cctype>
#include <limits>
#include <optional>
#include <string>

#include "logging/Logger.h"
#include "fileio/ContentFramer.h"

namespace fileio {

namespace framing {

std::size_t skipStreamWhitespace(const std::string& buffer, std::size_t pos) {
    while (pos < buffer.size()) {
        char c = buffer[pos];
        if (c == ' ' || c == '\t' || c == '\r' || c == '\n') { ++pos; } else { break; }
    }
    return pos;
}

bool startsWithContentLengthHeader(const std::string& buffer, std::size_t pos, bool* needMore) {
    static const std::string kName = "content-length";
    if (needMore) *needMore = false;
    std::size_t k = 0;
    for (; k < kName.size(); ++k) {
        if (pos + k >= buffer.size()) {
            if (needMore) *needMore = true;
            return false;
        }
        char c = static_cast<char>(std::tolower(static_cast<unsigned char>(buffer[pos + k])));
        if (c != kName[k]) {
            return false;
        }
    }
    // Optional blanks before the colon are tolerated
    std::size_t p = pos + k;
    while (p < buffer.size() && (buffer[p] == ' ' || buffer[p] == '\t')) ++p;
    if (p >= buffer.size()) {
        if (needMore) *needMore = true;
        return false;
    }
    return buffer[p] == ':';
}

} // namespace framing

const char* DecodeStatusName(IContentFramer::DecodeStatus status) {
    switch (status) {
        case IContentFramer::DecodeStatus::Ok: return "Ok";
        case IContentFramer::DecodeStatus::Incomplete: return "Incomplete";
        case IContentFramer::DecodeStatus::InvalidHeader: return "InvalidHeader";
        case IContentFramer::DecodeStatus::BodyTooLarge: return "BodyTooLarge";
        case IContentFramer::DecodeStatus::FramingMismatch: return "FramingMismatch";
    }
    return "Unknown";
}

namespace {

// Upper bound on a header block; a peer that never sends the blank line is cut off here.
constexpr std::size_t kMaxHeaderBytes = 8 * 1024;

bool isHeaderNameChar(unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '_';
}

class ContentLengthFramer : public IContentFramer {
public:
    explicit ContentLengthFramer(std::size_t maxLen) : maxContentLength(maxLen) {}

    std::string encode(const std::string& payload) override {
        std::string header = "Content-Length: " + std::to_string(payload.size()) + "\r\n\r\n";
        std::string frame; frame.reserve(header.size() + payload.size());
        frame.append(header);
        frame.append(payload);
        return frame;
    }

    DecodeResult tryDecodeEx(const std::string& buffer) override {
        // Whitespace between frames (stray CRLF after a body) is dropped
        const std::size_t frameStart = framing::skipStreamWhitespace(buffer, 0);
        if (frameStart >= buffer.size()) {
            return { DecodeStatus::Incomplete, std::nullopt, frameStart };
        }

        // A JSON document where a header block belongs means the peer switched to line framing
        if (buffer[frameStart] == '{' || buffer[frameStart] == '[') {
            std::size_t eol = buffer.find('\n', frameStart);
            LOG_WARN("Line-delimited message received on a length-prefixed stream");
            return { DecodeStatus::FramingMismatch, std::nullopt, eol == std::string::npos ? 0 : eol + 1 };
        }

        std::size_t pos = frameStart;
        std::size_t contentLength = 0;
        bool haveLength = false;
        while (true) {
            std::size_t eol = buffer.find('\n', pos);
            if (eol == std::string::npos) {
                if (buffer.size() - frameStart > kMaxHeaderBytes) {
                    LOG_WARN("Header block exceeds {} bytes without terminator", kMaxHeaderBytes);
                    return { DecodeStatus::InvalidHeader, std::nullopt, buffer.size() };
                }
                return { DecodeStatus::Incomplete, std::nullopt, frameStart };
            }
            std::string line = buffer.substr(pos, eol - pos);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            pos = eol + 1;
            if (pos - frameStart > kMaxHeaderBytes) {
                LOG_WARN("Header block exceeds {} bytes", kMaxHeaderBytes);
                return { DecodeStatus::InvalidHeader, std::nullopt, pos };
            }
            if (line.empty()) {
                break; // end of header block
            }

            auto colon = line.find(':');
            if (colon == std::string::npos || colon == 0) {
                LOG_WARN("Malformed header line: {}", line);
                return { DecodeStatus::InvalidHeader, std::nullopt, pos };
            }
            std::string name = line.substr(0, colon);
            while (!name.empty() && (name.back() == ' ' || name.back() == '\t')) name.pop_back();
            if (name.empty() || !std::all_of(name.begin(), name.end(), [](unsigned char c){ return isHeaderNameChar(c); })) {
                LOG_WARN("Malformed header name: {}", name);
                return { DecodeStatus::InvalidHeader, std::nullopt, pos };
            }
            std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
            if (name != "content-length") {
                continue; // Content-Type and friends are accepted and ignored
            }
            std::string value = line.substr(colon + 1);
            value.erase(value.begin(), std::find_if(value.begin(), value.end(), [](unsigned char ch){ return !std::isspace(ch); }));
            value.erase(std::find_if(value.rbegin(), value.rend(), [](unsigned char ch){ return !std::isspace(ch); }).base(), value.end());
            if (value.empty() || value.size() > 19 ||
                !std::all_of(value.begin(), value.end(), [](unsigned char c){ return std::isdigit(c); })) {
                LOG_WARN("Invalid Content-Length header: {}", value);
                return { DecodeStatus::InvalidHeader, std::nullopt, pos };
            }
            unsigned long long v64 = std::stoull(value);
            if (v64 > maxContentLength || v64 > std::numeric_limits<std::size_t>::max()) {
                LOG_WARN("Content-Length {} exceeds limits (max={})", v64, maxContentLength);
                return { DecodeStatus::BodyTooLarge, std::nullopt, pos };
            }
            if (haveLength && contentLength != static_cast<std::size_t>(v64)) {
                LOG_WARN("Conflicting Content-Length headers");
                return { DecodeStatus::InvalidHeader, std::nullopt, pos };
            }
            contentLength = static_cast<std::size_t>(v64);
            haveLength = true;
        }

        if (!haveLength) {
            LOG_WARN("Missing Content-Length header");
            return { DecodeStatus::InvalidHeader, std::nullopt, pos };
        }

        const std::size_t headerAndSep = pos;
        if (buffer.size() - headerAndSep < contentLength) {
            return { DecodeStatus::Incomplete, std::nullopt, frameStart };
        }

        std::string payload = buffer.substr(headerAndSep, contentLength);
        return { DecodeStatus::Ok, std::make_optional(std::move(payload)), headerAndSep + contentLength };
    }

    std::optional<std::string> tryDecode(std::string& buffer) override {
        DecodeResult r = tryDecodeEx(buffer);
        if (r.bytesConsumed > 0 && r.bytesConsumed <= buffer.size()) {
            buffer.erase(0, r.bytesConsumed);
        }
        if (r.status == DecodeStatus::Ok && r.payload.has_value()) {
            return r.payload;
        }
        return std::nullopt;
    }

private:
    std::size_t maxContentLength;
};
} // namespace

std::unique_ptr<IContentFramer> MakeContentLengthFramer(std::size_t maxContentLength) {
    return std::make_unique<ContentLengthFramer>(maxContentLength);
}

} // namespace fileio
