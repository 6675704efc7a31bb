//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: LineDelimitedFramer.cpp
// Purpose: Newline-delimited framing: one JSON document per line, blank lines ignored
//========================================================================================================

#include <optional>
#include <string>

#include "logging/Logger.h"
#include "fileio/ContentFramer.h"

namespace fileio {

namespace {
class LineDelimitedFramer : public IContentFramer {
public:
    explicit LineDelimitedFramer(std::size_t maxLen) : maxLineLength(maxLen) {}

    std::string encode(const std::string& payload) override {
        // Serialized JSON never carries a raw newline, so the payload is a single line
        std::string frame; frame.reserve(payload.size() + 1);
        frame.append(payload);
        frame.push_back('\n');
        return frame;
    }

    DecodeResult tryDecodeEx(const std::string& buffer) override {
        std::size_t pos = 0;
        while (true) {
            const std::size_t lineStart = framing::skipStreamWhitespace(buffer, pos);
            if (lineStart >= buffer.size()) {
                return { DecodeStatus::Incomplete, std::nullopt, lineStart };
            }

            // A header line here means the peer switched to Content-Length framing
            bool needMore = false;
            if (framing::startsWithContentLengthHeader(buffer, lineStart, &needMore)) {
                LOG_WARN("Content-Length header received on a line-delimited stream");
                std::size_t eol = buffer.find('\n', lineStart);
                return { DecodeStatus::FramingMismatch, std::nullopt, eol == std::string::npos ? 0 : eol + 1 };
            }

            std::size_t eol = buffer.find('\n', lineStart);
            if (eol == std::string::npos) {
                if (buffer.size() - lineStart > maxLineLength) {
                    LOG_WARN("Line exceeds maximum length {}", maxLineLength);
                    return { DecodeStatus::BodyTooLarge, std::nullopt, buffer.size() };
                }
                return { DecodeStatus::Incomplete, std::nullopt, lineStart };
            }

            std::string line = buffer.substr(lineStart, eol - lineStart);
            while (!line.empty() && (line.back() == '\r' || line.back() == ' ' || line.back() == '\t')) {
                line.pop_back();
            }
            pos = eol + 1;
            if (line.empty()) {
                continue;
            }
            if (line.size() > maxLineLength) {
                LOG_WARN("Line of {} bytes exceeds maximum length {}", line.size(), maxLineLength);
                return { DecodeStatus::BodyTooLarge, std::nullopt, pos };
            }
            return { DecodeStatus::Ok, std::make_optional(std::move(line)), pos };
        }
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
    std::size_t maxLineLength;
};
} // namespace

std::unique_ptr<IContentFramer> MakeLineDelimitedFramer(std::size_t maxLineLength) {
    return std::make_unique<LineDelimitedFramer>(maxLineLength);
}

} // namespace fileio
