//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: AutoDetectFramer.cpp
// Purpose: Framing discipline detection on the first message of a stream
//========================================================================================================

#include <mutex>

#include "logging/Logger.h"
#include "fileio/ContentFramer.h"

namespace fileio {

const char* FramingDisciplineName(FramingDiscipline discipline) {
    switch (discipline) {
        case FramingDiscipline::Undetected: return "undetected";
        case FramingDiscipline::LengthPrefixed: return "length-prefixed";
        case FramingDiscipline::LineDelimited: return "line-delimited";
    }
    return "unknown";
}

class AutoDetectFramer::Impl {
public:
    explicit Impl(std::size_t maxBytes) : maxMessageBytes(maxBytes) {}

    // Commits when enough bytes are present; returns false while the first bytes are ambiguous.
    bool detect(const std::string& buffer) {
        const std::size_t start = framing::skipStreamWhitespace(buffer, 0);
        if (start >= buffer.size()) {
            return false;
        }
        bool needMore = false;
        if (framing::startsWithContentLengthHeader(buffer, start, &needMore)) {
            commit(FramingDiscipline::LengthPrefixed);
            return true;
        }
        if (needMore) {
            // Could still become "Content-Length:"; a newline settles it as a plain line
            if (buffer.find('\n', start) == std::string::npos) {
                return false;
            }
        }
        commit(FramingDiscipline::LineDelimited);
        return true;
    }

    void commit(FramingDiscipline d) {
        std::lock_guard<std::mutex> lock(mtx);
        discipline = d;
        inner = (d == FramingDiscipline::LengthPrefixed) ? MakeContentLengthFramer(maxMessageBytes)
                                                          : MakeLineDelimitedFramer(maxMessageBytes);
        LOG_INFO("Framing detected: {}", FramingDisciplineName(d));
    }

    std::size_t maxMessageBytes;
    mutable std::mutex mtx;
    FramingDiscipline discipline{FramingDiscipline::Undetected};
    std::unique_ptr<IContentFramer> inner;
    std::unique_ptr<IContentFramer> fallbackEncoder; // used only before detection
};

AutoDetectFramer::AutoDetectFramer(std::size_t maxMessageBytes)
    : pImpl(std::make_unique<Impl>(maxMessageBytes)) {}

AutoDetectFramer::~AutoDetectFramer() = default;

std::string AutoDetectFramer::encode(const std::string& payload) {
    std::lock_guard<std::mutex> lock(pImpl->mtx);
    if (pImpl->inner) {
        return pImpl->inner->encode(payload);
    }
    if (!pImpl->fallbackEncoder) {
        pImpl->fallbackEncoder = MakeLineDelimitedFramer(pImpl->maxMessageBytes);
    }
    return pImpl->fallbackEncoder->encode(payload);
}

IContentFramer::DecodeResult AutoDetectFramer::tryDecodeEx(const std::string& buffer) {
    if (!pImpl->inner) {
        if (!pImpl->detect(buffer)) {
            if (buffer.size() > pImpl->maxMessageBytes) {
                return { DecodeStatus::BodyTooLarge, std::nullopt, buffer.size() };
            }
            return { DecodeStatus::Incomplete, std::nullopt, 0 };
        }
    }
    return pImpl->inner->tryDecodeEx(buffer);
}

std::optional<std::string> AutoDetectFramer::tryDecode(std::string& buffer) {
    DecodeResult r = tryDecodeEx(buffer);
    if (r.bytesConsumed > 0 && r.bytesConsumed <= buffer.size()) {
        buffer.erase(0, r.bytesConsumed);
    }
    if (r.status == DecodeStatus::Ok && r.payload.has_value()) {
        return r.payload;
    }
    return std::nullopt;
}

FramingDiscipline AutoDetectFramer::discipline() const {
    std::lock_guard<std::mutex> lock(pImpl->mtx);
    return pImpl->discipline;
}

std::unique_ptr<AutoDetectFramer> MakeAutoDetectFramer(std::size_t maxMessageBytes) {
    return std::make_unique<AutoDetectFramer>(maxMessageBytes);
}

} // namespace fileio
