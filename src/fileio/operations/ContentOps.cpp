//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ContentOps.cpp
// Purpose: Line windowing, writes, and counting
//==========================================================================================================

#include "fileio/operations/ContentOps.h"
#include "fileio/operations/FileAccess.h"
#include "fileio/operations/PathOps.h"
#include "fileio/errors/FileIoError.h"
#include "logging/Logger.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <format>
#include <fcntl.h>
#include <unistd.h>

namespace fileio {
namespace ops {

using errors::ErrorKind;
using errors::FileIoError;

namespace {

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::size_t pos = 0;
    while (pos < text.size()) {
        std::size_t eol = text.find('\n', pos);
        std::size_t end = (eol == std::string::npos) ? text.size() : eol;
        std::size_t len = end - pos;
        if (len > 0 && text[end - 1] == '\r') --len;
        lines.emplace_back(text, pos, len);
        if (eol == std::string::npos) break;
        pos = eol + 1;
    }
    return lines;
}

} // namespace

std::vector<std::string> readLines(const std::string& path, const ReadLinesOptions& options) {
    const std::string expanded = expandPath(path);
    const std::vector<std::string> lines = splitLines(readTextFile(expanded));
    const std::uint64_t total = lines.size();

    std::uint64_t start = 0;
    if (options.startLine.has_value()) {
        if (*options.startLine == 0) {
            throw FileIoError(ErrorKind::InvalidLineNumbers, "Line numbers start at 1");
        }
        start = *options.startLine - 1;
    } else if (options.startOffset.has_value()) {
        start = *options.startOffset;
    }

    std::uint64_t end = total;
    if (options.endLine.has_value()) {
        if (*options.endLine == 0) {
            throw FileIoError(ErrorKind::InvalidLineNumbers, "Line numbers start at 1");
        }
        if (*options.endLine < start + 1) {
            throw FileIoError(ErrorKind::InvalidLineNumbers, "end_line must be >= start_line");
        }
        end = *options.endLine;
    } else if (options.lineCount.has_value()) {
        end = (*options.lineCount > UINT64_MAX - start) ? UINT64_MAX : start + *options.lineCount;
    }

    if (start > total) {
        throw FileIoError(ErrorKind::InvalidLineNumbers,
                          std::format("start_line {} exceeds file length {}", start + 1, total));
    }
    end = std::min(end, total);
    if (start > end) {
        throw FileIoError(ErrorKind::InvalidLineNumbers, "start_line must be <= end_line");
    }
    return std::vector<std::string>(lines.begin() + static_cast<std::ptrdiff_t>(start),
                                    lines.begin() + static_cast<std::ptrdiff_t>(end));
}

void writeFile(const std::string& path, const std::string& content, bool append) {
    const std::string expanded = expandPath(path);
    if (!append) {
        writeFileAtomic(expanded, content);
        return;
    }
    ensureParentDirectories(expanded);
    int fd = ::open(expanded.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw errors::fromErrno(errno, "open for append", expanded);
    }
    std::size_t off = 0;
    int writeErr = 0;
    while (off < content.size()) {
        ssize_t n = ::write(fd, content.data() + off, content.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            writeErr = errno;
            break;
        }
        off += static_cast<std::size_t>(n);
    }
    ::close(fd);
    if (writeErr != 0) {
        throw errors::fromErrno(writeErr, "append to", expanded);
    }
}

std::uint64_t countLinesInText(const std::string& text) {
    if (text.empty()) {
        return 0;
    }
    std::uint64_t n = 0;
    for (char c : text) {
        if (c == '\n') ++n;
    }
    if (text.back() != '\n') ++n;
    return n;
}

std::uint64_t countWordsInText(const std::string& text) {
    std::uint64_t words = 0;
    bool inWord = false;
    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            inWord = false;
        } else if (!inWord) {
            inWord = true;
            ++words;
        }
    }
    return words;
}

std::vector<PathResult> countLines(const std::vector<std::string>& paths) {
    return collectPathResults(paths, {"lines"}, [](const std::string& path) {
        const std::string text = readTextFile(expandPath(path));
        return PathResult::Ok(path).with("lines", JSONValue(static_cast<int64_t>(countLinesInText(text))));
    });
}

std::vector<PathResult> countWords(const std::vector<std::string>& paths) {
    return collectPathResults(paths, {"words"}, [](const std::string& path) {
        const std::string text = readTextFile(expandPath(path));
        return PathResult::Ok(path).with("words", JSONValue(static_cast<int64_t>(countWordsInText(text))));
    });
}

} // namespace ops
} // namespace fileio
