//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: FileAccess.cpp
// Purpose: File read/write primitives over POSIX descriptors
//==========================================================================================================

#include "fileio/operations/FileAccess.h"
#include "fileio/errors/FileIoError.h"
#include "logging/Logger.h"

#include <cerrno>
#include <filesystem>
#include <format>
#include <vector>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fileio {
namespace ops {

namespace fs = std::filesystem;
using errors::ErrorKind;
using errors::FileIoError;
using errors::IoDirection;

namespace {

// Closes the descriptor on scope exit.
struct FdGuard {
    int fd{-1};
    explicit FdGuard(int f) : fd(f) {}
    ~FdGuard() { if (fd >= 0) ::close(fd); }
    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;
    int release() { int f = fd; fd = -1; return f; }
};

void writeAll(int fd, const std::string& content, const std::string& path) {
    std::size_t off = 0;
    while (off < content.size()) {
        ssize_t n = ::write(fd, content.data() + off, content.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw errors::fromErrno(errno, "write", path, IoDirection::Write);
        }
        off += static_cast<std::size_t>(n);
    }
}

} // namespace

std::string readTextFile(const std::string& expandedPath) {
    struct stat st{};
    if (::stat(expandedPath.c_str(), &st) != 0) {
        throw errors::fromErrno(errno, "read", expandedPath, IoDirection::Read);
    }
    if (!S_ISREG(st.st_mode)) {
        throw FileIoError(ErrorKind::InvalidPath, std::format("Not a regular file: {}", expandedPath));
    }
    int fd = ::open(expandedPath.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        throw errors::fromErrno(errno, "open", expandedPath, IoDirection::Read);
    }
    FdGuard guard(fd);
    std::string content;
    content.reserve(static_cast<std::size_t>(st.st_size));
    std::vector<char> buf(64 * 1024);
    while (true) {
        ssize_t n = ::read(fd, buf.data(), buf.size());
        if (n < 0) {
            if (errno == EINTR) continue;
            throw errors::fromErrno(errno, "read", expandedPath, IoDirection::Read);
        }
        if (n == 0) break;
        content.append(buf.data(), static_cast<std::size_t>(n));
    }
    return content;
}

void ensureParentDirectories(const std::string& expandedPath) {
    fs::path parent = fs::path(expandedPath).parent_path();
    if (parent.empty()) {
        return;
    }
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) {
        throw errors::fromErrorCode(ec, "create parent directories for", expandedPath);
    }
}

void writeFileAtomic(const std::string& expandedPath, const std::string& content) {
    ensureParentDirectories(expandedPath);

    struct stat existing{};
    const bool hadFile = ::stat(expandedPath.c_str(), &existing) == 0;
    if (hadFile && S_ISDIR(existing.st_mode)) {
        throw FileIoError(ErrorKind::InvalidPath, std::format("Path is a directory: {}", expandedPath));
    }

    fs::path target(expandedPath);
    fs::path dir = target.parent_path();
    std::string pattern = (dir.empty() ? fs::path(".") : dir).string() + "/." + target.filename().string() + ".tmp.XXXXXX";
    std::vector<char> tmpName(pattern.begin(), pattern.end());
    tmpName.push_back('\0');
    int fd = ::mkstemp(tmpName.data());
    if (fd < 0) {
        throw errors::fromErrno(errno, "create temporary file for", expandedPath);
    }
    const std::string tmpPath(tmpName.data());
    try {
        FdGuard guard(fd);
        writeAll(fd, content, expandedPath);
        const mode_t mode = hadFile ? (existing.st_mode & 07777) : static_cast<mode_t>(0644);
        if (::fchmod(fd, mode) != 0) {
            throw errors::fromErrno(errno, "set permissions on", expandedPath);
        }
        if (::fsync(fd) != 0) {
            throw errors::fromErrno(errno, "sync", expandedPath);
        }
        if (::close(guard.release()) != 0) {
            throw errors::fromErrno(errno, "close", expandedPath);
        }
        if (::rename(tmpPath.c_str(), expandedPath.c_str()) != 0) {
            throw errors::fromErrno(errno, "rename temporary file onto", expandedPath);
        }
    } catch (const FileIoError&) {
        ::unlink(tmpPath.c_str());
        throw;
    }
}

} // namespace ops
} // namespace fileio
