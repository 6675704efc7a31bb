//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: PathOps.cpp
// Purpose: Path expansion and path utility operations
//==========================================================================================================

#include "fileio/operations/PathOps.h"
#include "fileio/errors/FileIoError.h"
#include "env/EnvVars.h"
#include "logging/Logger.h"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <vector>
#include <unistd.h>

namespace fileio {
namespace ops {

namespace fs = std::filesystem;
using errors::ErrorKind;
using errors::FileIoError;

namespace {

bool isVarChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

std::string lookupVariable(const std::string& name, const std::string& original) {
    const char* v = std::getenv(name.c_str());
    if (v == nullptr) {
        throw FileIoError(ErrorKind::InvalidPath,
                          std::format("Failed to expand path '{}': environment variable {} is not set", original, name));
    }
    return std::string(v);
}

} // namespace

std::string expandPath(const std::string& path) {
    std::string out;
    out.reserve(path.size());
    std::size_t i = 0;
    if (!path.empty() && path[0] == '~' && (path.size() == 1 || path[1] == '/')) {
        const std::string home = GetEnvOrDefault("HOME", std::string());
        if (home.empty()) {
            throw FileIoError(ErrorKind::InvalidPath, std::format("Failed to expand path '{}': HOME is not set", path));
        }
        out = home;
        i = 1;
    }
    while (i < path.size()) {
        char c = path[i];
        if (c != '$' || i + 1 >= path.size()) {
            out.push_back(c);
            ++i;
            continue;
        }
        if (path[i + 1] == '{') {
            std::size_t close = path.find('}', i + 2);
            if (close == std::string::npos) {
                throw FileIoError(ErrorKind::InvalidPath, std::format("Failed to expand path '{}': unterminated ${{", path));
            }
            out += lookupVariable(path.substr(i + 2, close - i - 2), path);
            i = close + 1;
        } else if (isVarChar(path[i + 1])) {
            std::size_t end = i + 1;
            while (end < path.size() && isVarChar(path[end])) ++end;
            out += lookupVariable(path.substr(i + 1, end - i - 1), path);
            i = end;
        } else {
            out.push_back(c);
            ++i;
        }
    }
    return out;
}

std::string basename(const std::string& path) {
    const std::string expanded = expandPath(path);
    fs::path p(expanded);
    // "/usr/bin/" has an empty filename; strip the trailing separator first
    if (!p.has_filename() && p.has_parent_path() && p != p.root_path()) {
        p = p.parent_path();
    }
    fs::path name = p.filename();
    if (name.empty() || name == "." || name == "..") {
        throw FileIoError(ErrorKind::InvalidPath, std::format("Path has no file name component: {}", path));
    }
    return name.string();
}

std::string dirname(const std::string& path) {
    const std::string expanded = expandPath(path);
    fs::path p(expanded);
    if (!p.has_filename() && p.has_parent_path() && p != p.root_path()) {
        p = p.parent_path();
    }
    return p.parent_path().string();
}

std::string canonicalPath(const std::string& path) {
    const std::string expanded = expandPath(path);
    std::error_code ec;
    fs::path resolved = fs::canonical(expanded, ec);
    if (ec) {
        throw errors::fromErrorCode(ec, "resolve", expanded, errors::IoDirection::Read);
    }
    return resolved.string();
}

std::string readSymbolicLink(const std::string& path) {
    const std::string expanded = expandPath(path);
    std::error_code ec;
    fs::file_status st = fs::symlink_status(expanded, ec);
    if (ec || !fs::exists(st)) {
        throw FileIoError(ErrorKind::NotFound, std::format("File not found: {}", expanded));
    }
    if (!fs::is_symlink(st)) {
        throw FileIoError(ErrorKind::InvalidPath, std::format("Path is not a symbolic link: {}", expanded));
    }
    fs::path target = fs::read_symlink(expanded, ec);
    if (ec) {
        throw errors::fromErrorCode(ec, "read link", expanded, errors::IoDirection::Read);
    }
    return target.string();
}

std::string currentDirectory() {
    std::error_code ec;
    fs::path cwd = fs::current_path(ec);
    if (ec) {
        throw errors::fromErrorCode(ec, "get current directory", ".", errors::IoDirection::Read);
    }
    return cwd.string();
}

std::string createTemporary(TempKind kind, const std::optional<std::string>& directory) {
    fs::path base;
    if (directory.has_value() && !directory->empty()) {
        base = expandPath(*directory);
        std::error_code ec;
        if (!fs::is_directory(base, ec)) {
            throw FileIoError(ErrorKind::NotFound, std::format("Directory not found: {}", base.string()));
        }
    } else {
        std::error_code ec;
        base = fs::temp_directory_path(ec);
        if (ec) {
            throw errors::fromErrorCode(ec, "locate temporary directory", "TMPDIR");
        }
    }

    std::string pattern = (base / "fileio-XXXXXX").string();
    std::vector<char> buf(pattern.begin(), pattern.end());
    buf.push_back('\0');
    if (kind == TempKind::File) {
        int fd = ::mkstemp(buf.data());
        if (fd < 0) {
            throw errors::fromErrno(errno, "create temporary file in", base.string());
        }
        ::close(fd);
    } else {
        if (::mkdtemp(buf.data()) == nullptr) {
            throw errors::fromErrno(errno, "create temporary directory in", base.string());
        }
    }
    std::string created(buf.data());
    LOG_DEBUG("Created temporary {}: {}", kind == TempKind::File ? "file" : "directory", created);
    return created;
}

} // namespace ops
} // namespace fileio
