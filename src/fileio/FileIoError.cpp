//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: FileIoError.cpp
// Purpose: ErrorKind names and errno classification
//==========================================================================================================

#include "fileio/errors/FileIoError.h"

#include <cerrno>
#include <format>

namespace fileio {
namespace errors {

std::string_view errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotFound: return "NotFound";
        case ErrorKind::PermissionDenied: return "PermissionDenied";
        case ErrorKind::AlreadyExists: return "AlreadyExists";
        case ErrorKind::NotEmpty: return "NotEmpty";
        case ErrorKind::CrossDevice: return "CrossDevice";
        case ErrorKind::Unsupported: return "Unsupported";
        case ErrorKind::InvalidPath: return "InvalidPath";
        case ErrorKind::InvalidMode: return "InvalidMode";
        case ErrorKind::ReadError: return "ReadError";
        case ErrorKind::WriteError: return "WriteError";
        case ErrorKind::InvalidLineNumbers: return "InvalidLineNumbers";
        case ErrorKind::RegexError: return "RegexError";
    }
    return "Unknown";
}

std::string FileIoError::describe() const {
    return std::format("{}: {}", errorKindName(kind_), what());
}

FileIoError fromErrno(int err, const std::string& operation, const std::string& path, IoDirection direction) {
    const std::string reason = std::generic_category().message(err);
    switch (err) {
        case ENOENT:
            return FileIoError(ErrorKind::NotFound, std::format("File not found: {}", path));
        case EACCES:
        case EPERM:
            return FileIoError(ErrorKind::PermissionDenied,
                               std::format("Permission denied: cannot {} {}", operation, path));
        case EEXIST:
            return FileIoError(ErrorKind::AlreadyExists, std::format("Path already exists: {}", path));
        case ENOTEMPTY:
            return FileIoError(ErrorKind::NotEmpty, std::format("Directory is not empty: {}", path));
        case EXDEV:
            return FileIoError(ErrorKind::CrossDevice,
                               std::format("Cannot {} {} across filesystems", operation, path));
        case ENOTSUP:
#if defined(EOPNOTSUPP) && EOPNOTSUPP != ENOTSUP
        case EOPNOTSUPP:
#endif
            return FileIoError(ErrorKind::Unsupported,
                               std::format("Operation not supported: cannot {} {}", operation, path));
        case ENOTDIR:
        case EISDIR:
        case EINVAL:
        case ENAMETOOLONG:
        case ELOOP:
            return FileIoError(ErrorKind::InvalidPath,
                               std::format("Failed to {} {}: {}", operation, path, reason));
        default:
            break;
    }
    return FileIoError(direction == IoDirection::Read ? ErrorKind::ReadError : ErrorKind::WriteError,
                       std::format("Failed to {} {}: {}", operation, path, reason));
}

FileIoError fromErrorCode(const std::error_code& ec, const std::string& operation,
                          const std::string& path, IoDirection direction) {
    // std::filesystem reports system_category codes on POSIX, which share errno values
    return fromErrno(ec.value(), operation, path, direction);
}

} // namespace errors
} // namespace fileio
