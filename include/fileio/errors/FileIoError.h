//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: FileIoError.h
// Purpose: Domain error taxonomy for filesystem operations and the OS error mapping into it
//==========================================================================================================

#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

namespace fileio {
namespace errors {

//==========================================================================================================
// ErrorKind
// Purpose: Domain-level failure kinds. Multi-path operations report these inside PathResult entries
//          as "error: <Kind>"; single-target operations surface them as isError tool results.
//==========================================================================================================
enum class ErrorKind {
    NotFound,
    PermissionDenied,
    AlreadyExists,
    NotEmpty,
    CrossDevice,
    Unsupported,
    InvalidPath,
    InvalidMode,
    ReadError,
    WriteError,
    InvalidLineNumbers,
    RegexError
};

// Stable tag used in status strings and error text.
std::string_view errorKindName(ErrorKind kind);

//==========================================================================================================
// FileIoError
// Purpose: Exception carrying an ErrorKind and a human-readable detail. Thrown by operation bodies and
//          caught per path (multi-path tools) or per call (single-target tools).
//==========================================================================================================
class FileIoError : public std::runtime_error {
public:
    FileIoError(ErrorKind kind, const std::string& detail)
        : std::runtime_error(detail), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

    // "<Kind>: <detail>"
    std::string describe() const;

private:
    ErrorKind kind_;
};

// Direction of the failing OS call; selects ReadError vs WriteError for unmapped codes.
enum class IoDirection { Read, Write };

//==========================================================================================================
// fromErrorCode
// Purpose: Map an OS error to a FileIoError.
// Args:
//   ec: std::error_code from std::filesystem or errno.
//   operation: Short verb phrase for the detail text ("remove", "read metadata", ...).
//   path: Path the operation targeted.
//   direction: Used only when ec has no specific kind.
//==========================================================================================================
FileIoError fromErrorCode(const std::error_code& ec, const std::string& operation,
                          const std::string& path, IoDirection direction = IoDirection::Write);

// Same mapping driven by a raw errno value.
FileIoError fromErrno(int err, const std::string& operation, const std::string& path,
                      IoDirection direction = IoDirection::Write);

//==========================================================================================================
// ToolParamError
// Purpose: Raised by a tool handler when an argument passes schema validation but is still unusable
//          (bad octal mode, unknown edit op). Reported as a JSON-RPC InvalidParams error.
//==========================================================================================================
class ToolParamError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

} // namespace errors
} // namespace fileio
