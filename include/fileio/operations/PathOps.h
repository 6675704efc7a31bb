//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: PathOps.h
// Purpose: Path expansion and single-path utilities (basename, dirname, canonical path, readlink, cwd,
//          temporary entries)
//==========================================================================================================

#pragma once

#include <optional>
#include <string>

namespace fileio {
namespace ops {

// Shell-style expansion: leading "~" or "~/" and $VAR / ${VAR}. An undefined variable is an InvalidPath
// error rather than an empty substitution.
std::string expandPath(const std::string& path);

// Final component. "/usr/bin/" yields "bin". Throws InvalidPath when there is none ("/", "..").
std::string basename(const std::string& path);

// Directory portion; "" when the path has no directory component.
std::string dirname(const std::string& path);

// Absolute path with symlinks and dot components resolved. Throws NotFound when the path is missing.
std::string canonicalPath(const std::string& path);

// Stored target of a symbolic link. Throws InvalidPath when the path is not a symlink.
std::string readSymbolicLink(const std::string& path);

std::string currentDirectory();

enum class TempKind { File, Directory };

// Creates a uniquely named empty file or directory inside directory (or the system temp directory when
// absent) and returns its path. The entry persists.
std::string createTemporary(TempKind kind, const std::optional<std::string>& directory);

} // namespace ops
} // namespace fileio
