//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: FileAccess.h
// Purpose: Whole-file read and atomic write primitives shared by content, edit, and search operations
//==========================================================================================================

#pragma once

#include <string>

namespace fileio {
namespace ops {

// Reads a regular file into memory. NotFound when missing, InvalidPath when not a regular file.
std::string readTextFile(const std::string& expandedPath);

// Replaces the file through a sibling temporary file and rename(2), so readers never observe a partial
// write. Parent directories are created. An existing file keeps its permission bits.
void writeFileAtomic(const std::string& expandedPath, const std::string& content);

// Creates all missing parent directories of expandedPath.
void ensureParentDirectories(const std::string& expandedPath);

} // namespace ops
} // namespace fileio
