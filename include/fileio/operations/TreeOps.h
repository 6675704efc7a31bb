//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: TreeOps.h
// Purpose: Directory tree operations: create, remove, copy, move, list, and link
//==========================================================================================================

#pragma once

#include <string>
#include <vector>

#include "fileio/JSONRPCTypes.h"
#include "fileio/PathResult.h"

namespace fileio {
namespace ops {

// True when s contains any of * ? [ {
bool isGlobPattern(const std::string& s);

// Expands ~/$VAR and then the glob. Matches are sorted; an unmatched pattern yields an empty vector.
std::vector<std::string> expandGlob(const std::string& pattern);

// mkdir (-p when recursive). An existing directory is ok.
std::vector<PathResult> makeDirectories(const std::vector<std::string>& paths, bool recursive);

//==========================================================================================================
// removePaths
// Purpose: rm semantics over a path set with glob expansion.
// Args:
//   recursive: Required to remove a non-empty directory; otherwise "error: NotEmpty".
//   force: Missing paths and unmatched globs become "ok" records instead of "error: NotFound".
// Returns:
//   One record per removed (or failed) path. Glob inputs contribute one record per match.
//==========================================================================================================
std::vector<PathResult> removePaths(const std::vector<std::string>& paths, bool recursive, bool force);

// rmdir semantics; every path must be a directory.
std::vector<PathResult> removeDirectories(const std::vector<std::string>& paths, bool recursive);

//==========================================================================================================
// copyPaths / movePaths
// Purpose: cp/mv over glob-expanded sources. With more than one source the destination must be an
//          existing directory (ToolParamError otherwise). Records carry {destination}.
//==========================================================================================================
std::vector<PathResult> copyPaths(const std::vector<std::string>& sources, const std::string& destination,
                                  bool recursive);
std::vector<PathResult> movePaths(const std::vector<std::string>& sources, const std::string& destination);

// Array of {name, path, type, size (files only), modified}. A missing directory lists as empty.
JSONValue listDirectory(const std::string& path, bool recursive, bool includeHidden);

void createHardLink(const std::string& target, const std::string& linkPath);
void createSymbolicLink(const std::string& target, const std::string& linkPath);

} // namespace ops
} // namespace fileio
