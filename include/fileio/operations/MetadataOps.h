//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MetadataOps.h
// Purpose: Metadata operations over path sets: stat, permissions, timestamps, ownership
//==========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <vector>
#include <sys/types.h>

#include "fileio/PathResult.h"

namespace fileio {
namespace ops {

// Parses "755", "0644", "0o600". Throws ToolParamError for anything that is not 1-4 octal digits.
mode_t parseOctalMode(const std::string& mode);

// "%04o" rendering of the permission bits.
std::string formatMode(mode_t mode);

// {type, size, mode, modified, accessed, created, is_file, is_dir, is_symlink}; timestamps are epoch
// seconds as strings, created is null where the filesystem does not record it.
std::vector<PathResult> statPaths(const std::vector<std::string>& paths);

// {mode}
std::vector<PathResult> getPermissions(const std::vector<std::string>& paths);

// Applies mode to every path; records carry the resulting {mode}.
std::vector<PathResult> setPermissions(const std::vector<std::string>& paths, mode_t mode);

// Creates missing files (and parents) or bumps access/modification time to now; records carry {created}.
std::vector<PathResult> touch(const std::vector<std::string>& paths);

// Resolves a user/group given as a numeric id or a name. Throws ToolParamError when unknown.
uid_t resolveUser(const std::string& user);
gid_t resolveGroup(const std::string& group);

// At least one of uid/gid must be set. Records carry {uid, gid} after the change.
std::vector<PathResult> changeOwnership(const std::vector<std::string>& paths,
                                        std::optional<uid_t> uid, std::optional<gid_t> gid);

} // namespace ops
} // namespace fileio
