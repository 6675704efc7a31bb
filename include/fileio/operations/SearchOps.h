//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SearchOps.h
// Purpose: Name search (find) and content search (grep) over directory trees
//==========================================================================================================

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "fileio/JSONRPCTypes.h"

namespace fileio {
namespace ops {

//==========================================================================================================
// FindFilesOptions
// Fields:
//   pattern: Shell glob when it contains * or ?; otherwise a substring of the entry name.
//   root: Starting directory (default ".").
//   maxDepth: 1 means direct children only; unset means unlimited.
//   fileType: "file", "dir"/"directory", or "symlink"; unset accepts every type.
//==========================================================================================================
struct FindFilesOptions {
    std::string pattern;
    std::string root{"."};
    std::optional<std::uint64_t> maxDepth;
    std::optional<std::string> fileType;
};

std::vector<std::string> findFiles(const FindFilesOptions& options);

struct FindInFilesOptions {
    std::string pattern;
    std::string path;
    bool caseSensitive{true};
    bool useRegex{false};
    std::optional<std::uint64_t> maxCount;   // per file
    std::optional<std::uint64_t> maxDepth;
    bool includeHidden{false};
    std::optional<std::string> fileGlob;     // applied to file names; supports {a,b}
    std::optional<std::string> excludeGlob;  // applied to file and directory names
    bool wholeWord{false};
    bool multiline{false};                   // match across line boundaries
};

// One match. Line numbers are 1-based; columns are byte offsets within the line.
struct SearchMatch {
    std::string filePath;
    std::uint64_t lineNumber{0};
    std::uint64_t columnStart{0};
    std::uint64_t columnEnd{0};
    std::string matchedText;

    JSONValue ToJSON() const;
};

std::vector<SearchMatch> findInFiles(const FindInFilesOptions& options);

JSONValue MatchesToJSON(const std::vector<SearchMatch>& matches);

// fnmatch(3) with {a,b,...} alternation expanded first.
bool globMatch(const std::string& pattern, const std::string& name);

// True when every byte sequence in text is well-formed UTF-8.
bool isValidUtf8(const std::string& text);

} // namespace ops
} // namespace fileio
