//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ContentOps.h
// Purpose: File content operations: windowed line reads, writes, line and word counts
//==========================================================================================================

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "fileio/PathResult.h"

namespace fileio {
namespace ops {

struct ReadLinesOptions {
    std::optional<std::uint64_t> startLine;   // 1-based, inclusive
    std::optional<std::uint64_t> endLine;     // 1-based, inclusive; clamps at end of file
    std::optional<std::uint64_t> lineCount;   // alternative to endLine
    std::optional<std::uint64_t> startOffset; // 0-based line index, used when startLine is absent
};

//==========================================================================================================
// readLines
// Purpose: Returns the selected window of lines without their terminators ("\n" or "\r\n").
// Errors:
//   InvalidLineNumbers when a line number is 0, end precedes start, or start lies past the last line.
//==========================================================================================================
std::vector<std::string> readLines(const std::string& path, const ReadLinesOptions& options);

// Creates parent directories. Overwrite is atomic; append extends the file in place.
void writeFile(const std::string& path, const std::string& content, bool append);

// Lines as a line-oriented reader sees them: "a\nb\n" and "a\nb" both have 2, "" has 0.
std::uint64_t countLinesInText(const std::string& text);
std::uint64_t countWordsInText(const std::string& text);

// Per-path records carrying "lines" / "words".
std::vector<PathResult> countLines(const std::vector<std::string>& paths);
std::vector<PathResult> countWords(const std::vector<std::string>& paths);

} // namespace ops
} // namespace fileio
