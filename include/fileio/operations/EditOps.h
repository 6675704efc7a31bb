//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EditOps.h
// Purpose: Sequential in-memory edits applied to one file with a single atomic write
//==========================================================================================================

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "fileio/JSONRPCTypes.h"

namespace fileio {
namespace ops {

enum class EditOp {
    InsertAfter,
    InsertBefore,
    Replace,
    Delete,
    InsertAtLine,
    ReplaceLines,
    DeleteLines
};

// "insert_after" -> EditOp::InsertAfter. Throws ToolParamError for unknown names.
EditOp parseEditOp(const std::string& name);
const char* editOpName(EditOp op);

//==========================================================================================================
// Edit
// Purpose: One edit step. Anchored ops (InsertAfter/InsertBefore/Replace/Delete) use search, useRegex,
//          occurrence, and requireMatch; line ops use line or startLine/endLine (1-based, inclusive).
//==========================================================================================================
struct Edit {
    EditOp op{EditOp::Replace};
    std::string search;
    std::string text;
    bool useRegex{false};
    std::uint64_t occurrence{1};
    bool requireMatch{true};
    std::uint64_t line{0};
    std::uint64_t startLine{0};
    std::uint64_t endLine{0};
};

struct EditRequest {
    std::string path;
    std::vector<Edit> edits;
    bool createIfMissing{false};
    bool dryRun{false};
    bool returnContent{false};
};

struct EditResult {
    std::string path;
    bool changed{false};
    std::uint64_t appliedEdits{0};
    bool dryRun{false};
    std::optional<std::string> content;

    JSONValue ToJSON() const;
};

//==========================================================================================================
// editFile
// Purpose: Apply edits in order to the file content. The file is written (atomically) only when the
//          final content differs from the original and dryRun is false.
// Returns:
//   EditResult; content is filled when returnContent or dryRun is set.
// Throws:
//   FileIoError (NotFound for a required search that never matches, InvalidLineNumbers for bad line
//   ranges, RegexError for bad patterns). No partial write happens on failure.
//==========================================================================================================
EditResult editFile(const EditRequest& request);

// Applies the edits to content in place; returns the number of edits that changed it.
std::uint64_t applyEdits(std::string& content, const std::vector<Edit>& edits);

} // namespace ops
} // namespace fileio
