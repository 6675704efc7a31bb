//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EditOps.cpp
// Purpose: Anchored and line-addressed edit application
//==========================================================================================================

#include "fileio/operations/EditOps.h"
#include "fileio/operations/FileAccess.h"
#include "fileio/operations/PathOps.h"
#include "fileio/errors/FileIoError.h"
#include "logging/Logger.h"

#include <format>
#include <stdexcept>
#include <utility>

#include <boost/regex.hpp>

namespace fileio {
namespace ops {

using errors::ErrorKind;
using errors::FileIoError;

namespace {

using Span = std::pair<std::size_t, std::size_t>;

std::optional<Span> findNthSpan(const std::string& haystack, const Edit& edit) {
    if (edit.occurrence == 0) {
        throw errors::ToolParamError("occurrence must be >= 1");
    }
    if (edit.search.empty()) {
        throw errors::ToolParamError("search must not be empty");
    }
    std::uint64_t seen = 0;
    if (edit.useRegex) {
        boost::regex re;
        try {
            re = boost::regex(edit.search, boost::regex::perl | boost::regex::no_mod_m);
        } catch (const boost::regex_error& e) {
            throw FileIoError(ErrorKind::RegexError, std::format("Invalid pattern '{}': {}", edit.search, e.what()));
        }
        try {
            const boost::match_flag_type flags = boost::match_default | boost::match_not_dot_newline;
            for (boost::sregex_iterator it(haystack.begin(), haystack.end(), re, flags), end; it != end; ++it) {
                if (++seen == edit.occurrence) {
                    const auto start = static_cast<std::size_t>(it->position());
                    return Span{start, start + static_cast<std::size_t>(it->length())};
                }
            }
        } catch (const std::runtime_error& e) {
            throw FileIoError(ErrorKind::RegexError,
                              std::format("Pattern '{}' too complex to match: {}", edit.search, e.what()));
        }
        return std::nullopt;
    }
    std::size_t from = 0;
    while (from <= haystack.size()) {
        const std::size_t pos = haystack.find(edit.search, from);
        if (pos == std::string::npos) break;
        if (++seen == edit.occurrence) {
            return Span{pos, pos + edit.search.size()};
        }
        from = pos + edit.search.size();
    }
    return std::nullopt;
}

std::vector<std::size_t> computeLineStarts(const std::string& content) {
    std::vector<std::size_t> starts{0};
    for (std::size_t i = 0; i < content.size(); ++i) {
        if (content[i] == '\n') starts.push_back(i + 1);
    }
    return starts;
}

// An empty file still has one (empty) line.
std::size_t effectiveLineCount(const std::string& content) {
    return content.empty() ? 1 : computeLineStarts(content).size();
}

// Offset where line starts; line == count + 1 addresses the end of the content.
std::size_t lineStartOffset(const std::string& content, std::uint64_t line) {
    if (line == 0) {
        throw FileIoError(ErrorKind::InvalidLineNumbers, "line must be >= 1");
    }
    const std::size_t count = effectiveLineCount(content);
    if (line > count + 1) {
        throw FileIoError(ErrorKind::InvalidLineNumbers,
                          std::format("Invalid line number: {} (file has {} lines)", line, count));
    }
    if (line == count + 1) return content.size();
    if (content.empty()) return 0;
    return computeLineStarts(content)[line - 1];
}

// Byte range covering lines [startLine, endLine] including the final line's newline.
Span lineRangeOffsets(const std::string& content, std::uint64_t startLine, std::uint64_t endLine) {
    if (startLine == 0 || endLine == 0) {
        throw FileIoError(ErrorKind::InvalidLineNumbers, "line numbers must be >= 1");
    }
    if (startLine > endLine) {
        throw FileIoError(ErrorKind::InvalidLineNumbers,
                          std::format("start_line ({}) must be <= end_line ({})", startLine, endLine));
    }
    const std::size_t count = effectiveLineCount(content);
    if (startLine > count || endLine > count) {
        throw FileIoError(ErrorKind::InvalidLineNumbers,
                          std::format("Invalid line range: {}..{} (file has {} lines)", startLine, endLine, count));
    }
    if (content.empty()) return Span{0, 0};
    const auto starts = computeLineStarts(content);
    const std::size_t startOff = starts[startLine - 1];
    const std::size_t endOff = endLine < starts.size() ? starts[endLine] : content.size();
    return Span{startOff, endOff};
}

[[noreturn]] void throwNotMatched(const Edit& edit) {
    throw FileIoError(ErrorKind::NotFound,
                      std::format("Edit failed: search pattern not found ({}): {}", editOpName(edit.op), edit.search));
}

void applyOne(std::string& content, const Edit& edit) {
    switch (edit.op) {
        case EditOp::InsertAfter:
        case EditOp::InsertBefore:
        case EditOp::Replace:
        case EditOp::Delete: {
            auto span = findNthSpan(content, edit);
            if (!span.has_value()) {
                if (edit.requireMatch) throwNotMatched(edit);
                return;
            }
            const auto [start, end] = *span;
            if (edit.op == EditOp::InsertAfter) {
                content.insert(end, edit.text);
            } else if (edit.op == EditOp::InsertBefore) {
                content.insert(start, edit.text);
            } else if (edit.op == EditOp::Replace) {
                content.replace(start, end - start, edit.text);
            } else {
                content.erase(start, end - start);
            }
            return;
        }
        case EditOp::InsertAtLine:
            content.insert(lineStartOffset(content, edit.line), edit.text);
            return;
        case EditOp::ReplaceLines: {
            const auto [start, end] = lineRangeOffsets(content, edit.startLine, edit.endLine);
            std::string replacement = edit.text;
            // Keep the line structure when the replaced block ended with a newline
            if (end > start && content[end - 1] == '\n' && (replacement.empty() || replacement.back() != '\n')) {
                replacement.push_back('\n');
            }
            content.replace(start, end - start, replacement);
            return;
        }
        case EditOp::DeleteLines: {
            const auto [start, end] = lineRangeOffsets(content, edit.startLine, edit.endLine);
            content.erase(start, end - start);
            return;
        }
    }
}

} // namespace

EditOp parseEditOp(const std::string& name) {
    if (name == "insert_after") return EditOp::InsertAfter;
    if (name == "insert_before") return EditOp::InsertBefore;
    if (name == "replace") return EditOp::Replace;
    if (name == "delete") return EditOp::Delete;
    if (name == "insert_at_line") return EditOp::InsertAtLine;
    if (name == "replace_lines") return EditOp::ReplaceLines;
    if (name == "delete_lines") return EditOp::DeleteLines;
    throw errors::ToolParamError(std::format("Unknown edit op: {}", name));
}

const char* editOpName(EditOp op) {
    switch (op) {
        case EditOp::InsertAfter: return "insert_after";
        case EditOp::InsertBefore: return "insert_before";
        case EditOp::Replace: return "replace";
        case EditOp::Delete: return "delete";
        case EditOp::InsertAtLine: return "insert_at_line";
        case EditOp::ReplaceLines: return "replace_lines";
        case EditOp::DeleteLines: return "delete_lines";
    }
    return "unknown";
}

std::uint64_t applyEdits(std::string& content, const std::vector<Edit>& edits) {
    std::uint64_t applied = 0;
    for (const auto& edit : edits) {
        const std::string before = content;
        applyOne(content, edit);
        if (content != before) ++applied;
    }
    return applied;
}

EditResult editFile(const EditRequest& request) {
    const std::string expanded = expandPath(request.path);
    std::string original;
    try {
        original = readTextFile(expanded);
    } catch (const FileIoError& e) {
        if (e.kind() != ErrorKind::NotFound || !request.createIfMissing) throw;
    }

    std::string content = original;
    EditResult result;
    result.path = expanded;
    result.appliedEdits = applyEdits(content, request.edits);
    result.changed = content != original;
    result.dryRun = request.dryRun;

    if (result.changed && !request.dryRun) {
        ensureParentDirectories(expanded);
        writeFileAtomic(expanded, content);
        LOG_INFO("Edited {} ({} edit(s) applied)", expanded, result.appliedEdits);
    }
    if (request.returnContent || request.dryRun) {
        result.content = std::move(content);
    }
    return result;
}

JSONValue EditResult::ToJSON() const {
    JSONValue::Object obj;
    obj["path"] = std::make_shared<JSONValue>(path);
    obj["changed"] = std::make_shared<JSONValue>(changed);
    obj["applied_edits"] = std::make_shared<JSONValue>(static_cast<int64_t>(appliedEdits));
    obj["dry_run"] = std::make_shared<JSONValue>(dryRun);
    if (content.has_value()) {
        obj["content"] = std::make_shared<JSONValue>(*content);
    }
    return JSONValue{std::move(obj)};
}

} // namespace ops
} // namespace fileio
