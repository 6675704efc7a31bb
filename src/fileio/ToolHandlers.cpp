//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolHandlers.cpp
// Purpose: Argument extraction and the ToolKind -> operation binding
//==========================================================================================================

#include "fileio/ToolRegistry.h"
#include "fileio/PathResult.h"
#include "fileio/errors/FileIoError.h"
#include "fileio/operations/ContentOps.h"
#include "fileio/operations/EditOps.h"
#include "fileio/operations/MetadataOps.h"
#include "fileio/operations/PathOps.h"
#include "fileio/operations/SearchOps.h"
#include "fileio/operations/TreeOps.h"

#include <format>
#include <stdexcept>

namespace fileio {

using errors::ToolParamError;

namespace {

///////////////////////////////////////// Argument access ///////////////////////////////////////////
const JSONValue* member(const JSONValue& args, const char* key) {
    const JSONValue* v = args.find(key);
    return (v && !v->isNull()) ? v : nullptr;
}

std::string requireString(const JSONValue& args, const char* key) {
    const JSONValue* v = member(args, key);
    if (!v || !v->isString()) {
        throw ToolParamError(std::format("Missing required parameter: {}", key));
    }
    return std::get<std::string>(v->value);
}

std::optional<std::string> optionalString(const JSONValue& args, const char* key) {
    const JSONValue* v = member(args, key);
    if (!v) return std::nullopt;
    if (!v->isString()) {
        throw ToolParamError(std::format("'{}' must be a string", key));
    }
    return std::get<std::string>(v->value);
}

bool optionalBool(const JSONValue& args, const char* key, bool fallback) {
    const JSONValue* v = member(args, key);
    if (!v) return fallback;
    if (const auto* b = std::get_if<bool>(&v->value)) return *b;
    throw ToolParamError(std::format("'{}' must be a boolean", key));
}

std::optional<std::uint64_t> optionalCount(const JSONValue& args, const char* key) {
    const JSONValue* v = member(args, key);
    if (!v) return std::nullopt;
    const auto* i = std::get_if<int64_t>(&v->value);
    if (!i || *i < 0) {
        throw ToolParamError(std::format("'{}' must be a non-negative integer", key));
    }
    return static_cast<std::uint64_t>(*i);
}

std::vector<std::string> stringList(const JSONValue& v, const char* key) {
    if (v.isString()) {
        return {std::get<std::string>(v.value)};
    }
    std::vector<std::string> out;
    if (const auto* arr = std::get_if<JSONValue::Array>(&v.value)) {
        for (const auto& item : *arr) {
            if (!item || !item->isString()) {
                throw ToolParamError(std::format("'{}' must contain only strings", key));
            }
            out.push_back(std::get<std::string>(item->value));
        }
        return out;
    }
    throw ToolParamError(std::format("'{}' must be a string or an array of strings", key));
}

std::vector<std::string> requireList(const JSONValue& args, const char* key) {
    const JSONValue* v = member(args, key);
    if (!v) {
        throw ToolParamError(std::format("Missing required parameter: {}", key));
    }
    return stringList(*v, key);
}

// "path" or its alias "paths".
std::vector<std::string> pathsArgument(const JSONValue& args) {
    if (const JSONValue* v = member(args, "path")) return stringList(*v, "path");
    if (const JSONValue* v = member(args, "paths")) return stringList(*v, "paths");
    throw ToolParamError("Missing required parameter: path");
}

// user/group given as a name, a numeric string, or an integer.
std::optional<std::string> idArgument(const JSONValue& args, const char* key) {
    const JSONValue* v = member(args, key);
    if (!v) return std::nullopt;
    if (const auto* i = std::get_if<int64_t>(&v->value)) {
        if (*i < 0) throw ToolParamError(std::format("'{}' must be a non-negative id", key));
        return std::to_string(*i);
    }
    if (v->isString()) return std::get<std::string>(v->value);
    throw ToolParamError(std::format("'{}' must be a name or a numeric id", key));
}

CallToolResult pathResults(const std::vector<PathResult>& results) {
    return JsonResult(ToJSONArray(results));
}

CallToolResult stringArray(const std::vector<std::string>& items) {
    JSONValue::Array arr;
    arr.reserve(items.size());
    for (const auto& s : items) {
        arr.push_back(std::make_shared<JSONValue>(s));
    }
    return JsonResult(JSONValue{std::move(arr)});
}

///////////////////////////////////////// Handlers ///////////////////////////////////////////
CallToolResult handleReadLines(const JSONValue& args) {
    ops::ReadLinesOptions options;
    options.startLine = optionalCount(args, "start_line");
    options.endLine = optionalCount(args, "end_line");
    options.lineCount = optionalCount(args, "line_count");
    options.startOffset = optionalCount(args, "start_offset");
    return stringArray(ops::readLines(requireString(args, "path"), options));
}

CallToolResult handleWriteFile(const JSONValue& args) {
    ops::writeFile(requireString(args, "path"), requireString(args, "content"), optionalBool(args, "append", false));
    return TextResult("File written successfully");
}

CallToolResult handleSetPermissions(const JSONValue& args) {
    const mode_t mode = ops::parseOctalMode(requireString(args, "mode"));
    return pathResults(ops::setPermissions(pathsArgument(args), mode));
}

CallToolResult handleFindFiles(const JSONValue& args) {
    ops::FindFilesOptions options;
    options.pattern = requireString(args, "pattern");
    options.root = optionalString(args, "root").value_or(".");
    options.maxDepth = optionalCount(args, "max_depth");
    options.fileType = optionalString(args, "file_type");
    return stringArray(ops::findFiles(options));
}

CallToolResult handleFindInFiles(const JSONValue& args) {
    ops::FindInFilesOptions options;
    options.pattern = requireString(args, "pattern");
    options.path = requireString(args, "path");
    options.caseSensitive = optionalBool(args, "case_sensitive", true);
    options.useRegex = optionalBool(args, "use_regex", false);
    options.maxCount = optionalCount(args, "max_count");
    options.maxDepth = optionalCount(args, "max_depth");
    options.includeHidden = optionalBool(args, "include_hidden", false);
    options.fileGlob = optionalString(args, "file_glob");
    options.excludeGlob = optionalString(args, "exclude_glob");
    options.wholeWord = optionalBool(args, "whole_word", false);
    options.multiline = optionalBool(args, "multiline", false);
    return JsonResult(ops::MatchesToJSON(ops::findInFiles(options)));
}

ops::Edit editFromJSON(const JSONValue& item, std::size_t index) {
    ops::Edit edit;
    edit.op = ops::parseEditOp(requireString(item, "op"));
    const auto need = [&](const char* key) {
        if (!member(item, key)) {
            throw ToolParamError(std::format("edits[{}]: '{}' is required for {}", index, key, ops::editOpName(edit.op)));
        }
    };
    switch (edit.op) {
        case ops::EditOp::InsertAfter:
        case ops::EditOp::InsertBefore:
        case ops::EditOp::Replace:
            need("text");
            [[fallthrough]];
        case ops::EditOp::Delete:
            need("search");
            edit.search = requireString(item, "search");
            edit.text = optionalString(item, "text").value_or("");
            edit.useRegex = optionalBool(item, "use_regex", false);
            edit.occurrence = optionalCount(item, "occurrence").value_or(1);
            edit.requireMatch = optionalBool(item, "require_match", true);
            break;
        case ops::EditOp::InsertAtLine:
            need("line");
            need("text");
            edit.line = *optionalCount(item, "line");
            edit.text = requireString(item, "text");
            break;
        case ops::EditOp::ReplaceLines:
            need("text");
            [[fallthrough]];
        case ops::EditOp::DeleteLines:
            need("start_line");
            need("end_line");
            edit.startLine = *optionalCount(item, "start_line");
            edit.endLine = *optionalCount(item, "end_line");
            edit.text = optionalString(item, "text").value_or("");
            break;
    }
    return edit;
}

CallToolResult handleEditFile(const JSONValue& args) {
    ops::EditRequest request;
    request.path = requireString(args, "path");
    const JSONValue* edits = member(args, "edits");
    const auto* arr = edits ? std::get_if<JSONValue::Array>(&edits->value) : nullptr;
    if (!arr) {
        throw ToolParamError("Missing required parameter: edits");
    }
    for (std::size_t i = 0; i < arr->size(); ++i) {
        if (!(*arr)[i]) throw ToolParamError(std::format("edits[{}] must be an object", i));
        request.edits.push_back(editFromJSON(*(*arr)[i], i));
    }
    request.createIfMissing = optionalBool(args, "create_if_missing", false);
    request.dryRun = optionalBool(args, "dry_run", false);
    request.returnContent = optionalBool(args, "return_content", false);
    return JsonResult(ops::editFile(request).ToJSON());
}

CallToolResult handleCreateTemporary(const JSONValue& args) {
    const std::string type = requireString(args, "type");
    ops::TempKind kind;
    if (type == "file") {
        kind = ops::TempKind::File;
    } else if (type == "dir") {
        kind = ops::TempKind::Directory;
    } else {
        throw ToolParamError(std::format("Invalid type: {} (must be 'file' or 'dir')", type));
    }
    return TextResult(ops::createTemporary(kind, optionalString(args, "template")));
}

CallToolResult handleChangeOwnership(const JSONValue& args) {
    std::optional<uid_t> uid;
    std::optional<gid_t> gid;
    if (auto user = idArgument(args, "user")) uid = ops::resolveUser(*user);
    if (auto group = idArgument(args, "group")) gid = ops::resolveGroup(*group);
    return pathResults(ops::changeOwnership(pathsArgument(args), uid, gid));
}

} // namespace

CallToolResult InvokeTool(ToolKind kind, const JSONValue& args) {
    switch (kind) {
        case ToolKind::ReadLines:
            return handleReadLines(args);
        case ToolKind::WriteFile:
            return handleWriteFile(args);
        case ToolKind::SetPermissions:
        case ToolKind::SetMode:
            return handleSetPermissions(args);
        case ToolKind::GetPermissions:
            return pathResults(ops::getPermissions(pathsArgument(args)));
        case ToolKind::Touch:
            return pathResults(ops::touch(pathsArgument(args)));
        case ToolKind::Stat:
            return pathResults(ops::statPaths(pathsArgument(args)));
        case ToolKind::MakeDirectory:
            return pathResults(ops::makeDirectories(pathsArgument(args), optionalBool(args, "recursive", true)));
        case ToolKind::ListDirectory:
            return JsonResult(ops::listDirectory(requireString(args, "path"), optionalBool(args, "recursive", false),
                                                 optionalBool(args, "include_hidden", false)));
        case ToolKind::FindFiles:
            return handleFindFiles(args);
        case ToolKind::FindInFiles:
            return handleFindInFiles(args);
        case ToolKind::EditFile:
            return handleEditFile(args);
        case ToolKind::Copy:
            return pathResults(ops::copyPaths(requireList(args, "source"),
                                              requireString(args, "destination"),
                                              optionalBool(args, "recursive", false)));
        case ToolKind::Move:
            return pathResults(ops::movePaths(requireList(args, "source"),
                                              requireString(args, "destination")));
        case ToolKind::Remove:
            return pathResults(ops::removePaths(pathsArgument(args), optionalBool(args, "recursive", false),
                                                optionalBool(args, "force", false)));
        case ToolKind::RemoveDirectory:
            return pathResults(ops::removeDirectories(pathsArgument(args), optionalBool(args, "recursive", false)));
        case ToolKind::CreateHardLink:
            ops::createHardLink(requireString(args, "target"), requireString(args, "link_path"));
            return TextResult("Hard link created successfully");
        case ToolKind::CreateSymbolicLink:
            ops::createSymbolicLink(requireString(args, "target"), requireString(args, "link_path"));
            return TextResult("Symbolic link created successfully");
        case ToolKind::GetBasename:
            return TextResult(ops::basename(requireString(args, "path")));
        case ToolKind::GetDirname:
            return TextResult(ops::dirname(requireString(args, "path")));
        case ToolKind::GetCanonicalPath:
            return TextResult(ops::canonicalPath(requireString(args, "path")));
        case ToolKind::ReadSymbolicLink:
            return TextResult(ops::readSymbolicLink(requireString(args, "path")));
        case ToolKind::CreateTemporary:
            return handleCreateTemporary(args);
        case ToolKind::ChangeOwnership:
            return handleChangeOwnership(args);
        case ToolKind::GetCurrentDirectory:
            return TextResult(ops::currentDirectory());
        case ToolKind::CountLines:
            return pathResults(ops::countLines(pathsArgument(args)));
        case ToolKind::CountWords:
            return pathResults(ops::countWords(pathsArgument(args)));
    }
    throw std::logic_error("Unhandled tool kind");
}

} // namespace fileio
