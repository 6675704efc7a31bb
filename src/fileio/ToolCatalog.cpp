//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolCatalog.cpp
// Purpose: Names, descriptions, and input schemas of the built-in tools
//==========================================================================================================

#include "fileio/ToolRegistry.h"
#include "logging/Logger.h"

#include <string>

namespace fileio {

namespace {

// Shared fragment for arguments that take one path or an array of paths.
const std::string kPathOrPaths =
    R"json("type": ["string", "array"], "items": {"type": "string"}, "minItems": 1)json";

// Object schema for multi-path tools: "path" (or its alias "paths") plus tool-specific properties.
std::string multiPathSchema(const std::string& extraProperties = std::string(),
                            const std::string& extraRequired = std::string()) {
    std::string s = R"json({"type": "object", "properties": {"path": {)json" + kPathOrPaths +
                    R"json(, "description": "Path or array of paths; ~ and $VAR are expanded"}, "paths": {)json" +
                    kPathOrPaths + R"json(, "description": "Alias of path"})json";
    if (!extraProperties.empty()) {
        s += ", " + extraProperties;
    }
    s += R"json(}, "anyOf": [{"required": ["path"]}, {"required": ["paths"]}])json";
    if (!extraRequired.empty()) {
        s += R"json(, "required": [)json" + extraRequired + "]";
    }
    s += R"json(, "additionalProperties": false})json";
    return s;
}

// Object schema for tools taking a single "path" string.
std::string singlePathSchema(const std::string& description) {
    return R"json({"type": "object", "properties": {"path": {"type": "string", "description": ")json" + description +
           R"json("}}, "required": ["path"], "additionalProperties": false})json";
}

struct CatalogEntry {
    ToolKind kind;
    const char* name;
    const char* description;
    std::string schema;
    bool dangerous;
};

std::vector<CatalogEntry> catalogEntries() {
    const std::string modeProperty =
        R"json("mode": {"type": "string", "description": "Octal permission bits, e.g. \"644\" or \"0755\""})json";

    return {
        {ToolKind::ReadLines, "fileio_read_lines",
         "Read a window of lines from a text file. Lines are 1-based; end_line is inclusive and clamps at end "
         "of file. start_offset is an alternative 0-based line index. Returns a JSON array of line strings.",
         R"json({"type": "object", "properties": {
                "path": {"type": "string", "description": "File to read"},
                "start_line": {"type": "integer", "minimum": 0, "description": "First line (1-based)"},
                "end_line": {"type": "integer", "minimum": 0, "description": "Last line (1-based, inclusive)"},
                "line_count": {"type": "integer", "minimum": 0, "description": "Number of lines to read"},
                "start_offset": {"type": "integer", "minimum": 0, "description": "0-based index of the first line"}
            }, "required": ["path"], "additionalProperties": false})json",
         false},
        {ToolKind::WriteFile, "fileio_write_file",
         "Write content to a file, creating parent directories. Overwrites atomically unless append is true.",
         R"json({"type": "object", "properties": {
                "path": {"type": "string", "description": "File to write"},
                "content": {"type": "string", "description": "Text to write"},
                "append": {"type": "boolean", "description": "Append instead of overwrite. Default false"}
            }, "required": ["path", "content"], "additionalProperties": false})json",
         true},
        {ToolKind::SetPermissions, "fileio_set_permissions",
         "Set permission bits (chmod) on one or more paths. Returns one result per path.",
         multiPathSchema(modeProperty, R"json("mode")json"), true},
        {ToolKind::SetMode, "fileio_set_mode",
         "Alias of fileio_set_permissions.",
         multiPathSchema(modeProperty, R"json("mode")json"), true},
        {ToolKind::GetPermissions, "fileio_get_permissions",
         "Get permission bits of one or more paths as a 4-digit octal string.",
         multiPathSchema(), false},
        {ToolKind::Touch, "fileio_touch",
         "Create empty files or update access and modification times to now.",
         multiPathSchema(), false},
        {ToolKind::Stat, "fileio_stat",
         "Report type, size, mode, and timestamps (epoch seconds) of one or more paths.",
         multiPathSchema(), false},
        {ToolKind::MakeDirectory, "fileio_make_directory",
         "Create directories. recursive (default true) creates missing parents; an existing directory is ok.",
         multiPathSchema(R"json("recursive": {"type": "boolean", "description": "Create parents. Default true"})json"),
         false},
        {ToolKind::ListDirectory, "fileio_list_directory",
         "List directory entries with name, path, type, size (files), and modified time.",
         R"json({"type": "object", "properties": {
                "path": {"type": "string", "description": "Directory to list"},
                "recursive": {"type": "boolean", "description": "Descend into subdirectories. Default false"},
                "include_hidden": {"type": "boolean", "description": "Include dot entries. Default false"}
            }, "required": ["path"], "additionalProperties": false})json",
         false},
        {ToolKind::FindFiles, "fileio_find_files",
         "Find entries by name under root. A pattern containing * or ? is a glob matched against the whole "
         "name; otherwise it matches as a substring.",
         R"json({"type": "object", "properties": {
                "pattern": {"type": "string", "description": "Glob or substring"},
                "root": {"type": "string", "description": "Directory to search. Default \".\""},
                "max_depth": {"type": "integer", "minimum": 0, "description": "1 searches direct children only"},
                "file_type": {"type": "string", "enum": ["file", "dir", "directory", "symlink"]}
            }, "required": ["pattern"], "additionalProperties": false})json",
         false},
        {ToolKind::FindInFiles, "fileio_find_in_files",
         "Search file contents for a literal or regular expression. Returns match records with 1-based line "
         "numbers and byte columns. Files that are not valid UTF-8 are skipped.",
         R"json({"type": "object", "properties": {
                "pattern": {"type": "string", "description": "Text or regex to search for"},
                "path": {"type": "string", "description": "File or directory to search"},
                "case_sensitive": {"type": "boolean", "description": "Default true"},
                "use_regex": {"type": "boolean", "description": "Treat pattern as a regex. Default false"},
                "max_count": {"type": "integer", "minimum": 0, "description": "Maximum matches per file"},
                "max_depth": {"type": "integer", "minimum": 0, "description": "Directory depth limit"},
                "include_hidden": {"type": "boolean", "description": "Search dot entries. Default false"},
                "file_glob": {"type": "string", "description": "Only files whose name matches, e.g. *.{cpp,h}"},
                "exclude_glob": {"type": "string", "description": "Skip files and directories whose name matches"},
                "whole_word": {"type": "boolean", "description": "Match on word boundaries. Default false"},
                "multiline": {"type": "boolean", "description": "Let matches span lines. Default false"}
            }, "required": ["pattern", "path"], "additionalProperties": false})json",
         false},
        {ToolKind::EditFile, "fileio_edit_file",
         "Apply a sequence of edits to one file and write it once, atomically. Anchored ops (insert_after, "
         "insert_before, replace, delete) locate the nth occurrence of search; line ops (insert_at_line, "
         "replace_lines, delete_lines) address 1-based lines. Nothing is written when dry_run is set or the "
         "content is unchanged.",
         R"json({"type": "object", "properties": {
                "path": {"type": "string", "description": "File to edit"},
                "edits": {"type": "array", "minItems": 1, "items": {"type": "object", "properties": {
                    "op": {"type": "string", "enum": ["insert_after", "insert_before", "replace", "delete",
                                                      "insert_at_line", "replace_lines", "delete_lines"]},
                    "search": {"type": "string"},
                    "text": {"type": "string"},
                    "use_regex": {"type": "boolean"},
                    "occurrence": {"type": "integer", "minimum": 0},
                    "require_match": {"type": "boolean"},
                    "line": {"type": "integer", "minimum": 0},
                    "start_line": {"type": "integer", "minimum": 0},
                    "end_line": {"type": "integer", "minimum": 0}
                }, "required": ["op"], "additionalProperties": false}},
                "create_if_missing": {"type": "boolean", "description": "Treat a missing file as empty"},
                "dry_run": {"type": "boolean", "description": "Compute and return the result without writing"},
                "return_content": {"type": "boolean", "description": "Include the final content"}
            }, "required": ["path", "edits"], "additionalProperties": false})json",
         true},
        {ToolKind::Copy, "fileio_copy",
         "Copy files or directories. Sources may be globs; with several sources the destination must be an "
         "existing directory. Directories need recursive=true.",
         R"json({"type": "object", "properties": {
                "source": {"type": ["string", "array"], "items": {"type": "string"}, "minItems": 1},
                "destination": {"type": "string"},
                "recursive": {"type": "boolean", "description": "Required for directories. Default false"}
            }, "required": ["source", "destination"], "additionalProperties": false})json",
         true},
        {ToolKind::Move, "fileio_move",
         "Move or rename files and directories. Sources may be globs; with several sources the destination "
         "must be an existing directory.",
         R"json({"type": "object", "properties": {
                "source": {"type": ["string", "array"], "items": {"type": "string"}, "minItems": 1},
                "destination": {"type": "string"}
            }, "required": ["source", "destination"], "additionalProperties": false})json",
         true},
        {ToolKind::Remove, "fileio_remove",
         "Remove files or directories. Paths may be globs. recursive is required for non-empty directories; "
         "force makes missing paths succeed.",
         multiPathSchema(R"json("recursive": {"type": "boolean", "description": "Default false"},
                            "force": {"type": "boolean", "description": "Ignore missing paths. Default false"})json"),
         true},
        {ToolKind::RemoveDirectory, "fileio_remove_directory",
         "Remove directories. Every path must be a directory; recursive is required when not empty.",
         multiPathSchema(R"json("recursive": {"type": "boolean", "description": "Default false"})json"), true},
        {ToolKind::CreateHardLink, "fileio_create_hard_link",
         "Create a hard link at link_path referring to target.",
         R"json({"type": "object", "properties": {
                "target": {"type": "string"}, "link_path": {"type": "string"}
            }, "required": ["target", "link_path"], "additionalProperties": false})json",
         false},
        {ToolKind::CreateSymbolicLink, "fileio_create_symbolic_link",
         "Create a symbolic link at link_path pointing to target.",
         R"json({"type": "object", "properties": {
                "target": {"type": "string"}, "link_path": {"type": "string"}
            }, "required": ["target", "link_path"], "additionalProperties": false})json",
         false},
        {ToolKind::GetBasename, "fileio_get_basename", "Return the final component of a path.",
         singlePathSchema("Path to inspect"), false},
        {ToolKind::GetDirname, "fileio_get_dirname", "Return a path without its final component.",
         singlePathSchema("Path to inspect"), false},
        {ToolKind::GetCanonicalPath, "fileio_get_canonical_path",
         "Resolve a path to its absolute form with symlinks and . / .. removed. The path must exist.",
         singlePathSchema("Existing path"), false},
        {ToolKind::ReadSymbolicLink, "fileio_read_symbolic_link", "Return the target stored in a symbolic link.",
         singlePathSchema("Symbolic link"), false},
        {ToolKind::CreateTemporary, "fileio_create_temporary",
         "Create a uniquely named temporary file or directory and return its path. template names the "
         "directory to create it in; the system temporary directory is used otherwise.",
         R"json({"type": "object", "properties": {
                "type": {"type": "string", "enum": ["file", "dir"]},
                "template": {"type": "string", "description": "Directory to create the entry in"}
            }, "required": ["type"], "additionalProperties": false})json",
         false},
        {ToolKind::ChangeOwnership, "fileio_change_ownership",
         "Change owner and/or group of one or more paths. user and group are numeric ids or names.",
         multiPathSchema(R"json("user": {"type": ["string", "integer"], "description": "User name or uid"},
                            "group": {"type": ["string", "integer"], "description": "Group name or gid"})json"),
         true},
        {ToolKind::GetCurrentDirectory, "fileio_get_current_directory",
         "Return the server's current working directory.",
         R"json({"type": "object", "properties": {}, "additionalProperties": false})json", false},
        {ToolKind::CountLines, "fileio_count_lines",
         "Count lines in one or more files.",
         multiPathSchema(), false},
        {ToolKind::CountWords, "fileio_count_words",
         "Count whitespace-separated words in one or more files.",
         multiPathSchema(), false},
    };
}

} // namespace

std::vector<ToolDefinition> BuildToolCatalog() {
    std::vector<ToolDefinition> out;
    for (auto& entry : catalogEntries()) {
        out.push_back(ToolDefinition{
            entry.kind, Tool(entry.name, entry.description, parseJSON(entry.schema), entry.dangerous)});
    }
    LOG_DEBUG("Tool catalog built with {} tools", out.size());
    return out;
}

} // namespace fileio
