//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: PathResult.h
// Purpose: Per-path outcome records for multi-path operations, so one failing path never aborts a batch
//==========================================================================================================

#pragma once

#include <functional>
#include <initializer_list>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "fileio/JSONRPCTypes.h"
#include "fileio/errors/FileIoError.h"

namespace fileio {

//==========================================================================================================
// PathResult
// Purpose: Outcome for one input path.
// Fields:
//   path: The path as the client supplied it.
//   status: "ok" or "error: <Kind>".
//   exists: Whether the path exists after the operation ran (or, on failure, at the time of failure).
//   detail: Human readable failure text; logged, not serialized.
//   fields: Operation-specific payload in insertion order. Failures keep the keys with null values.
//==========================================================================================================
struct PathResult {
    std::string path;
    std::string status;
    bool exists{false};
    std::optional<errors::ErrorKind> errorKind;
    std::string detail;
    std::vector<std::pair<std::string, JSONValue>> fields;

    static PathResult Ok(std::string path, bool exists = true);
    static PathResult Failed(std::string path, const errors::FileIoError& err, bool exists);

    PathResult& with(const std::string& key, JSONValue value);

    bool ok() const { return !errorKind.has_value(); }

    JSONValue ToJSON() const;
};

JSONValue ToJSONArray(const std::vector<PathResult>& results);

// Status string for a failure kind: "error: NotFound".
std::string errorStatus(errors::ErrorKind kind);

//==========================================================================================================
// collectPathResults
// Purpose: Runs fn once per path, in order. A FileIoError (or std::filesystem::filesystem_error) raised for
//          one path becomes that path's failed PathResult; the remaining paths still run.
// Args:
//   paths: Input paths as supplied by the client.
//   payloadKeys: Operation-specific keys that failures carry as null (e.g. "lines").
//   fn: Callable producing the success record for one path.
// Notes:
//   Exceptions of any other type are not attributable to a path and propagate to the caller.
//==========================================================================================================
std::vector<PathResult> collectPathResults(const std::vector<std::string>& paths,
                                           std::initializer_list<const char*> payloadKeys,
                                           const std::function<PathResult(const std::string&)>& fn);

} // namespace fileio
