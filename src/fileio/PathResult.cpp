//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: PathResult.cpp
// Purpose: PathResult construction, serialization, and per-path failure capture
//==========================================================================================================

#include "fileio/PathResult.h"
#include "fileio/operations/PathOps.h"
#include "logging/Logger.h"

#include <filesystem>

namespace fileio {

namespace fs = std::filesystem;

std::string errorStatus(errors::ErrorKind kind) {
    return "error: " + std::string(errors::errorKindName(kind));
}

PathResult PathResult::Ok(std::string path, bool exists) {
    PathResult r;
    r.path = std::move(path);
    r.status = "ok";
    r.exists = exists;
    return r;
}

PathResult PathResult::Failed(std::string path, const errors::FileIoError& err, bool exists) {
    PathResult r;
    r.path = std::move(path);
    r.status = errorStatus(err.kind());
    r.exists = exists;
    r.errorKind = err.kind();
    r.detail = err.what();
    return r;
}

PathResult& PathResult::with(const std::string& key, JSONValue value) {
    for (auto& [k, v] : fields) {
        if (k == key) {
            v = std::move(value);
            return *this;
        }
    }
    fields.emplace_back(key, std::move(value));
    return *this;
}

JSONValue PathResult::ToJSON() const {
    JSONValue::Object obj;
    obj["path"] = std::make_shared<JSONValue>(path);
    obj["status"] = std::make_shared<JSONValue>(status);
    obj["exists"] = std::make_shared<JSONValue>(exists);
    for (const auto& [key, value] : fields) {
        obj[key] = std::make_shared<JSONValue>(value);
    }
    return JSONValue{std::move(obj)};
}

JSONValue ToJSONArray(const std::vector<PathResult>& results) {
    JSONValue::Array arr;
    arr.reserve(results.size());
    for (const auto& r : results) {
        arr.push_back(std::make_shared<JSONValue>(r.ToJSON()));
    }
    return JSONValue{std::move(arr)};
}

namespace {

// Existence check that never throws; symlinks count as existing even when dangling.
bool pathExistsNoThrow(const std::string& rawPath) {
    std::string expanded;
    try {
        expanded = ops::expandPath(rawPath);
    } catch (const errors::FileIoError&) {
        return false;
    }
    std::error_code ec;
    return fs::exists(fs::symlink_status(expanded, ec));
}

PathResult failedWithPayload(const std::string& path, const errors::FileIoError& err,
                             std::initializer_list<const char*> payloadKeys) {
    PathResult r = PathResult::Failed(path, err, pathExistsNoThrow(path));
    for (const char* key : payloadKeys) {
        r.with(key, JSONValue(nullptr));
    }
    LOG_DEBUG("Path '{}' failed: {}", path, err.describe());
    return r;
}

} // namespace

std::vector<PathResult> collectPathResults(const std::vector<std::string>& paths,
                                           std::initializer_list<const char*> payloadKeys,
                                           const std::function<PathResult(const std::string&)>& fn) {
    std::vector<PathResult> results;
    results.reserve(paths.size());
    for (const auto& path : paths) {
        try {
            results.push_back(fn(path));
        } catch (const errors::FileIoError& e) {
            results.push_back(failedWithPayload(path, e, payloadKeys));
        } catch (const fs::filesystem_error& e) {
            results.push_back(failedWithPayload(path, errors::fromErrorCode(e.code(), "access", path), payloadKeys));
        }
    }
    return results;
}

} // namespace fileio
