//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: TreeOps.cpp
// Purpose: mkdir/rm/rmdir/cp/mv/ls/ln over POSIX calls and std::filesystem
//==========================================================================================================

#include "fileio/operations/TreeOps.h"
#include "fileio/operations/FileAccess.h"
#include "fileio/operations/PathOps.h"
#include "fileio/errors/FileIoError.h"
#include "logging/Logger.h"

#include <algorithm>
#include <cerrno>
#include <filesystem>
#include <format>
#include <optional>
#include <glob.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fileio {
namespace ops {

namespace fs = std::filesystem;
using errors::ErrorKind;
using errors::FileIoError;
using errors::IoDirection;

namespace {

// Releases glob(3) storage on scope exit.
struct GlobGuard {
    glob_t g{};
    ~GlobGuard() { ::globfree(&g); }
};

// One resolved source: the label reported in the record, and either a concrete path or the reason
// resolution failed (undefined variable, unmatched glob).
struct SourceEntry {
    std::string label;
    std::string expanded;
    std::optional<FileIoError> failure;
    bool unmatched{false};
};

std::vector<SourceEntry> resolveSources(const std::vector<std::string>& inputs) {
    std::vector<SourceEntry> out;
    for (const auto& raw : inputs) {
        try {
            if (!isGlobPattern(raw)) {
                out.push_back(SourceEntry{raw, expandPath(raw), std::nullopt, false});
                continue;
            }
            auto matches = expandGlob(raw);
            if (matches.empty()) {
                out.push_back(SourceEntry{raw, std::string(),
                    FileIoError(ErrorKind::NotFound, std::format("No files match pattern: {}", raw)), true});
                continue;
            }
            for (auto& m : matches) {
                out.push_back(SourceEntry{m, m, std::nullopt, false});
            }
        } catch (const FileIoError& e) {
            out.push_back(SourceEntry{raw, std::string(), e, false});
        }
    }
    return out;
}

// Runs op for each entry and collects records in order; resolution failures become failed records.
std::vector<PathResult> runOverSources(const std::vector<SourceEntry>& entries,
                                       std::initializer_list<const char*> payloadKeys,
                                       const std::function<PathResult(const SourceEntry&)>& op) {
    std::vector<PathResult> results;
    results.reserve(entries.size());
    for (const auto& entry : entries) {
        if (entry.failure.has_value()) {
            PathResult r = PathResult::Failed(entry.label, *entry.failure, false);
            for (const char* key : payloadKeys) {
                r.with(key, JSONValue(nullptr));
            }
            LOG_DEBUG("Source '{}' failed: {}", entry.label, entry.failure->describe());
            results.push_back(std::move(r));
            continue;
        }
        auto one = collectPathResults({entry.label}, payloadKeys,
                                      [&](const std::string&) { return op(entry); });
        results.push_back(std::move(one.front()));
    }
    return results;
}

struct stat lstatOrThrow(const std::string& expanded) {
    struct stat st{};
    if (::lstat(expanded.c_str(), &st) != 0) {
        throw errors::fromErrno(errno, "access", expanded, IoDirection::Read);
    }
    return st;
}

bool isDirectory(const std::string& expanded) {
    struct stat st{};
    return ::stat(expanded.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

void throwIf(const std::error_code& ec, const std::string& operation, const std::string& path,
             IoDirection direction = IoDirection::Write) {
    if (ec) {
        throw errors::fromErrorCode(ec, operation, path, direction);
    }
}

// Refuse to copy or move a directory into its own subtree.
void rejectNestedTarget(const std::string& src, const std::string& dst) {
    std::error_code ec;
    const fs::path s = fs::weakly_canonical(src, ec);
    if (ec) return;
    const fs::path d = fs::weakly_canonical(dst, ec);
    if (ec) return;
    if (std::mismatch(s.begin(), s.end(), d.begin(), d.end()).first == s.end()) {
        throw FileIoError(ErrorKind::InvalidPath,
                          std::format("Cannot place {} inside itself ({})", src, dst));
    }
}

std::string targetFor(const std::string& source, const std::string& destination, bool destIsDir) {
    if (!destIsDir) return destination;
    return (fs::path(destination) / fs::path(source).filename()).string();
}

void copyOne(const std::string& src, const std::string& dst, bool recursive) {
    const struct stat st = lstatOrThrow(src);
    std::error_code ec;
    if (S_ISLNK(st.st_mode)) {
        fs::copy_symlink(src, dst, ec);
        throwIf(ec, "copy", src);
    } else if (S_ISDIR(st.st_mode)) {
        if (!recursive) {
            throw FileIoError(ErrorKind::Unsupported,
                              std::format("Cannot copy directory {} without recursive flag", src));
        }
        rejectNestedTarget(src, dst);
        fs::copy(src, dst,
                 fs::copy_options::recursive | fs::copy_options::copy_symlinks | fs::copy_options::overwrite_existing,
                 ec);
        throwIf(ec, "copy", src);
    } else if (S_ISREG(st.st_mode)) {
        fs::copy_file(src, dst, fs::copy_options::overwrite_existing, ec);
        throwIf(ec, "copy", src);
    } else {
        throw FileIoError(ErrorKind::Unsupported, std::format("Source {} is not a file or directory", src));
    }
}

void removeTree(const std::string& expanded) {
    std::error_code ec;
    fs::remove_all(expanded, ec);
    throwIf(ec, "remove", expanded);
}

void checkDestinationForSources(std::size_t count, bool destIsDir, const std::string& destination) {
    if (count > 1 && !destIsDir) {
        throw errors::ToolParamError(
            std::format("Multiple sources given but destination '{}' is not an existing directory", destination));
    }
}

JSONValue entryJson(const std::string& name, const std::string& path, const struct stat& st) {
    const char* type = S_ISLNK(st.st_mode) ? "symlink"
                     : S_ISDIR(st.st_mode) ? "directory"
                     : S_ISREG(st.st_mode) ? "file"
                     : "unknown";
    JSONValue::Object obj;
    obj["name"] = std::make_shared<JSONValue>(name);
    obj["path"] = std::make_shared<JSONValue>(path);
    obj["type"] = std::make_shared<JSONValue>(type);
    if (S_ISREG(st.st_mode)) {
        obj["size"] = std::make_shared<JSONValue>(static_cast<int64_t>(st.st_size));
    }
    obj["modified"] = std::make_shared<JSONValue>(std::to_string(static_cast<long long>(st.st_mtim.tv_sec)));
    return JSONValue{std::move(obj)};
}

void collectEntries(const fs::path& dir, bool recursive, bool includeHidden, JSONValue::Array& out) {
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    throwIf(ec, "read directory", dir.string(), IoDirection::Read);

    std::vector<fs::path> children;
    for (const auto& entry : it) {
        children.push_back(entry.path());
    }
    std::sort(children.begin(), children.end());

    for (const auto& child : children) {
        const std::string name = child.filename().string();
        if (!includeHidden && !name.empty() && name[0] == '.') {
            continue;
        }
        struct stat st{};
        if (::lstat(child.c_str(), &st) != 0) {
            // Entry vanished between readdir and lstat
            LOG_DEBUG("Skipping {}: {}", child.string(), std::generic_category().message(errno));
            continue;
        }
        out.push_back(std::make_shared<JSONValue>(entryJson(name, child.string(), st)));
        if (recursive && S_ISDIR(st.st_mode)) {
            collectEntries(child, recursive, includeHidden, out);
        }
    }
}

} // namespace

bool isGlobPattern(const std::string& s) {
    return s.find_first_of("*?[{") != std::string::npos;
}

std::vector<std::string> expandGlob(const std::string& pattern) {
    const std::string expanded = expandPath(pattern);
    GlobGuard guard;
    int rc = ::glob(expanded.c_str(), GLOB_BRACE, nullptr, &guard.g);
    std::vector<std::string> matches;
    if (rc == GLOB_NOMATCH) {
        return matches;
    }
    if (rc != 0) {
        throw FileIoError(ErrorKind::ReadError, std::format("Failed to expand glob pattern {}", pattern));
    }
    for (size_t i = 0; i < guard.g.gl_pathc; ++i) {
        matches.emplace_back(guard.g.gl_pathv[i]);
    }
    std::sort(matches.begin(), matches.end());
    return matches;
}

std::vector<PathResult> makeDirectories(const std::vector<std::string>& paths, bool recursive) {
    return collectPathResults(paths, {}, [recursive](const std::string& path) {
        const std::string expanded = expandPath(path);
        if (recursive) {
            std::error_code ec;
            fs::create_directories(expanded, ec);
            throwIf(ec, "create directory", expanded);
        } else if (::mkdir(expanded.c_str(), 0755) != 0) {
            const int err = errno;
            if (err != EEXIST || !isDirectory(expanded)) {
                throw errors::fromErrno(err, "create directory", expanded);
            }
        }
        LOG_DEBUG("mkdir {}", expanded);
        return PathResult::Ok(path);
    });
}

std::vector<PathResult> removePaths(const std::vector<std::string>& paths, bool recursive, bool force) {
    std::vector<SourceEntry> entries = resolveSources(paths);
    if (force) {
        // Unmatched globs are not an error under force
        for (auto& e : entries) {
            if (e.unmatched) {
                e.failure.reset();
            }
        }
    }
    return runOverSources(entries, {}, [recursive, force](const SourceEntry& entry) {
        if (entry.unmatched) {
            return PathResult::Ok(entry.label, false);
        }
        const std::string& expanded = entry.expanded;
        struct stat st{};
        if (::lstat(expanded.c_str(), &st) != 0) {
            const int err = errno;
            if (err == ENOENT && force) {
                return PathResult::Ok(entry.label, false);
            }
            throw errors::fromErrno(err, "remove", expanded);
        }
        if (S_ISDIR(st.st_mode)) {
            if (recursive) {
                removeTree(expanded);
            } else if (::rmdir(expanded.c_str()) != 0) {
                const int err = errno;
                if (err == ENOTEMPTY || err == EEXIST) {
                    throw FileIoError(ErrorKind::NotEmpty,
                        std::format("Directory is not empty: {}. Use recursive=true to remove non-empty directories",
                                    expanded));
                }
                throw errors::fromErrno(err, "remove directory", expanded);
            }
        } else if (::unlink(expanded.c_str()) != 0) {
            throw errors::fromErrno(errno, "remove", expanded);
        }
        LOG_INFO("Removed {}", expanded);
        return PathResult::Ok(entry.label, false);
    });
}

std::vector<PathResult> removeDirectories(const std::vector<std::string>& paths, bool recursive) {
    return collectPathResults(paths, {}, [recursive](const std::string& path) {
        const std::string expanded = expandPath(path);
        const struct stat st = lstatOrThrow(expanded);
        if (!S_ISDIR(st.st_mode)) {
            throw FileIoError(ErrorKind::InvalidPath, std::format("Not a directory: {}", expanded));
        }
        if (recursive) {
            removeTree(expanded);
        } else if (::rmdir(expanded.c_str()) != 0) {
            const int err = errno;
            if (err == EEXIST) {
                throw FileIoError(ErrorKind::NotEmpty, std::format("Directory is not empty: {}", expanded));
            }
            throw errors::fromErrno(err, "remove directory", expanded);
        }
        LOG_INFO("Removed directory {}", expanded);
        return PathResult::Ok(path, false);
    });
}

std::vector<PathResult> copyPaths(const std::vector<std::string>& sources, const std::string& destination,
                                  bool recursive) {
    const std::string dest = expandPath(destination);
    const bool destIsDir = isDirectory(dest);
    const std::vector<SourceEntry> entries = resolveSources(sources);
    checkDestinationForSources(entries.size(), destIsDir, destination);

    return runOverSources(entries, {"destination"}, [&](const SourceEntry& entry) {
        const std::string target = targetFor(entry.expanded, dest, destIsDir);
        ensureParentDirectories(target);
        copyOne(entry.expanded, target, recursive);
        LOG_DEBUG("Copied {} -> {}", entry.expanded, target);
        return PathResult::Ok(entry.label).with("destination", JSONValue(target));
    });
}

std::vector<PathResult> movePaths(const std::vector<std::string>& sources, const std::string& destination) {
    const std::string dest = expandPath(destination);
    const bool destIsDir = isDirectory(dest);
    const std::vector<SourceEntry> entries = resolveSources(sources);
    checkDestinationForSources(entries.size(), destIsDir, destination);

    return runOverSources(entries, {"destination"}, [&](const SourceEntry& entry) {
        const std::string target = targetFor(entry.expanded, dest, destIsDir);
        lstatOrThrow(entry.expanded);
        rejectNestedTarget(entry.expanded, target);
        ensureParentDirectories(target);
        if (::rename(entry.expanded.c_str(), target.c_str()) != 0) {
            const int err = errno;
            if (err != EXDEV) {
                throw errors::fromErrno(err, "move", entry.expanded);
            }
            // Different filesystem: copy then remove the source
            copyOne(entry.expanded, target, true);
            removeTree(entry.expanded);
        }
        LOG_INFO("Moved {} -> {}", entry.expanded, target);
        return PathResult::Ok(entry.label, false).with("destination", JSONValue(target));
    });
}

JSONValue listDirectory(const std::string& path, bool recursive, bool includeHidden) {
    const std::string expanded = expandPath(path);
    JSONValue::Array entries;
    struct stat st{};
    if (::stat(expanded.c_str(), &st) != 0) {
        if (errno == ENOENT) {
            return JSONValue{std::move(entries)};
        }
        throw errors::fromErrno(errno, "read directory", expanded, IoDirection::Read);
    }
    if (!S_ISDIR(st.st_mode)) {
        throw FileIoError(ErrorKind::InvalidPath, std::format("{} is not a directory", expanded));
    }
    collectEntries(fs::path(expanded), recursive, includeHidden, entries);
    return JSONValue{std::move(entries)};
}

void createHardLink(const std::string& target, const std::string& linkPath) {
    const std::string t = expandPath(target);
    const std::string l = expandPath(linkPath);
    if (::link(t.c_str(), l.c_str()) != 0) {
        throw errors::fromErrno(errno, "create hard link", l);
    }
    LOG_DEBUG("ln {} {}", t, l);
}

void createSymbolicLink(const std::string& target, const std::string& linkPath) {
    const std::string t = expandPath(target);
    const std::string l = expandPath(linkPath);
    if (::symlink(t.c_str(), l.c_str()) != 0) {
        throw errors::fromErrno(errno, "create symbolic link", l);
    }
    LOG_DEBUG("ln -s {} {}", t, l);
}

} // namespace ops
} // namespace fileio
