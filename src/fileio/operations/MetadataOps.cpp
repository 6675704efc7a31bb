//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MetadataOps.cpp
// Purpose: stat/chmod/touch/chown over POSIX calls
//==========================================================================================================

#include "fileio/operations/MetadataOps.h"
#include "fileio/operations/FileAccess.h"
#include "fileio/operations/PathOps.h"
#include "fileio/errors/FileIoError.h"
#include "logging/Logger.h"

#include <cerrno>
#include <cstdio>
#include <format>
#include <vector>
#include <fcntl.h>
#include <grp.h>
#include <pwd.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fileio {
namespace ops {

using errors::ErrorKind;
using errors::FileIoError;
using errors::IoDirection;
using errors::ToolParamError;

namespace {

struct stat lstatOrThrow(const std::string& expanded) {
    struct stat st{};
    if (::lstat(expanded.c_str(), &st) != 0) {
        throw errors::fromErrno(errno, "read metadata of", expanded, IoDirection::Read);
    }
    return st;
}

JSONValue epochSeconds(const struct timespec& ts) {
    return JSONValue(std::to_string(static_cast<long long>(ts.tv_sec)));
}

JSONValue birthTime(const std::string& expanded) {
#ifdef STATX_BTIME
    struct statx stx{};
    if (::statx(AT_FDCWD, expanded.c_str(), 0, STATX_BTIME, &stx) == 0 && (stx.stx_mask & STATX_BTIME)) {
        return JSONValue(std::to_string(static_cast<long long>(stx.stx_btime.tv_sec)));
    }
#else
    (void)expanded;
#endif
    return JSONValue(nullptr);
}

bool allDigits(const std::string& s) {
    if (s.empty() || s.size() > 10) return false;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
    }
    return true;
}

} // namespace

mode_t parseOctalMode(const std::string& mode) {
    std::string digits = mode;
    if (digits.size() > 2 && digits[0] == '0' && (digits[1] == 'o' || digits[1] == 'O')) {
        digits = digits.substr(2);
    }
    if (digits.empty() || digits.size() > 4) {
        throw ToolParamError(std::format("Invalid mode '{}': expected 3 or 4 octal digits", mode));
    }
    mode_t value = 0;
    for (char c : digits) {
        if (c < '0' || c > '7') {
            throw ToolParamError(std::format("Invalid mode '{}': '{}' is not an octal digit", mode, c));
        }
        value = static_cast<mode_t>((value << 3) | static_cast<mode_t>(c - '0'));
    }
    return value;
}

std::string formatMode(mode_t mode) {
    return std::format("{:04o}", static_cast<unsigned int>(mode & 07777));
}

std::vector<PathResult> statPaths(const std::vector<std::string>& paths) {
    return collectPathResults(paths, {"type"}, [](const std::string& path) {
        const std::string expanded = expandPath(path);
        struct stat lst = lstatOrThrow(expanded);
        const bool isSymlink = S_ISLNK(lst.st_mode);
        // Follow symlinks for size/mode/times; a dangling link reports its own metadata
        struct stat st = lst;
        if (isSymlink) {
            struct stat target{};
            if (::stat(expanded.c_str(), &target) == 0) {
                st = target;
            }
        }
        const char* type = isSymlink ? "symlink"
                         : S_ISDIR(st.st_mode) ? "directory"
                         : S_ISREG(st.st_mode) ? "file"
                         : "unknown";
        PathResult r = PathResult::Ok(path);
        r.with("type", JSONValue(type))
         .with("size", JSONValue(static_cast<int64_t>(st.st_size)))
         .with("mode", JSONValue(formatMode(st.st_mode)))
         .with("modified", epochSeconds(st.st_mtim))
         .with("accessed", epochSeconds(st.st_atim))
         .with("created", birthTime(expanded))
         .with("is_file", JSONValue(S_ISREG(st.st_mode)))
         .with("is_dir", JSONValue(S_ISDIR(st.st_mode)))
         .with("is_symlink", JSONValue(isSymlink));
        return r;
    });
}

std::vector<PathResult> getPermissions(const std::vector<std::string>& paths) {
    return collectPathResults(paths, {"mode"}, [](const std::string& path) {
        const std::string expanded = expandPath(path);
        struct stat st{};
        if (::stat(expanded.c_str(), &st) != 0) {
            throw errors::fromErrno(errno, "read permissions of", expanded, IoDirection::Read);
        }
        return PathResult::Ok(path).with("mode", JSONValue(formatMode(st.st_mode)));
    });
}

std::vector<PathResult> setPermissions(const std::vector<std::string>& paths, mode_t mode) {
    return collectPathResults(paths, {"mode"}, [mode](const std::string& path) {
        const std::string expanded = expandPath(path);
        if (::chmod(expanded.c_str(), mode) != 0) {
            throw errors::fromErrno(errno, "change permissions of", expanded);
        }
        LOG_DEBUG("chmod {} {}", formatMode(mode), expanded);
        return PathResult::Ok(path).with("mode", JSONValue(formatMode(mode)));
    });
}

std::vector<PathResult> touch(const std::vector<std::string>& paths) {
    return collectPathResults(paths, {"created"}, [](const std::string& path) {
        const std::string expanded = expandPath(path);
        struct stat st{};
        if (::stat(expanded.c_str(), &st) == 0) {
            // nullptr times means "now" for both atime and mtime
            if (::utimensat(AT_FDCWD, expanded.c_str(), nullptr, 0) != 0) {
                throw errors::fromErrno(errno, "update timestamps of", expanded);
            }
            return PathResult::Ok(path).with("created", JSONValue(false));
        }
        ensureParentDirectories(expanded);
        int fd = ::open(expanded.c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, 0644);
        if (fd < 0) {
            throw errors::fromErrno(errno, "create", expanded);
        }
        ::close(fd);
        return PathResult::Ok(path).with("created", JSONValue(true));
    });
}

uid_t resolveUser(const std::string& user) {
    if (allDigits(user)) {
        return static_cast<uid_t>(std::stoul(user));
    }
    std::vector<char> buf(16384);
    struct passwd pwd{};
    struct passwd* result = nullptr;
    int rc = ::getpwnam_r(user.c_str(), &pwd, buf.data(), buf.size(), &result);
    if (rc != 0 || result == nullptr) {
        throw ToolParamError(std::format("Unknown user: {}", user));
    }
    return result->pw_uid;
}

gid_t resolveGroup(const std::string& group) {
    if (allDigits(group)) {
        return static_cast<gid_t>(std::stoul(group));
    }
    std::vector<char> buf(16384);
    struct group grp{};
    struct group* result = nullptr;
    int rc = ::getgrnam_r(group.c_str(), &grp, buf.data(), buf.size(), &result);
    if (rc != 0 || result == nullptr) {
        throw ToolParamError(std::format("Unknown group: {}", group));
    }
    return result->gr_gid;
}

std::vector<PathResult> changeOwnership(const std::vector<std::string>& paths,
                                        std::optional<uid_t> uid, std::optional<gid_t> gid) {
    if (!uid.has_value() && !gid.has_value()) {
        throw ToolParamError("At least one of user or group must be provided");
    }
    // -1 leaves the corresponding id unchanged
    const uid_t newUid = uid.has_value() ? *uid : static_cast<uid_t>(-1);
    const gid_t newGid = gid.has_value() ? *gid : static_cast<gid_t>(-1);
    return collectPathResults(paths, {"uid", "gid"}, [newUid, newGid](const std::string& path) {
        const std::string expanded = expandPath(path);
        if (::chown(expanded.c_str(), newUid, newGid) != 0) {
            throw errors::fromErrno(errno, "change ownership of", expanded);
        }
        struct stat st{};
        if (::stat(expanded.c_str(), &st) != 0) {
            throw errors::fromErrno(errno, "read metadata of", expanded, IoDirection::Read);
        }
        LOG_INFO("chown {}:{} {}", st.st_uid, st.st_gid, expanded);
        return PathResult::Ok(path)
            .with("uid", JSONValue(static_cast<int64_t>(st.st_uid)))
            .with("gid", JSONValue(static_cast<int64_t>(st.st_gid)));
    });
}

} // namespace ops
} // namespace fileio
