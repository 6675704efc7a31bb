//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SearchOps.cpp
// Purpose: Directory walking, name matching, and regex content search
//==========================================================================================================

#include "fileio/operations/SearchOps.h"
#include "fileio/operations/FileAccess.h"
#include "fileio/operations/PathOps.h"
#include "fileio/errors/FileIoError.h"
#include "logging/Logger.h"

#include <algorithm>
#include <cerrno>
#include <filesystem>
#include <format>
#include <functional>
#include <stdexcept>
#include <fnmatch.h>
#include <sys/stat.h>

#include <boost/regex.hpp>

namespace fileio {
namespace ops {

namespace fs = std::filesystem;
using errors::ErrorKind;
using errors::FileIoError;
using errors::IoDirection;

namespace {

// Entry seen by the walker. depth is 1 for direct children of the root.
struct WalkEntry {
    fs::path path;
    std::string name;
    struct stat st;
    std::uint64_t depth;
};

// Visits entries under root in sorted order without following symlinked directories.
// enter decides whether a directory is descended into; visit sees every entry that passes.
void walk(const fs::path& root, std::uint64_t depth, const std::optional<std::uint64_t>& maxDepth,
          const std::function<bool(const WalkEntry&)>& enter,
          const std::function<void(const WalkEntry&)>& visit) {
    if (maxDepth.has_value() && depth > *maxDepth) return;

    std::error_code ec;
    fs::directory_iterator it(root, ec);
    if (ec) {
        LOG_WARN("Cannot read directory {}: {}", root.string(), ec.message());
        return;
    }
    std::vector<fs::path> children;
    for (const auto& entry : it) {
        children.push_back(entry.path());
    }
    std::sort(children.begin(), children.end());

    for (const auto& child : children) {
        WalkEntry e{child, child.filename().string(), {}, depth};
        if (::lstat(child.c_str(), &e.st) != 0) {
            continue;
        }
        if (!enter(e)) continue;
        visit(e);
        if (S_ISDIR(e.st.st_mode)) {
            walk(child, depth + 1, maxDepth, enter, visit);
        }
    }
}

bool isHidden(const std::string& name) {
    return !name.empty() && name[0] == '.';
}

// {a,b}c -> ac, bc. Nested groups expand recursively; an unbalanced brace is kept literally.
std::vector<std::string> expandBraces(const std::string& pattern) {
    const std::size_t open = pattern.find('{');
    if (open == std::string::npos) return {pattern};

    int depth = 0;
    std::size_t close = std::string::npos;
    std::vector<std::size_t> commas;
    for (std::size_t i = open; i < pattern.size(); ++i) {
        if (pattern[i] == '{') {
            ++depth;
        } else if (pattern[i] == '}') {
            if (--depth == 0) {
                close = i;
                break;
            }
        } else if (pattern[i] == ',' && depth == 1) {
            commas.push_back(i);
        }
    }
    if (close == std::string::npos) return {pattern};

    const std::string prefix = pattern.substr(0, open);
    const std::string suffix = pattern.substr(close + 1);
    std::vector<std::string> out;
    std::size_t start = open + 1;
    commas.push_back(close);
    for (std::size_t comma : commas) {
        for (auto& expanded : expandBraces(prefix + pattern.substr(start, comma - start) + suffix)) {
            out.push_back(std::move(expanded));
        }
        start = comma + 1;
    }
    return out;
}

std::string escapeRegex(const std::string& literal) {
    static const std::string special = "\\^$.|?*+()[]{}/";
    std::string out;
    out.reserve(literal.size() * 2);
    for (char c : literal) {
        if (special.find(c) != std::string::npos) out.push_back('\\');
        out.push_back(c);
    }
    return out;
}

// Perl syntax. ^ and $ match at line boundaries only in multiline mode; '.' never crosses a newline.
// boost::regex matches without recursion, so long lines cannot exhaust the thread's stack.
const boost::match_flag_type kMatchFlags = boost::match_default | boost::match_not_dot_newline;

boost::regex compileSearchRegex(const FindInFilesOptions& options) {
    std::string source = options.useRegex ? options.pattern : escapeRegex(options.pattern);
    if (options.wholeWord) {
        source = "\\b(?:" + source + ")\\b";
    }
    boost::regex::flag_type flags = boost::regex::perl;
    if (!options.caseSensitive) flags |= boost::regex::icase;
    if (!options.multiline) flags |= boost::regex::no_mod_m;
    try {
        return boost::regex(source, flags);
    } catch (const boost::regex_error& e) {
        throw FileIoError(ErrorKind::RegexError, std::format("Invalid pattern '{}': {}", options.pattern, e.what()));
    }
}

// Offsets at which each line starts; entry 0 is always 0.
std::vector<std::size_t> lineStarts(const std::string& content) {
    std::vector<std::size_t> starts{0};
    for (std::size_t i = 0; i < content.size(); ++i) {
        if (content[i] == '\n') starts.push_back(i + 1);
    }
    return starts;
}

void searchContent(const std::string& filePath, const std::string& content, const boost::regex& re,
                   const FindInFilesOptions& options, std::vector<SearchMatch>& out) {
    std::uint64_t count = 0;
    const auto limitReached = [&]() { return options.maxCount.has_value() && count >= *options.maxCount; };

    if (options.multiline) {
        const auto starts = lineStarts(content);
        for (auto it = boost::sregex_iterator(content.begin(), content.end(), re, kMatchFlags);
             it != boost::sregex_iterator() && !limitReached(); ++it) {
            const std::size_t pos = static_cast<std::size_t>(it->position());
            if (it->length() == 0) continue;
            const auto line = std::upper_bound(starts.begin(), starts.end(), pos) - starts.begin();
            const std::size_t lineStart = starts[static_cast<std::size_t>(line - 1)];
            out.push_back(SearchMatch{filePath, static_cast<std::uint64_t>(line), pos - lineStart,
                                      pos - lineStart + static_cast<std::size_t>(it->length()), it->str()});
            ++count;
        }
        return;
    }

    std::uint64_t lineNumber = 0;
    std::size_t start = 0;
    while (start <= content.size() && !limitReached()) {
        std::size_t end = content.find('\n', start);
        if (end == std::string::npos) {
            if (start == content.size()) break;
            end = content.size();
        }
        ++lineNumber;
        std::string line = content.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        for (auto it = boost::sregex_iterator(line.begin(), line.end(), re, kMatchFlags);
             it != boost::sregex_iterator() && !limitReached(); ++it) {
            if (it->length() == 0) continue;
            const std::size_t pos = static_cast<std::size_t>(it->position());
            out.push_back(SearchMatch{filePath, lineNumber, pos, pos + static_cast<std::size_t>(it->length()),
                                      it->str()});
            ++count;
        }
        start = end + 1;
    }
}

void searchFile(const std::string& filePath, const boost::regex& re, const FindInFilesOptions& options,
                std::vector<SearchMatch>& out) {
    std::string content;
    try {
        content = readTextFile(filePath);
    } catch (const FileIoError& e) {
        LOG_WARN("Skipping {}: {}", filePath, e.describe());
        return;
    }
    if (!isValidUtf8(content)) {
        LOG_DEBUG("Skipping non UTF-8 file {}", filePath);
        return;
    }
    // Matches found before the matcher gave up are kept
    try {
        searchContent(filePath, content, re, options, out);
    } catch (const std::runtime_error& e) {
        LOG_WARN("Skipping rest of {}: pattern '{}' too complex to match: {}", filePath, options.pattern, e.what());
    }
}

} // namespace

bool globMatch(const std::string& pattern, const std::string& name) {
    for (const auto& alternative : expandBraces(pattern)) {
        if (::fnmatch(alternative.c_str(), name.c_str(), 0) == 0) return true;
    }
    return false;
}

bool isValidUtf8(const std::string& text) {
    const auto* s = reinterpret_cast<const unsigned char*>(text.data());
    const std::size_t n = text.size();
    std::size_t i = 0;
    while (i < n) {
        const unsigned char c = s[i];
        std::size_t extra;
        std::uint32_t cp;
        if (c < 0x80) { ++i; continue; }
        else if ((c & 0xE0) == 0xC0) { extra = 1; cp = c & 0x1F; }
        else if ((c & 0xF0) == 0xE0) { extra = 2; cp = c & 0x0F; }
        else if ((c & 0xF8) == 0xF0) { extra = 3; cp = c & 0x07; }
        else return false;
        if (i + extra >= n) return false;
        for (std::size_t k = 1; k <= extra; ++k) {
            if ((s[i + k] & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (s[i + k] & 0x3F);
        }
        // Overlong encodings, surrogates, and values past U+10FFFF
        if ((extra == 1 && cp < 0x80) || (extra == 2 && cp < 0x800) || (extra == 3 && cp < 0x10000)) return false;
        if ((cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) return false;
        i += extra + 1;
    }
    return true;
}

std::vector<std::string> findFiles(const FindFilesOptions& options) {
    const std::string root = expandPath(options.root.empty() ? std::string(".") : options.root);
    struct stat st{};
    if (::stat(root.c_str(), &st) != 0) {
        throw errors::fromErrno(errno, "search", root, IoDirection::Read);
    }
    const bool isGlob = options.pattern.find_first_of("*?") != std::string::npos;
    const std::string type = options.fileType.value_or("");

    std::vector<std::string> found;
    if (!S_ISDIR(st.st_mode)) {
        return found;
    }
    walk(fs::path(root), 1, options.maxDepth,
         [](const WalkEntry&) { return true; },
         [&](const WalkEntry& e) {
             const bool nameMatches = isGlob ? globMatch(options.pattern, e.name)
                                             : e.name.find(options.pattern) != std::string::npos;
             if (!nameMatches) return;
             if (type == "file" && !S_ISREG(e.st.st_mode)) return;
             if ((type == "dir" || type == "directory") && !S_ISDIR(e.st.st_mode)) return;
             if (type == "symlink" && !S_ISLNK(e.st.st_mode)) return;
             found.push_back(e.path.string());
         });
    LOG_DEBUG("find '{}' under {}: {} match(es)", options.pattern, root, found.size());
    return found;
}

std::vector<SearchMatch> findInFiles(const FindInFilesOptions& options) {
    const std::string root = expandPath(options.path);
    struct stat st{};
    if (::stat(root.c_str(), &st) != 0) {
        throw errors::fromErrno(errno, "search", root, IoDirection::Read);
    }
    const boost::regex re = compileSearchRegex(options);

    std::vector<SearchMatch> matches;
    if (!S_ISDIR(st.st_mode)) {
        searchFile(root, re, options, matches);
        return matches;
    }
    walk(fs::path(root), 1, options.maxDepth,
         [&](const WalkEntry& e) {
             if (!options.includeHidden && isHidden(e.name)) return false;
             if (options.excludeGlob.has_value() && globMatch(*options.excludeGlob, e.name)) return false;
             return true;
         },
         [&](const WalkEntry& e) {
             if (!S_ISREG(e.st.st_mode)) return;
             if (options.fileGlob.has_value() && !globMatch(*options.fileGlob, e.name)) return;
             searchFile(e.path.string(), re, options, matches);
         });
    LOG_DEBUG("grep '{}' under {}: {} match(es)", options.pattern, root, matches.size());
    return matches;
}

JSONValue SearchMatch::ToJSON() const {
    JSONValue::Object obj;
    obj["file_path"] = std::make_shared<JSONValue>(filePath);
    obj["line_number"] = std::make_shared<JSONValue>(static_cast<int64_t>(lineNumber));
    obj["column_start"] = std::make_shared<JSONValue>(static_cast<int64_t>(columnStart));
    obj["column_end"] = std::make_shared<JSONValue>(static_cast<int64_t>(columnEnd));
    obj["matched_text"] = std::make_shared<JSONValue>(matchedText);
    return JSONValue{std::move(obj)};
}

JSONValue MatchesToJSON(const std::vector<SearchMatch>& matches) {
    JSONValue::Array arr;
    arr.reserve(matches.size());
    for (const auto& m : matches) {
        arr.push_back(std::make_shared<JSONValue>(m.ToJSON()));
    }
    return JSONValue{std::move(arr)};
}

} // namespace ops
} // namespace fileio
