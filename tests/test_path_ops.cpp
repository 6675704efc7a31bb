//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_path_ops.cpp
// Purpose: Path expansion, path-name helpers, symlink reading and temporary entries
//==========================================================================================================

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <functional>
#include <stdexcept>
#include <string>

#include "TempDir.h"
#include "fileio/errors/FileIoError.h"
#include "fileio/operations/PathOps.h"

using namespace fileio;
using fileio::test::TempDir;
using errors::ErrorKind;
using errors::FileIoError;

namespace {

ErrorKind kindOf(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const FileIoError& e) {
        return e.kind();
    }
    throw std::runtime_error("expected a FileIoError");
}

} // namespace

TEST(PathOps, ExpandsHomeAndVariables) {
    ::setenv("FILEIO_TEST_DIR", "/data/x", 1);
    const std::string home = std::getenv("HOME") ? std::getenv("HOME") : "";
    if (!home.empty()) {
        EXPECT_EQ(ops::expandPath("~/notes.txt"), home + "/notes.txt");
        EXPECT_EQ(ops::expandPath("~"), home);
    }
    EXPECT_EQ(ops::expandPath("$FILEIO_TEST_DIR/a"), "/data/x/a");
    EXPECT_EQ(ops::expandPath("${FILEIO_TEST_DIR}b"), "/data/xb");
    EXPECT_EQ(ops::expandPath("/plain/~user/$"), "/plain/~user/$");
    ::unsetenv("FILEIO_TEST_DIR");
}

TEST(PathOps, UnsetVariableIsInvalidPath) {
    ::unsetenv("FILEIO_TEST_UNSET_VAR");
    EXPECT_EQ(kindOf([] { ops::expandPath("$FILEIO_TEST_UNSET_VAR/x"); }), ErrorKind::InvalidPath);
    EXPECT_EQ(kindOf([] { ops::expandPath("${FILEIO_TEST_DIR"); }), ErrorKind::InvalidPath);
}

TEST(PathOps, BasenameAndDirname) {
    EXPECT_EQ(ops::basename("/usr/local/bin/tool"), "tool");
    EXPECT_EQ(ops::basename("/usr/local/bin/"), "bin");
    EXPECT_EQ(ops::dirname("/usr/local/bin/tool"), "/usr/local/bin");
    EXPECT_EQ(ops::dirname("/usr/local/bin/"), "/usr/local");
    EXPECT_EQ(ops::dirname("file.txt"), "");
    EXPECT_EQ(kindOf([] { ops::basename("/"); }), ErrorKind::InvalidPath);
}

TEST(PathOps, CanonicalPathResolvesDotsAndLinks) {
    TempDir dir;
    dir.write("real/file.txt", "x");
    std::filesystem::create_symlink(dir.path("real"), dir.path("alias"));
    const std::string canonical = ops::canonicalPath(dir.path("alias/../real/./file.txt"));
    EXPECT_EQ(canonical, std::filesystem::canonical(dir.path("real/file.txt")).string());
    EXPECT_EQ(kindOf([&] { ops::canonicalPath(dir.path("nope")); }), ErrorKind::NotFound);
}

TEST(PathOps, ReadSymbolicLink) {
    TempDir dir;
    const std::string target = dir.write("t.txt", "x");
    std::filesystem::create_symlink(target, dir.path("link"));
    EXPECT_EQ(ops::readSymbolicLink(dir.path("link")), target);
    EXPECT_EQ(kindOf([&] { ops::readSymbolicLink(target); }), ErrorKind::InvalidPath);
    EXPECT_EQ(kindOf([&] { ops::readSymbolicLink(dir.path("missing")); }), ErrorKind::NotFound);
}

TEST(PathOps, CreateTemporaryFileAndDirectory) {
    TempDir dir;
    const std::string file = ops::createTemporary(ops::TempKind::File, dir.path());
    EXPECT_TRUE(std::filesystem::is_regular_file(file));
    EXPECT_EQ(std::filesystem::path(file).parent_path(), std::filesystem::path(dir.path()));
    EXPECT_EQ(std::filesystem::path(file).filename().string().rfind("fileio-", 0), 0u);

    const std::string sub = ops::createTemporary(ops::TempKind::Directory, dir.path());
    EXPECT_TRUE(std::filesystem::is_directory(sub));
    EXPECT_NE(file, sub);

    EXPECT_EQ(kindOf([&] { ops::createTemporary(ops::TempKind::File, dir.path("absent")); }), ErrorKind::NotFound);
}

TEST(PathOps, CurrentDirectoryMatchesProcess) {
    EXPECT_EQ(ops::currentDirectory(), std::filesystem::current_path().string());
}
