//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.h
// Purpose: Version of the fileio-mcp server, reported in serverInfo and by --version.
//==========================================================================================================
#pragma once

#include <string>

namespace fileio {

//==========================================================================================================
// VersionInfo
// Purpose: Semantic version components.
//==========================================================================================================
struct VersionInfo {
    int major;
    int minor;
    int patch;
};

VersionInfo getVersion();

//==========================================================================================================
// getVersionString
// Returns:
//   "MAJOR.MINOR.PATCH"
//==========================================================================================================
std::string getVersionString();

// Name advertised in serverInfo.
constexpr const char* SERVER_NAME = "fileio-mcp";

} // namespace fileio
