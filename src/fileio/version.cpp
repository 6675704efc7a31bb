//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.cpp
// Purpose: Version helpers for the server and the CLI.
//==========================================================================================================
#include "fileio/version.h"

#include <format>

namespace fileio {

VersionInfo getVersion() {
    return VersionInfo{0, 3, 1};
}

std::string getVersionString() {
    const auto v = getVersion();
    return std::format("{}.{}.{}", v.major, v.minor, v.patch);
}

} // namespace fileio
