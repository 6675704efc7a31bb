//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read environment variables safely, with typed fallbacks for configuration.
//==========================================================================================================
#pragma once
#include <cstdlib>
#include <cstdint>
#include <string>

//==========================================================================================================
// GetEnvOrDefault
// Purpose: Returns the value of the environment variable or a provided default when unset/empty.
// Args:
//   name: C-string name of the environment variable. When null or empty, returns defaultValue.
//   defaultValue: Value to return when the variable is not set.
// Returns:
//   std::string with the environment value (when set) or defaultValue otherwise.
//==========================================================================================================
inline std::string GetEnvOrDefault(const char* name, const std::string& defaultValue) {
    if (name == nullptr || *name == '\0') {
        return defaultValue;
    }
    const char* v = std::getenv(name);
    if (v == nullptr || *v == '\0') {
        return defaultValue;
    }
    return std::string(v);
}

//==========================================================================================================
// GetEnvUInt64OrDefault
// Purpose: Reads an unsigned decimal environment variable. Malformed or negative values yield the default.
//==========================================================================================================
inline std::uint64_t GetEnvUInt64OrDefault(const char* name, std::uint64_t defaultValue) {
    const std::string v = GetEnvOrDefault(name, std::string());
    if (v.empty()) {
        return defaultValue;
    }
    std::uint64_t out = 0;
    for (char c : v) {
        if (c < '0' || c > '9') {
            return defaultValue;
        }
        out = out * 10 + static_cast<std::uint64_t>(c - '0');
    }
    return out;
}

// Accepts 1/true/yes/on (case-sensitive lower or upper) as true.
inline bool GetEnvBoolOrDefault(const char* name, bool defaultValue) {
    const std::string v = GetEnvOrDefault(name, std::string());
    if (v.empty()) {
        return defaultValue;
    }
    return v == "1" || v == "true" || v == "TRUE" || v == "yes" || v == "on";
}
