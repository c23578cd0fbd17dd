//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read TOOLCLIENT_* environment variables with defaults.
//==========================================================================================================
#pragma once
#include <cstdint>
#include <cstdlib>
#include <string>

//==========================================================================================================
// GetEnvOrDefault
// Purpose: Returns the value of the environment variable or a provided default when unset.
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
    return v ? std::string(v) : defaultValue;
}

//==========================================================================================================
// GetEnvUintOrDefault
// Purpose: Reads an unsigned integer from the environment (timeouts in milliseconds, sizes).
// Args:
//   name: Environment variable name.
//   defaultValue: Returned when the variable is unset, empty, or not a plain decimal number.
// Returns:
//   Parsed value or defaultValue.
//==========================================================================================================
inline std::uint64_t GetEnvUintOrDefault(const char* name, std::uint64_t defaultValue) {
    const std::string raw = GetEnvOrDefault(name, "");
    if (raw.empty()) {
        return defaultValue;
    }
    std::uint64_t out = 0;
    for (char c : raw) {
        if (c < '0' || c > '9') {
            return defaultValue;
        }
        out = out * 10 + static_cast<std::uint64_t>(c - '0');
    }
    return out;
}
