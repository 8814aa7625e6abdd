//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read MCPHOST_* environment overrides safely.
//==========================================================================================================
#pragma once
#include <cstdlib>
#include <stdexcept>
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
// GetEnvPositiveIntOrDefault
// Purpose: Parses a strictly positive integer (e.g. a millisecond timeout) from the environment.
// Returns:
//   The parsed value, or defaultValue when unset, empty, malformed, trailing garbage or <= 0.
//==========================================================================================================
inline long long GetEnvPositiveIntOrDefault(const char* name, long long defaultValue) {
    const std::string v = GetEnvOrDefault(name, "");
    if (v.empty()) {
        return defaultValue;
    }
    try {
        std::size_t used = 0;
        long long parsed = std::stoll(v, &used);
        if (used == v.size() && parsed > 0) {
            return parsed;
        }
    } catch (const std::logic_error&) {
        return defaultValue;
    }
    return defaultValue;
}
