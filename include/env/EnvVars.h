//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read environment variables with typed fallbacks.
//==========================================================================================================
#pragma once
#include <cstdlib>
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
// GetEnvIntOrDefault
// Purpose: Parses a non-negative integer environment variable; falls back on unset or malformed input.
//==========================================================================================================
inline long long GetEnvIntOrDefault(const char* name, long long defaultValue) {
    const std::string raw = GetEnvOrDefault(name, "");
    if (raw.empty()) {
        return defaultValue;
    }
    char* end = nullptr;
    const long long v = std::strtoll(raw.c_str(), &end, 10);
    if (end == raw.c_str() || *end != '\0' || v < 0) {
        return defaultValue;
    }
    return v;
}
