//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerConfig.h
// Purpose: Construction-time configuration for the tool host (timeouts, concurrency, limits, sandbox rules)
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "toolhost/validation/Validation.h"

namespace toolhost {
namespace config {

//==========================================================================================================
// SizeLimits
// Purpose: Byte limits applied to serialized payloads. Parameters must fit inside a message.
//==========================================================================================================
struct SizeLimits {
    int64_t maxParameterSize = 1024 * 1024;         // 1MB
    int64_t maxResultSize = 10 * 1024 * 1024;       // 10MB
    int64_t maxResourceSize = 50 * 1024 * 1024;     // 50MB
    int64_t maxMessageSize = 2 * 1024 * 1024;       // 2MB

    // Throws std::invalid_argument when a limit is non-positive or parameters exceed the message limit.
    void Validate() const;
};

struct ConcurrencyConfig {
    int maxConcurrency = 10;
    std::unordered_map<std::string, int> perToolLimits;
};

struct TimeoutConfig {
    std::chrono::milliseconds defaultTimeout{std::chrono::minutes(5)};
    std::unordered_map<std::string, std::chrono::milliseconds> perToolTimeouts;
};

// Path sandbox rules. An empty list means the rule is not configured.
struct SecurityConfig {
    std::vector<std::string> allowedFileSuffixes;
    std::vector<std::string> allowedFileNames;
    std::vector<std::string> protectedDirectories;
};

struct LoggingConfig {
    bool enabled = true;
    std::string level = "info";
    bool includeCorrelationIds = true;
};

//==========================================================================================================
// ServerConfig
// Purpose: Aggregate configuration consumed once at server construction.
// Notes:
//   FromEnvironment() starts from the defaults and overlays TOOLHOST_* variables.
//==========================================================================================================
struct ServerConfig {
    std::string workspaceRoot = ".";
    ConcurrencyConfig concurrency;
    TimeoutConfig timeouts;
    SecurityConfig security;
    LoggingConfig logging;
    SizeLimits sizeLimits;
    validation::ValidationMode validationMode = validation::ValidationMode::Off;

    static ServerConfig Defaults();
    static ServerConfig FromEnvironment();

    // Throws std::invalid_argument naming the first offending field.
    void Validate() const;

    // Effective timeout for a tool: per-tool override, else the default.
    std::chrono::milliseconds TimeoutFor(const std::string& toolName) const;
};

} // namespace config
} // namespace toolhost
