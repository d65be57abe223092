//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerConfig.cpp
// Purpose: Defaults, environment overlay and validation for ServerConfig
//==========================================================================================================

#include <sstream>
#include <stdexcept>
#include "toolhost/config/ServerConfig.h"
#include "env/EnvVars.h"
#include "logging/Logger.h"

namespace toolhost {
namespace config {

namespace {
std::vector<std::string> splitList(const std::string& raw) {
    std::vector<std::string> out;
    std::stringstream ss(raw);
    std::string item;
    while (std::getline(ss, item, ',')) {
        const auto b = item.find_first_not_of(" \t");
        const auto e = item.find_last_not_of(" \t");
        if (b != std::string::npos) {
            out.push_back(item.substr(b, e - b + 1));
        }
    }
    return out;
}
} // namespace

void SizeLimits::Validate() const {
    if (maxParameterSize <= 0) throw std::invalid_argument("maxParameterSize must be positive");
    if (maxResultSize <= 0) throw std::invalid_argument("maxResultSize must be positive");
    if (maxResourceSize <= 0) throw std::invalid_argument("maxResourceSize must be positive");
    if (maxMessageSize <= 0) throw std::invalid_argument("maxMessageSize must be positive");
    if (maxParameterSize > maxMessageSize) {
        throw std::invalid_argument("maxParameterSize must not exceed maxMessageSize");
    }
}

ServerConfig ServerConfig::Defaults() {
    return ServerConfig{};
}

ServerConfig ServerConfig::FromEnvironment() {
    ServerConfig cfg = Defaults();
    cfg.workspaceRoot = GetEnvOrDefault("TOOLHOST_WORKSPACE_ROOT", cfg.workspaceRoot);
    cfg.timeouts.defaultTimeout = std::chrono::milliseconds(
        GetEnvIntOrDefault("TOOLHOST_DEFAULT_TIMEOUT_MS", cfg.timeouts.defaultTimeout.count()));
    cfg.concurrency.maxConcurrency = static_cast<int>(
        GetEnvIntOrDefault("TOOLHOST_MAX_CONCURRENCY", cfg.concurrency.maxConcurrency));
    cfg.sizeLimits.maxParameterSize = GetEnvIntOrDefault("TOOLHOST_MAX_PARAMETER_BYTES", cfg.sizeLimits.maxParameterSize);
    cfg.sizeLimits.maxResultSize = GetEnvIntOrDefault("TOOLHOST_MAX_RESULT_BYTES", cfg.sizeLimits.maxResultSize);
    cfg.sizeLimits.maxResourceSize = GetEnvIntOrDefault("TOOLHOST_MAX_RESOURCE_BYTES", cfg.sizeLimits.maxResourceSize);
    cfg.sizeLimits.maxMessageSize = GetEnvIntOrDefault("TOOLHOST_MAX_MESSAGE_BYTES", cfg.sizeLimits.maxMessageSize);
    cfg.logging.level = GetEnvOrDefault("TOOLHOST_LOG_LEVEL", cfg.logging.level);
    cfg.validationMode = validation::parseMode(GetEnvOrDefault("TOOLHOST_VALIDATION_MODE", "off"));

    const std::string suffixes = GetEnvOrDefault("TOOLHOST_ALLOWED_SUFFIXES", "");
    if (!suffixes.empty()) {
        cfg.security.allowedFileSuffixes = splitList(suffixes);
    }
    const std::string names = GetEnvOrDefault("TOOLHOST_ALLOWED_FILENAMES", "");
    if (!names.empty()) {
        cfg.security.allowedFileNames = splitList(names);
    }
    LOG_DEBUG("ServerConfig from environment: root={} timeoutMs={} maxConcurrency={} validation={}",
              cfg.workspaceRoot, cfg.timeouts.defaultTimeout.count(), cfg.concurrency.maxConcurrency,
              validation::toString(cfg.validationMode));
    return cfg;
}

void ServerConfig::Validate() const {
    if (timeouts.defaultTimeout.count() <= 0) {
        throw std::invalid_argument("timeouts.defaultTimeout must be positive");
    }
    for (const auto& [tool, timeout] : timeouts.perToolTimeouts) {
        if (timeout.count() <= 0) {
            throw std::invalid_argument("timeouts.perToolTimeouts[" + tool + "] must be positive");
        }
    }
    if (concurrency.maxConcurrency <= 0) {
        throw std::invalid_argument("maxConcurrency must be positive");
    }
    for (const auto& [tool, limit] : concurrency.perToolLimits) {
        if (limit <= 0) {
            throw std::invalid_argument("perToolLimits[" + tool + "] must be positive");
        }
    }
    if (workspaceRoot.empty()) {
        throw std::invalid_argument("workspaceRoot must not be empty");
    }
    sizeLimits.Validate();
}

std::chrono::milliseconds ServerConfig::TimeoutFor(const std::string& toolName) const {
    auto it = timeouts.perToolTimeouts.find(toolName);
    if (it != timeouts.perToolTimeouts.end()) {
        return it->second;
    }
    return timeouts.defaultTimeout;
}

} // namespace config
} // namespace toolhost
