//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: PathSandbox.cpp
// Purpose: PathSandbox implementation
//==========================================================================================================

#include <algorithm>
#include <system_error>
#include "toolhost/PathSandbox.h"
#include "toolhost/errors/Errors.h"
#include "logging/Logger.h"

namespace fs = std::filesystem;

namespace toolhost {

namespace {
bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}
} // namespace

PathSandbox::PathSandbox(const fs::path& workspaceRoot, config::SecurityConfig sec)
    : security(std::move(sec)) {
    std::error_code ec;
    fs::path abs = fs::absolute(workspaceRoot, ec);
    if (ec) {
        throw std::invalid_argument("Invalid workspace root: " + workspaceRoot.string());
    }
    root = fs::weakly_canonical(abs, ec);
    if (ec) {
        throw std::invalid_argument("Cannot canonicalize workspace root: " + workspaceRoot.string());
    }
    LOG_DEBUG("PathSandbox root={}", root.string());
}

bool PathSandbox::isWithin(const fs::path& candidate, const fs::path& base) {
    auto c = candidate.begin();
    for (auto b = base.begin(); b != base.end(); ++b, ++c) {
        // A trailing separator shows up as an empty element
        if (b->empty()) continue;
        if (c == candidate.end() || *c != *b) {
            return false;
        }
    }
    return true;
}

std::optional<fs::path> PathSandbox::ResolvePath(const std::string& path) const {
    if (path.empty() || path.find('\0') != std::string::npos) {
        return std::nullopt;
    }
    fs::path requested(path);
    fs::path joined = requested.is_absolute() ? requested : (root / requested);
    std::error_code ec;
    fs::path canonical = fs::weakly_canonical(joined, ec);
    if (ec) {
        LOG_DEBUG("PathSandbox could not canonicalize {}: {}", path, ec.message());
        return std::nullopt;
    }
    if (!isWithin(canonical, root)) {
        LOG_WARN("PathSandbox rejected path outside workspace: {}", path);
        return std::nullopt;
    }
    return canonical;
}

fs::path PathSandbox::ResolveOrThrow(const std::string& path) const {
    auto resolved = ResolvePath(path);
    if (!resolved.has_value()) {
        throw errors::OutOfSandboxError(path);
    }
    return resolved.value();
}

bool PathSandbox::IsAllowedRead(const std::string& path) const {
    auto resolved = ResolvePath(path);
    if (!resolved.has_value()) {
        return false;
    }
    if (security.allowedFileSuffixes.empty() && security.allowedFileNames.empty()) {
        return true;
    }
    const std::string filename = resolved->filename().string();
    if (std::find(security.allowedFileNames.begin(), security.allowedFileNames.end(), filename) !=
        security.allowedFileNames.end()) {
        return true;
    }
    const std::string full = resolved->generic_string();
    for (const auto& suffix : security.allowedFileSuffixes) {
        if (endsWith(full, suffix)) {
            return true;
        }
    }
    return false;
}

bool PathSandbox::IsAllowedWrite(const std::string& path) const {
    auto resolved = ResolvePath(path);
    if (!resolved.has_value()) {
        return false;
    }
    for (const auto& dir : security.protectedDirectories) {
        fs::path p(dir);
        std::error_code ec;
        fs::path protectedPath = fs::weakly_canonical(p.is_absolute() ? p : (root / p), ec);
        if (ec) {
            continue;
        }
        if (isWithin(*resolved, protectedPath)) {
            return false;
        }
    }
    return true;
}

std::string PathSandbox::RelativeToRoot(const fs::path& resolved) const {
    std::string rel = resolved.lexically_relative(root).generic_string();
    return rel == "." ? std::string() : rel;
}

} // namespace toolhost
