//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: PathSandbox.h
// Purpose: Confines resource paths to a workspace root and applies file allow-rules
//==========================================================================================================

#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "toolhost/config/ServerConfig.h"

namespace toolhost {

//==========================================================================================================
// PathSandbox
// Purpose: Resolves request paths against the workspace root.
// Notes:
//   Both the root and the candidate go through std::filesystem::weakly_canonical, so ".." segments
//   are collapsed and symlinks in the existing part of the path are followed before the containment
//   check. Relative paths are taken relative to the root.
//   Read rules: no suffix and no name rule configured means every contained file is readable;
//   otherwise the file must match an exact name or end with an allowed suffix.
//==========================================================================================================
class PathSandbox {
public:
    explicit PathSandbox(const std::filesystem::path& workspaceRoot, config::SecurityConfig security = {});

    // Canonical path when it stays inside the root; nullopt for empty input or any escape.
    std::optional<std::filesystem::path> ResolvePath(const std::string& path) const;

    // Like ResolvePath but throws errors::OutOfSandboxError.
    std::filesystem::path ResolveOrThrow(const std::string& path) const;

    bool IsAllowedRead(const std::string& path) const;
    bool IsAllowedWrite(const std::string& path) const;

    const std::filesystem::path& Root() const { return root; }

    // Root-relative generic form ("src/main.cpp"); empty for the root itself.
    std::string RelativeToRoot(const std::filesystem::path& resolved) const;

private:
    static bool isWithin(const std::filesystem::path& candidate, const std::filesystem::path& base);

    std::filesystem::path root;
    config::SecurityConfig security;
};

} // namespace toolhost
