//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: WorkspaceResourceStrategy.cpp
// Purpose: WorkspaceResourceStrategy implementation
//==========================================================================================================

#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <system_error>
#include "toolhost/resources/WorkspaceResourceStrategy.h"
#include "toolhost/errors/Errors.h"
#include "logging/Logger.h"

namespace fs = std::filesystem;

namespace toolhost {
namespace resources {

WorkspaceResourceStrategy::WorkspaceResourceStrategy(std::shared_ptr<PathSandbox> sb,
                                                     std::shared_ptr<validation::SizeValidator> sv)
    : sandbox(std::move(sb)), sizeValidator(std::move(sv)) {}

void WorkspaceResourceStrategy::SetPathSandbox(std::shared_ptr<PathSandbox> sb) {
    sandbox = std::move(sb);
}

void WorkspaceResourceStrategy::SetSizeValidator(std::shared_ptr<validation::SizeValidator> sv) {
    sizeValidator = std::move(sv);
}

const PathSandbox& WorkspaceResourceStrategy::sandboxOrThrow() const {
    if (!sandbox) {
        throw std::logic_error("PathSandbox must be configured for WorkspaceResourceStrategy");
    }
    return *sandbox;
}

ResourceListResult WorkspaceResourceStrategy::List(const ResourceListParams& params) const {
    FUNC_SCOPE();
    const PathSandbox& sb = sandboxOrThrow();

    std::string dir;
    if (params.directory.has_value()) {
        dir = StripPrefix(params.directory.value(), kPrefix);
    } else if (params.uri.has_value()) {
        dir = StripPrefix(params.uri.value(), kPrefix);
    }
    const fs::path base = dir.empty() ? sb.Root() : sb.ResolveOrThrow(dir);

    std::error_code ec;
    if (!fs::is_directory(base, ec)) {
        throw errors::ResourceNotFoundError(std::string(kPrefix) + dir);
    }

    std::vector<ResourceItem> items;
    fs::recursive_directory_iterator it(base, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        LOG_WARN("Workspace listing failed for {}: {}", base.string(), ec.message());
        throw errors::ResourceNotFoundError(std::string(kPrefix) + dir);
    }
    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            LOG_WARN("Workspace listing stopped early: {}", ec.message());
            break;
        }
        std::error_code fec;
        if (!it->is_regular_file(fec) || it->is_symlink(fec)) {
            continue;
        }
        const std::string path = it->path().string();
        if (!sb.IsAllowedRead(path)) {
            continue;
        }
        auto resolved = sb.ResolvePath(path);
        if (!resolved.has_value()) {
            continue;
        }
        const auto size = it->file_size(fec);
        items.push_back(ResourceItem{std::string(kPrefix) + sb.RelativeToRoot(*resolved),
                                     fec ? int64_t{0} : static_cast<int64_t>(size), std::nullopt});
    }
    std::sort(items.begin(), items.end(),
              [](const ResourceItem& a, const ResourceItem& b) { return a.uri < b.uri; });
    LOG_DEBUG("Workspace list dir={} total={}", base.string(), items.size());
    return Paginate(std::move(items), params.page, params.pageSize);
}

ResourceReadResult WorkspaceResourceStrategy::Read(const ResourceReadParams& params) const {
    FUNC_SCOPE();
    const PathSandbox& sb = sandboxOrThrow();
    const std::string path = StripPrefix(params.uri, kPrefix);
    const fs::path resolved = sb.ResolveOrThrow(path);
    if (!sb.IsAllowedRead(resolved.string())) {
        throw errors::OutOfSandboxError(path, "File access not allowed");
    }
    std::error_code ec;
    if (!fs::is_regular_file(resolved, ec)) {
        throw errors::ResourceNotFoundError(params.uri);
    }
    const auto fileSize = fs::file_size(resolved, ec);
    if (ec) {
        throw errors::ResourceNotFoundError(params.uri);
    }

    ResourceReadResult out;
    out.total = static_cast<int64_t>(fileSize);
    ClampWindow(out.total, params.start, params.length, out.start, out.length);
    if (sizeValidator) {
        sizeValidator->ValidateResourceSize(out.length);
    }

    std::ifstream in(resolved, std::ios::binary);
    if (!in) {
        throw errors::ResourceNotFoundError(params.uri);
    }
    in.seekg(out.start);
    out.content.resize(static_cast<size_t>(out.length));
    in.read(out.content.data(), out.length);
    out.content.resize(static_cast<size_t>(in.gcount()));
    out.length = static_cast<int64_t>(out.content.size());
    if (const size_t bad = ReplaceInvalidUtf8(out.content); bad > 0) {
        LOG_WARN("Replaced {} invalid UTF-8 byte(s) reading {}", bad, params.uri);
    }
    return out;
}

} // namespace resources
} // namespace toolhost
