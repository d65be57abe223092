//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ResourceRegistry.cpp
// Purpose: ResourceRegistry implementation
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <limits>
#include "toolhost/resources/ResourceRegistry.h"
#include "toolhost/resources/WorkspaceResourceStrategy.h"
#include "toolhost/errors/Errors.h"
#include "logging/Logger.h"

namespace toolhost {
namespace resources {

ResourceRegistry::ResourceRegistry(std::shared_ptr<validation::SizeValidator> sv)
    : sizeValidator(std::move(sv)) {}

void ResourceRegistry::Register(std::shared_ptr<ResourceStrategy> strategy) {
    if (!strategy) {
        throw std::invalid_argument("ResourceRegistry::Register: null strategy");
    }
    std::lock_guard<std::mutex> lk(mutex);
    const std::string prefix = strategy->UriPrefix();
    for (auto& existing : strategies) {
        if (existing->UriPrefix() == prefix) {
            existing = std::move(strategy);
            LOG_DEBUG("Resource strategy replaced: {}", prefix);
            return;
        }
    }
    strategies.push_back(std::move(strategy));
    LOG_DEBUG("Resource strategy registered: {}", prefix);
}

std::shared_ptr<ResourceStrategy> ResourceRegistry::findLocked(const std::string& uri) const {
    std::shared_ptr<ResourceStrategy> workspace;
    for (const auto& s : strategies) {
        const std::string prefix = s->UriPrefix();
        if (uri.compare(0, prefix.size(), prefix) == 0) {
            return s;
        }
        if (prefix == WorkspaceResourceStrategy::kPrefix) {
            workspace = s;
        }
    }
    return workspace;
}

std::shared_ptr<ResourceStrategy> ResourceRegistry::FindStrategy(const std::string& uri) const {
    std::lock_guard<std::mutex> lk(mutex);
    return findLocked(uri);
}

std::vector<std::shared_ptr<ResourceStrategy>> ResourceRegistry::Strategies() const {
    std::lock_guard<std::mutex> lk(mutex);
    return strategies;
}

ResourceListResult ResourceRegistry::List(const ResourceListParams& params) const {
    FUNC_SCOPE();
    const std::optional<std::string> key = params.uri.has_value() ? params.uri : params.directory;
    if (key.has_value()) {
        auto strategy = FindStrategy(key.value());
        if (!strategy) {
            throw errors::ResourceNotFoundError(key.value());
        }
        return strategy->List(params);
    }

    std::vector<ResourceItem> all;
    for (const auto& s : Strategies()) {
        ResourceListParams everything;
        everything.prefix = params.prefix;
        everything.page = 0;
        everything.pageSize = std::numeric_limits<size_t>::max();
        auto part = s->List(everything);
        std::move(part.items.begin(), part.items.end(), std::back_inserter(all));
    }
    std::sort(all.begin(), all.end(), [](const ResourceItem& a, const ResourceItem& b) { return a.uri < b.uri; });
    return Paginate(std::move(all), params.page, params.pageSize);
}

ResourceReadResult ResourceRegistry::Read(const ResourceReadParams& params) const {
    FUNC_SCOPE();
    auto strategy = FindStrategy(params.uri);
    if (!strategy) {
        throw errors::ResourceNotFoundError(params.uri);
    }
    ResourceReadResult result = strategy->Read(params);
    if (sizeValidator) {
        sizeValidator->ValidateResourceContent(result.content);
    }
    if (!result.mimeType.has_value()) {
        result.mimeType = GuessMimeType(params.uri);
    }
    return result;
}

std::vector<ResourceDescriptor> ResourceRegistry::Describe(const ResourceListResult& listed) const {
    std::vector<ResourceDescriptor> out;
    out.reserve(listed.items.size());
    for (const auto& item : listed.items) {
        ResourceDescriptor d;
        d.uri = item.uri;
        d.size = item.size;
        d.mimeType = GuessMimeType(item.uri);
        const auto slash = item.uri.find_last_of('/');
        d.name = (slash == std::string::npos) ? item.uri : item.uri.substr(slash + 1);
        if (d.name.empty()) {
            auto s = FindStrategy(item.uri);
            d.name = s ? s->Description() : item.uri;
        }
        out.push_back(std::move(d));
    }
    return out;
}

std::string ResourceRegistry::GuessMimeType(const std::string& uri) {
    const auto slash = uri.find_last_of('/');
    const auto dot = uri.find_last_of('.');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
        return "text/plain";
    }
    std::string ext = uri.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (ext == "md") return "text/markdown";
    if (ext == "json") return "application/json";
    if (ext == "yaml" || ext == "yml") return "text/yaml";
    if (ext == "cpp" || ext == "cc" || ext == "cxx" || ext == "hpp" || ext == "h") return "text/x-c++";
    if (ext == "c") return "text/x-c";
    if (ext == "cmake") return "text/x-cmake";
    return "text/plain";
}

} // namespace resources
} // namespace toolhost
