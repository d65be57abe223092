//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ResourceRegistry.h
// Purpose: Ordered URI-prefix dispatch over resource strategies
//==========================================================================================================

#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "toolhost/resources/ResourceStrategy.h"
#include "toolhost/validation/SizeValidator.h"

namespace toolhost {
namespace resources {

// Advertised resource entry for resources/list.
struct ResourceDescriptor {
    std::string uri;
    std::string name;
    std::string mimeType;
    int64_t size{0};
};

//==========================================================================================================
// ResourceRegistry
// Purpose: Holds (prefix, strategy) pairs checked in registration order.
// Notes:
//   A uri/directory that matches no prefix is handed to the workspace:// strategy. A List without
//   uri or directory aggregates every strategy, sorted by uri, then paginates.
//   Read results are size-checked when a SizeValidator is attached.
//==========================================================================================================
class ResourceRegistry {
public:
    explicit ResourceRegistry(std::shared_ptr<validation::SizeValidator> sizeValidator = nullptr);

    // Registering a prefix twice replaces the earlier strategy in place.
    void Register(std::shared_ptr<ResourceStrategy> strategy);

    // First strategy whose prefix matches uri, else the workspace strategy, else nullptr.
    std::shared_ptr<ResourceStrategy> FindStrategy(const std::string& uri) const;

    ResourceListResult List(const ResourceListParams& params) const;
    ResourceReadResult Read(const ResourceReadParams& params) const;

    // Page of descriptors (name and MIME type filled in) for the protocol listing.
    std::vector<ResourceDescriptor> Describe(const ResourceListResult& listed) const;

    std::vector<std::shared_ptr<ResourceStrategy>> Strategies() const;

    static std::string GuessMimeType(const std::string& uri);

private:
    std::shared_ptr<ResourceStrategy> findLocked(const std::string& uri) const;

    std::shared_ptr<validation::SizeValidator> sizeValidator;
    mutable std::mutex mutex;
    std::vector<std::shared_ptr<ResourceStrategy>> strategies;
};

} // namespace resources
} // namespace toolhost
