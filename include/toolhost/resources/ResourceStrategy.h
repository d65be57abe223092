//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ResourceStrategy.h
// Purpose: Resource list/read contract shared by every URI scheme strategy
//==========================================================================================================

#pragma once

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "toolhost/JSONRPCTypes.h"

namespace toolhost {
namespace resources {

constexpr size_t kDefaultPageSize = 100;

//==========================================================================================================
// ResourceListParams
// Fields:
//   uri: Scheme URI used for dispatch and, for the workspace, the directory to list.
//   directory: Alternative to uri; a plain directory path or a prefixed URI.
//   prefix: Identifier filter for log strategies.
//   page/pageSize: Zero-based page index; pageSize 0 means kDefaultPageSize.
//==========================================================================================================
struct ResourceListParams {
    std::optional<std::string> uri;
    std::optional<std::string> directory;
    std::optional<std::string> prefix;
    size_t page{0};
    size_t pageSize{kDefaultPageSize};
};

struct ResourceItem {
    std::string uri;
    int64_t size{0};
    std::optional<int64_t> entries; // log strategies only
};

struct ResourceListResult {
    std::vector<ResourceItem> items;
    size_t total{0};
    size_t page{0};
    size_t pageSize{kDefaultPageSize};

    JSONValue ToJSON() const;
};

struct ResourceReadParams {
    std::string uri;
    std::optional<int64_t> start;
    std::optional<int64_t> length;
};

//==========================================================================================================
// ResourceReadResult
// Purpose: A byte window [start, start+length) over a resource of total bytes, as UTF-8 text.
//==========================================================================================================
struct ResourceReadResult {
    std::string content;
    std::string encoding{"utf-8"};
    int64_t start{0};
    int64_t length{0};
    int64_t total{0};
    std::optional<std::string> mimeType;

    JSONValue ToJSON() const;
};

//==========================================================================================================
// ResourceStrategy
// Purpose: One URI scheme. Strategies hold only injected collaborators and must throw
//          std::logic_error when a required collaborator was never attached.
//==========================================================================================================
class ResourceStrategy {
public:
    virtual ~ResourceStrategy() = default;

    virtual std::string UriPrefix() const = 0;
    virtual std::string Description() const = 0;
    virtual bool ReadOnly() const { return true; }

    virtual ResourceListResult List(const ResourceListParams& params) const = 0;
    virtual ResourceReadResult Read(const ResourceReadParams& params) const = 0;
};

////////////////////////////////////////// Shared helpers //////////////////////////////////////////

// Stable page slice; items must already be sorted.
ResourceListResult Paginate(std::vector<ResourceItem> sorted, size_t page, size_t pageSize);

// Clamp a requested byte window to [0, total].
void ClampWindow(int64_t total, const std::optional<int64_t>& start, const std::optional<int64_t>& length,
                 int64_t& outStart, int64_t& outLength);

// Replaces every byte that is not part of a well-formed UTF-8 sequence with U+FFFD.
// Returns the number of bytes replaced.
size_t ReplaceInvalidUtf8(std::string& text);

// Strip prefix from uri when present; otherwise return uri unchanged.
std::string StripPrefix(const std::string& uri, const std::string& prefix);

} // namespace resources
} // namespace toolhost
