//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: LogResourceStrategy.cpp
// Purpose: LogResourceStrategy implementation
//==========================================================================================================

#include <stdexcept>
#include "toolhost/resources/LogResourceStrategy.h"
#include "toolhost/errors/Errors.h"

namespace toolhost {
namespace resources {

LogResourceStrategy::LogResourceStrategy(LogKind k, std::shared_ptr<LogStore> s)
    : kind(k), store(std::move(s)) {}

void LogResourceStrategy::SetLogStore(std::shared_ptr<LogStore> s) {
    store = std::move(s);
}

std::string LogResourceStrategy::Description() const {
    switch (kind) {
        case LogKind::Run: return "Process run logs";
        case LogKind::Build: return "Build logs";
    }
    return "Logs";
}

const LogStore& LogResourceStrategy::storeOrThrow() const {
    if (!store) {
        throw std::logic_error(std::string("LogStore must be configured for ") + uriPrefixFor(kind));
    }
    return *store;
}

ResourceListResult LogResourceStrategy::List(const ResourceListParams& params) const {
    const LogStore& s = storeOrThrow();
    std::optional<std::string> prefix = params.prefix;
    if (!prefix.has_value() && params.uri.has_value()) {
        const std::string idPart = StripPrefix(params.uri.value(), UriPrefix());
        if (!idPart.empty() && idPart != params.uri.value()) {
            prefix = idPart;
        }
    }
    return s.List(kind, prefix, params.page, params.pageSize);
}

ResourceReadResult LogResourceStrategy::Read(const ResourceReadParams& params) const {
    const LogStore& s = storeOrThrow();
    const std::string prefix = UriPrefix();
    if (params.uri.compare(0, prefix.size(), prefix) != 0) {
        throw errors::ResourceNotFoundError(params.uri);
    }
    const std::string id = params.uri.substr(prefix.size());
    if (id.empty()) {
        throw errors::ResourceNotFoundError(params.uri);
    }
    ResourceReadResult out = s.Read(kind, id, params.start, params.length);
    // Process output may hold arbitrary bytes, and a window can split a multi-byte sequence
    ReplaceInvalidUtf8(out.content);
    return out;
}

} // namespace resources
} // namespace toolhost
