//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: LogResourceStrategy.h
// Purpose: logs://run/ and logs://build/ strategies backed by a LogStore
//==========================================================================================================

#pragma once

#include <memory>
#include "toolhost/resources/LogStore.h"
#include "toolhost/resources/ResourceStrategy.h"

namespace toolhost {
namespace resources {

//==========================================================================================================
// LogResourceStrategy
// Purpose: Exposes one LogKind of a LogStore. List honors params.prefix (or the id part of
//          params.uri); Read takes "logs://<kind>/<id>".
// Throws:
//   errors::ResourceNotFoundError for unknown ids; std::logic_error when no store is attached.
//==========================================================================================================
class LogResourceStrategy : public ResourceStrategy {
public:
    LogResourceStrategy(LogKind kind, std::shared_ptr<LogStore> store = nullptr);

    void SetLogStore(std::shared_ptr<LogStore> store);

    std::string UriPrefix() const override { return uriPrefixFor(kind); }
    std::string Description() const override;

    ResourceListResult List(const ResourceListParams& params) const override;
    ResourceReadResult Read(const ResourceReadParams& params) const override;

private:
    const LogStore& storeOrThrow() const;

    LogKind kind;
    std::shared_ptr<LogStore> store;
};

} // namespace resources
} // namespace toolhost
