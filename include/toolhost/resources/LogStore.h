//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: LogStore.h
// Purpose: Bounded in-memory capture of process run and build output keyed by identifier
//==========================================================================================================

#pragma once

#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>

#include "toolhost/resources/ResourceStrategy.h"

namespace toolhost {
namespace resources {

enum class LogKind {
    Run,
    Build
};

inline const char* uriPrefixFor(LogKind kind) {
    switch (kind) {
        case LogKind::Run: return "logs://run/";
        case LogKind::Build: return "logs://build/";
    }
    return "logs://run/";
}

//==========================================================================================================
// LogStore
// Purpose: Per-id FIFO of log lines. Each id keeps at most kMaxEntries lines and kMaxBytes bytes;
//          the oldest lines are dropped first. Thread-safe.
//==========================================================================================================
class LogStore {
public:
    static constexpr size_t kMaxEntries = 1000;
    static constexpr int64_t kMaxBytes = 100 * 1024;

    void StoreRunLog(const std::string& processId, const std::string& entry);
    void StoreBuildLog(const std::string& buildId, const std::string& entry);
    void Store(LogKind kind, const std::string& id, const std::string& entry);

    // Items are sorted by uri; prefix filters on the identifier.
    ResourceListResult List(LogKind kind, const std::optional<std::string>& prefix, size_t page, size_t pageSize) const;

    // Entries joined by '\n', then windowed by bytes.
    // Throws errors::ResourceNotFoundError for unknown ids.
    ResourceReadResult Read(LogKind kind, const std::string& id,
                            const std::optional<int64_t>& start, const std::optional<int64_t>& length) const;

    bool Contains(LogKind kind, const std::string& id) const;
    void Clear();

private:
    struct Buffer {
        std::deque<std::string> lines;
        int64_t bytes{0};
    };
    using BufferMap = std::map<std::string, Buffer>;

    BufferMap& mapFor(LogKind kind) { return kind == LogKind::Run ? runLogs : buildLogs; }
    const BufferMap& mapFor(LogKind kind) const { return kind == LogKind::Run ? runLogs : buildLogs; }

    mutable std::mutex mutex;
    BufferMap runLogs;
    BufferMap buildLogs;
};

} // namespace resources
} // namespace toolhost
