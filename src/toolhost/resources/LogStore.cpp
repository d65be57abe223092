//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: LogStore.cpp
// Purpose: LogStore implementation
//==========================================================================================================

#include "toolhost/resources/LogStore.h"
#include "toolhost/errors/Errors.h"
#include "logging/Logger.h"

namespace toolhost {
namespace resources {

void LogStore::StoreRunLog(const std::string& processId, const std::string& entry) {
    Store(LogKind::Run, processId, entry);
}

void LogStore::StoreBuildLog(const std::string& buildId, const std::string& entry) {
    Store(LogKind::Build, buildId, entry);
}

void LogStore::Store(LogKind kind, const std::string& id, const std::string& entry) {
    std::lock_guard<std::mutex> lk(mutex);
    Buffer& buf = mapFor(kind)[id];
    buf.lines.push_back(entry);
    buf.bytes += static_cast<int64_t>(entry.size());
    while (buf.lines.size() > kMaxEntries) {
        buf.bytes -= static_cast<int64_t>(buf.lines.front().size());
        buf.lines.pop_front();
    }
    while (buf.bytes > kMaxBytes && !buf.lines.empty()) {
        buf.bytes -= static_cast<int64_t>(buf.lines.front().size());
        buf.lines.pop_front();
    }
}

ResourceListResult LogStore::List(LogKind kind, const std::optional<std::string>& prefix,
                                  size_t page, size_t pageSize) const {
    std::vector<ResourceItem> items;
    {
        std::lock_guard<std::mutex> lk(mutex);
        const BufferMap& logs = mapFor(kind);
        for (const auto& [id, buf] : logs) {
            if (prefix.has_value() && id.compare(0, prefix->size(), *prefix) != 0) {
                continue;
            }
            items.push_back(ResourceItem{std::string(uriPrefixFor(kind)) + id, buf.bytes,
                                         static_cast<int64_t>(buf.lines.size())});
        }
    }
    // std::map iteration is already ordered by id, hence by uri
    return Paginate(std::move(items), page, pageSize);
}

ResourceReadResult LogStore::Read(LogKind kind, const std::string& id,
                                  const std::optional<int64_t>& start, const std::optional<int64_t>& length) const {
    std::string text;
    {
        std::lock_guard<std::mutex> lk(mutex);
        const BufferMap& logs = mapFor(kind);
        auto it = logs.find(id);
        if (it == logs.end()) {
            throw errors::ResourceNotFoundError(std::string(uriPrefixFor(kind)) + id);
        }
        bool first = true;
        for (const auto& line : it->second.lines) {
            if (!first) text.push_back('\n');
            first = false;
            text += line;
        }
    }
    ResourceReadResult out;
    out.total = static_cast<int64_t>(text.size());
    ClampWindow(out.total, start, length, out.start, out.length);
    out.content = text.substr(static_cast<size_t>(out.start), static_cast<size_t>(out.length));
    out.mimeType = "text/plain";
    return out;
}

bool LogStore::Contains(LogKind kind, const std::string& id) const {
    std::lock_guard<std::mutex> lk(mutex);
    const BufferMap& logs = mapFor(kind);
    return logs.find(id) != logs.end();
}

void LogStore::Clear() {
    std::lock_guard<std::mutex> lk(mutex);
    runLogs.clear();
    buildLogs.clear();
    LOG_DEBUG("LogStore cleared");
}

} // namespace resources
} // namespace toolhost
