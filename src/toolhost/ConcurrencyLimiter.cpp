//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ConcurrencyLimiter.cpp
// Purpose: ConcurrencyLimiter implementation
//==========================================================================================================

#include "toolhost/ConcurrencyLimiter.h"
#include "logging/Logger.h"

namespace toolhost {

ConcurrencyLimiter::ConcurrencyLimiter(int maxConc, std::unordered_map<std::string, int> limits)
    : maxConcurrency(maxConc), perToolLimits(std::move(limits)) {}

bool ConcurrencyLimiter::canStartLocked(const std::string& toolName) const {
    if (total >= maxConcurrency) {
        return false;
    }
    auto lim = perToolLimits.find(toolName);
    if (lim == perToolLimits.end()) {
        return true;
    }
    auto it = counts.find(toolName);
    const int current = (it == counts.end()) ? 0 : it->second;
    return current < lim->second;
}

bool ConcurrencyLimiter::CanStart(const std::string& toolName) const {
    std::lock_guard<std::mutex> lk(mutex);
    return canStartLocked(toolName);
}

void ConcurrencyLimiter::Start(const std::string& toolName) {
    std::lock_guard<std::mutex> lk(mutex);
    ++total;
    ++counts[toolName];
}

void ConcurrencyLimiter::Complete(const std::string& toolName) {
    std::lock_guard<std::mutex> lk(mutex);
    auto it = counts.find(toolName);
    if (it == counts.end() || it->second <= 0 || total <= 0) {
        LOG_WARN("Unbalanced concurrency release for tool={}", toolName);
        return;
    }
    --total;
    if (--it->second == 0) {
        counts.erase(it);
    }
}

void ConcurrencyLimiter::acquireOrThrow(const std::string& toolName) {
    std::lock_guard<std::mutex> lk(mutex);
    if (!canStartLocked(toolName)) {
        auto it = counts.find(toolName);
        const int toolCount = (it == counts.end()) ? 0 : it->second;
        auto lim = perToolLimits.find(toolName);
        // Report whichever cap actually blocked the call
        if (lim != perToolLimits.end() && toolCount >= lim->second) {
            LOG_WARN("Concurrency limit hit for tool={} current={} limit={}", toolName, toolCount, lim->second);
            throw errors::ConcurrencyLimitExceededError(toolName, toolCount, lim->second);
        }
        LOG_WARN("Global concurrency limit hit for tool={} current={} limit={}", toolName, total, maxConcurrency);
        throw errors::ConcurrencyLimitExceededError(toolName, total, maxConcurrency);
    }
    ++total;
    ++counts[toolName];
}

int ConcurrencyLimiter::GetCurrentCount(const std::string& toolName) const {
    std::lock_guard<std::mutex> lk(mutex);
    auto it = counts.find(toolName);
    return (it == counts.end()) ? 0 : it->second;
}

int ConcurrencyLimiter::GetTotalCount() const {
    std::lock_guard<std::mutex> lk(mutex);
    return total;
}

std::optional<int> ConcurrencyLimiter::GetToolLimit(const std::string& toolName) const {
    auto it = perToolLimits.find(toolName);
    if (it == perToolLimits.end()) return std::nullopt;
    return it->second;
}

} // namespace toolhost
