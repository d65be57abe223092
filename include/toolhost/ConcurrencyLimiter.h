//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ConcurrencyLimiter.h
// Purpose: Global and per-tool in-flight counters with scoped acquire/release
//==========================================================================================================

#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>

#include "toolhost/errors/Errors.h"

namespace toolhost {

//==========================================================================================================
// ConcurrencyLimiter
// Purpose: Tracks one global counter and one counter per tool name against configured caps.
// Invariants:
//   total <= maxConcurrency and counts[tool] <= perToolLimits[tool] whenever callers go through
//   Execute() or check CanStart() before Start(). A tool without a per-tool limit is bounded only
//   by the global cap. Counters are guarded by a mutex so check-then-start is atomic.
//==========================================================================================================
class ConcurrencyLimiter {
public:
    explicit ConcurrencyLimiter(int maxConcurrency = 10,
                                std::unordered_map<std::string, int> perToolLimits = {});

    bool CanStart(const std::string& toolName) const;

    // Unconditional increment; pair with exactly one Complete().
    void Start(const std::string& toolName);
    void Complete(const std::string& toolName);

    //======================================================================================================
    // Execute
    // Purpose: Atomically checks and starts, runs op, and releases the slot on every exit path.
    // Throws:
    //   errors::ConcurrencyLimitExceededError without running op when no slot is free.
    //======================================================================================================
    template <typename Fn>
    auto Execute(const std::string& toolName, Fn&& op) -> std::invoke_result_t<Fn> {
        acquireOrThrow(toolName);
        Slot slot(*this, toolName);
        return std::forward<Fn>(op)();
    }

    int GetCurrentCount(const std::string& toolName) const;
    int GetTotalCount() const;
    std::optional<int> GetToolLimit(const std::string& toolName) const;
    int GetMaxConcurrency() const { return maxConcurrency; }

private:
    // Releases an already-acquired slot on destruction.
    class Slot {
    public:
        Slot(ConcurrencyLimiter& l, std::string t) : limiter(l), tool(std::move(t)) {}
        ~Slot() { limiter.Complete(tool); }
        Slot(const Slot&) = delete;
        Slot& operator=(const Slot&) = delete;
    private:
        ConcurrencyLimiter& limiter;
        std::string tool;
    };

    void acquireOrThrow(const std::string& toolName);
    bool canStartLocked(const std::string& toolName) const;

    const int maxConcurrency;
    const std::unordered_map<std::string, int> perToolLimits;

    mutable std::mutex mutex;
    int total{0};
    std::unordered_map<std::string, int> counts;
};

} // namespace toolhost
