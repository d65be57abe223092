//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Cancellation.h
// Purpose: Cooperative cancellation token and a per-request registry keyed by JSON-RPC id
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <unordered_map>

namespace toolhost {

//==========================================================================================================
// CancellationToken
// Purpose: One-shot cancel flag backed by std::stop_source. Handlers poll IsCancelled() or hand the
//          stop_token to code that already understands std::stop_token; nothing is interrupted.
//==========================================================================================================
class CancellationToken {
public:
    CancellationToken() = default;

    bool IsCancelled() const noexcept { return source.stop_requested(); }

    // Idempotent; returns true only for the call that flipped the state.
    bool Cancel() noexcept { return source.request_stop(); }

    std::stop_token GetStopToken() const noexcept { return source.get_token(); }

    // Throws errors::CancellationRequestedError when cancelled.
    void ThrowIfCancelled() const;

private:
    std::stop_source source;
};

//==========================================================================================================
// CancellationRegistry
// Purpose: Maps in-flight request ids to tokens so notifications/cancelled can reach a running call.
// Notes:
//   Cancel() on an unknown id is remembered as an early cancel, so a request whose cancellation raced
//   ahead of its registration still observes it. Early cancels are kept apart from live tokens and are
//   bounded: they expire after earlyCancelTtl and the oldest are evicted beyond maxEarlyCancels. A
//   late cancel for a request that already completed therefore never pins memory.
//==========================================================================================================
class CancellationRegistry {
public:
    static constexpr size_t kDefaultMaxEarlyCancels = 256;
    static constexpr std::chrono::milliseconds kDefaultEarlyCancelTtl{30000};

    CancellationRegistry() = default;
    CancellationRegistry(size_t maxEarlyCancels, std::chrono::milliseconds earlyCancelTtl)
        : maxEarlyCancels(maxEarlyCancels), earlyCancelTtl(earlyCancelTtl) {}

    std::shared_ptr<CancellationToken> Register(const std::string& requestId);
    void Cancel(const std::string& requestId);
    std::shared_ptr<CancellationToken> GetToken(const std::string& requestId) const;
    void Remove(const std::string& requestId);
    // Registered (live) tokens only.
    size_t Size() const;
    size_t EarlyCancelCount() const;

private:
    using Clock = std::chrono::steady_clock;

    void pruneEarlyLocked(Clock::time_point now);

    size_t maxEarlyCancels = kDefaultMaxEarlyCancels;
    std::chrono::milliseconds earlyCancelTtl = kDefaultEarlyCancelTtl;

    mutable std::mutex mutex;
    std::unordered_map<std::string, std::shared_ptr<CancellationToken>> tokens;
    struct EarlyCancel {
        Clock::time_point at;
        uint64_t seq = 0;
    };
    struct EarlyOrderEntry {
        std::string requestId;
        uint64_t seq = 0;
    };

    std::unordered_map<std::string, EarlyCancel> earlyCancels;
    std::deque<EarlyOrderEntry> earlyOrder;
    uint64_t nextSeq = 0;
};

} // namespace toolhost
