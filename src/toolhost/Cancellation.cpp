//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Cancellation.cpp
// Purpose: CancellationToken and CancellationRegistry implementation
//==========================================================================================================

#include "toolhost/Cancellation.h"
#include "toolhost/errors/Errors.h"
#include "logging/Logger.h"

namespace toolhost {

void CancellationToken::ThrowIfCancelled() const {
    if (IsCancelled()) {
        throw errors::CancellationRequestedError();
    }
}

std::shared_ptr<CancellationToken> CancellationRegistry::Register(const std::string& requestId) {
    if (requestId.empty()) {
        return std::make_shared<CancellationToken>();
    }
    std::lock_guard<std::mutex> lk(mutex);
    auto it = tokens.find(requestId);
    if (it != tokens.end() && it->second) {
        return it->second;
    }
    auto tok = std::make_shared<CancellationToken>();
    pruneEarlyLocked(Clock::now());
    if (earlyCancels.erase(requestId) > 0) {
        tok->Cancel();
        LOG_INFO("Request id={} registered after its cancellation; starting cancelled", requestId);
    }
    tokens[requestId] = tok;
    return tok;
}

void CancellationRegistry::Cancel(const std::string& requestId) {
    std::lock_guard<std::mutex> lk(mutex);
    auto it = tokens.find(requestId);
    if (it == tokens.end() || !it->second) {
        if (requestId.empty() || maxEarlyCancels == 0) {
            return;
        }
        const auto now = Clock::now();
        pruneEarlyLocked(now);
        if (earlyCancels.count(requestId) > 0) {
            return;
        }
        const uint64_t seq = nextSeq++;
        earlyCancels[requestId] = EarlyCancel{now, seq};
        earlyOrder.push_back(EarlyOrderEntry{requestId, seq});
        while (earlyCancels.size() > maxEarlyCancels && !earlyOrder.empty()) {
            EarlyOrderEntry oldest = std::move(earlyOrder.front());
            earlyOrder.pop_front();
            auto e = earlyCancels.find(oldest.requestId);
            if (e != earlyCancels.end() && e->second.seq == oldest.seq) {
                LOG_DEBUG("Dropping oldest early cancellation id={}", oldest.requestId);
                earlyCancels.erase(e);
            }
        }
        // Entries consumed by Register() stay queued until reached; compact once they dominate.
        if (earlyOrder.size() > 2 * maxEarlyCancels) {
            std::deque<EarlyOrderEntry> live;
            for (auto& entry : earlyOrder) {
                auto e = earlyCancels.find(entry.requestId);
                if (e != earlyCancels.end() && e->second.seq == entry.seq) {
                    live.push_back(std::move(entry));
                }
            }
            earlyOrder.swap(live);
        }
        LOG_DEBUG("Cancellation recorded ahead of request id={}", requestId);
        return;
    }
    if (it->second->Cancel()) {
        LOG_INFO("Cancellation requested for request id={}", requestId);
    }
}

std::shared_ptr<CancellationToken> CancellationRegistry::GetToken(const std::string& requestId) const {
    std::lock_guard<std::mutex> lk(mutex);
    auto it = tokens.find(requestId);
    return it == tokens.end() ? nullptr : it->second;
}

void CancellationRegistry::Remove(const std::string& requestId) {
    std::lock_guard<std::mutex> lk(mutex);
    tokens.erase(requestId);
    earlyCancels.erase(requestId);
}

size_t CancellationRegistry::Size() const {
    std::lock_guard<std::mutex> lk(mutex);
    return tokens.size();
}

size_t CancellationRegistry::EarlyCancelCount() const {
    std::lock_guard<std::mutex> lk(mutex);
    return earlyCancels.size();
}

// earlyOrder may hold entries for ids already consumed or evicted; they are matched by sequence.
void CancellationRegistry::pruneEarlyLocked(Clock::time_point now) {
    while (!earlyOrder.empty()) {
        const auto& front = earlyOrder.front();
        auto e = earlyCancels.find(front.requestId);
        const bool stale = (e == earlyCancels.end() || e->second.seq != front.seq);
        if (!stale && now - e->second.at < earlyCancelTtl) {
            break;
        }
        if (!stale) {
            LOG_DEBUG("Early cancellation expired for request id={}", front.requestId);
            earlyCancels.erase(e);
        }
        earlyOrder.pop_front();
    }
}

} // namespace toolhost
