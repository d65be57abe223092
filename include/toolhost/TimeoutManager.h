//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: TimeoutManager.h
// Purpose: Races an operation against a deadline
//==========================================================================================================

#pragma once

#include <chrono>
#include <exception>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>

#include "toolhost/errors/Errors.h"
#include "logging/Logger.h"

namespace toolhost {

//==========================================================================================================
// TimeoutManager
// Purpose: Runs op on a detached worker and waits up to timeout for its outcome.
// Notes:
//   Advisory, not preemptive. On expiry the caller gets TimeoutExceededError while op keeps running
//   until it returns on its own; pair with a CancellationToken to actually stop work. The worker owns
//   op and the promise, so nothing on the caller's stack is touched after the wait ends.
//==========================================================================================================
class TimeoutManager {
public:
    template <typename Fn>
    static auto WithTimeout(Fn&& op, std::chrono::milliseconds timeout, const std::string& operationName)
        -> std::invoke_result_t<std::decay_t<Fn>&> {
        using R = std::invoke_result_t<std::decay_t<Fn>&>;
        auto promise = std::make_shared<std::promise<R>>();
        std::future<R> fut = promise->get_future();
        std::thread([promise, fn = std::decay_t<Fn>(std::forward<Fn>(op))]() mutable {
            try {
                if constexpr (std::is_void_v<R>) {
                    fn();
                    promise->set_value();
                } else {
                    promise->set_value(fn());
                }
            } catch (...) {
                promise->set_exception(std::current_exception());
            }
        }).detach();

        if (fut.wait_for(timeout) != std::future_status::ready) {
            LOG_WARN("Operation ({}) timed out after {}ms", operationName, timeout.count());
            throw errors::TimeoutExceededError(operationName, timeout);
        }
        return fut.get();
    }
};

} // namespace toolhost
