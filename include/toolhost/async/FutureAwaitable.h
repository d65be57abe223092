//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: FutureAwaitable.h
// Purpose: co_await support for std::future
//==========================================================================================================

#pragma once

#include <chrono>
#include <coroutine>
#include <future>
#include <thread>
#include <utility>

namespace toolhost {
namespace async {

//==========================================================================================================
// FutureAwaitable<T>
// Purpose: Suspends a coroutine until a future is ready. A ready future resumes inline; otherwise a
//          detached waiter thread resumes the coroutine, so code after co_await may run on that thread.
//          Failures surface from await_resume through future::get().
//==========================================================================================================
template <typename T>
class FutureAwaitable {
public:
    explicit FutureAwaitable(std::future<T>&& f) : fut(std::move(f)) {}

    bool await_ready() const {
        return fut.wait_for(std::chrono::seconds(0)) != std::future_status::timeout;
    }

    void await_suspend(std::coroutine_handle<> h) {
        // wait() does not throw for a valid future; the stored exception is rethrown by get()
        std::thread([this, h]() {
            fut.wait();
            h.resume();
        }).detach();
    }

    T await_resume() {
        if constexpr (std::is_void_v<T>) {
            fut.get();
        } else {
            return fut.get();
        }
    }

private:
    std::future<T> fut;
};

template <typename T>
inline FutureAwaitable<T> makeFutureAwaitable(std::future<T>&& fut) {
    return FutureAwaitable<T>(std::move(fut));
}

} // namespace async
} // namespace toolhost
