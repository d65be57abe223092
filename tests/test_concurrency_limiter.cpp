//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_concurrency_limiter.cpp
// Purpose: Global and per-tool in-flight accounting
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>
#include <vector>

#include "toolhost/ConcurrencyLimiter.h"

using namespace toolhost;

TEST(ConcurrencyLimiter, CanStartRespectsBothAxes) {
    ConcurrencyLimiter limiter(2, {{"build", 1}});
    EXPECT_TRUE(limiter.CanStart("build"));
    limiter.Start("build");
    EXPECT_FALSE(limiter.CanStart("build"));
    EXPECT_TRUE(limiter.CanStart("lint"));
    limiter.Start("lint");
    EXPECT_FALSE(limiter.CanStart("lint"));
    EXPECT_EQ(limiter.GetTotalCount(), 2);
    limiter.Complete("build");
    limiter.Complete("lint");
    EXPECT_EQ(limiter.GetTotalCount(), 0);
    EXPECT_EQ(limiter.GetCurrentCount("build"), 0);
}

TEST(ConcurrencyLimiter, ExecuteReleasesOnSuccessAndFailure) {
    ConcurrencyLimiter limiter(1);
    EXPECT_EQ(limiter.Execute("t", [&]() { return limiter.GetCurrentCount("t"); }), 1);
    EXPECT_EQ(limiter.GetTotalCount(), 0);
    EXPECT_THROW(limiter.Execute("t", []() -> int { throw std::runtime_error("boom"); }), std::runtime_error);
    EXPECT_EQ(limiter.GetTotalCount(), 0);
    EXPECT_TRUE(limiter.CanStart("t"));
}

TEST(ConcurrencyLimiter, ExecuteRefusesWithoutRunningOp) {
    ConcurrencyLimiter limiter(10, {{"deploy", 1}});
    limiter.Start("deploy");
    bool ran = false;
    try {
        limiter.Execute("deploy", [&]() { ran = true; });
        FAIL() << "expected ConcurrencyLimitExceededError";
    } catch (const errors::ConcurrencyLimitExceededError& e) {
        EXPECT_EQ(e.ToolName(), "deploy");
        EXPECT_EQ(e.Current(), 1);
        EXPECT_EQ(e.Limit(), 1);
    }
    EXPECT_FALSE(ran);
    EXPECT_EQ(limiter.GetCurrentCount("deploy"), 1);
    limiter.Complete("deploy");
}

TEST(ConcurrencyLimiter, GlobalCapReportedWhenToolIsUnbounded) {
    ConcurrencyLimiter limiter(1);
    limiter.Start("a");
    try {
        limiter.Execute("b", []() {});
        FAIL() << "expected ConcurrencyLimitExceededError";
    } catch (const errors::ConcurrencyLimitExceededError& e) {
        EXPECT_EQ(e.Current(), 1);
        EXPECT_EQ(e.Limit(), 1);
    }
    limiter.Complete("a");
}

TEST(ConcurrencyLimiter, UnbalancedCompleteIsIgnored) {
    ConcurrencyLimiter limiter(1);
    limiter.Complete("never-started");
    EXPECT_EQ(limiter.GetTotalCount(), 0);
    EXPECT_TRUE(limiter.CanStart("never-started"));
}

TEST(ConcurrencyLimiter, CountersStayWithinCapsUnderContention) {
    ConcurrencyLimiter limiter(4, {{"hot", 2}});
    std::atomic<int> peakTotal{0};
    std::atomic<int> peakHot{0};
    std::atomic<int> rejected{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 16; ++i) {
        threads.emplace_back([&, i]() {
            const std::string tool = (i % 2 == 0) ? "hot" : "cold";
            try {
                limiter.Execute(tool, [&]() {
                    int total = limiter.GetTotalCount();
                    int hot = limiter.GetCurrentCount("hot");
                    int prev = peakTotal.load();
                    while (total > prev && !peakTotal.compare_exchange_weak(prev, total)) {}
                    prev = peakHot.load();
                    while (hot > prev && !peakHot.compare_exchange_weak(prev, hot)) {}
                    std::this_thread::sleep_for(std::chrono::milliseconds(5));
                });
            } catch (const errors::ConcurrencyLimitExceededError&) {
                ++rejected;
            }
        });
    }
    for (auto& t : threads) t.join();
    EXPECT_LE(peakTotal.load(), 4);
    EXPECT_LE(peakHot.load(), 2);
    EXPECT_EQ(limiter.GetTotalCount(), 0);
    EXPECT_EQ(limiter.GetCurrentCount("hot"), 0);
    EXPECT_EQ(limiter.GetToolLimit("hot").value_or(0), 2);
    EXPECT_FALSE(limiter.GetToolLimit("cold").has_value());
}
