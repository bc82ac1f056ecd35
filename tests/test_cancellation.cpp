//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_cancellation.cpp
// Purpose: Tests for cancellation tokens, registrations and request deadlines
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#include "authgate/Cancellation.hpp"

using namespace authgate;

TEST(Cancellation, DefaultTokenNeverCanceled) {
    CancellationToken t;
    EXPECT_FALSE(t.IsCanceled());
    int calls = 0;
    auto reg = t.Subscribe([&]() { ++calls; });
    EXPECT_EQ(calls, 0);
}

TEST(Cancellation, CallbacksRunOnceOnCancel) {
    CancellationSource src;
    int calls = 0;
    auto reg = src.Token().Subscribe([&]() { ++calls; });
    EXPECT_FALSE(src.IsCanceled());
    src.Cancel();
    src.Cancel();
    EXPECT_TRUE(src.IsCanceled());
    EXPECT_TRUE(src.Token().IsCanceled());
    EXPECT_EQ(calls, 1);
}

TEST(Cancellation, SubscribeAfterCancelRunsImmediately) {
    CancellationSource src;
    src.Cancel();
    bool ran = false;
    auto reg = src.Token().Subscribe([&]() { ran = true; });
    EXPECT_TRUE(ran);
}

TEST(Cancellation, ResetRegistrationUnsubscribes) {
    CancellationSource src;
    int calls = 0;
    {
        auto reg = src.Token().Subscribe([&]() { ++calls; });
    }
    auto reg2 = src.Token().Subscribe([&]() { ++calls; });
    reg2.Reset();
    src.Cancel();
    EXPECT_EQ(calls, 0);
}

TEST(Cancellation, MovedRegistrationStaysActive) {
    CancellationSource src;
    int calls = 0;
    CancellationRegistration outer;
    {
        auto reg = src.Token().Subscribe([&]() { ++calls; });
        outer = std::move(reg);
    }
    src.Cancel();
    EXPECT_EQ(calls, 1);
}

TEST(Cancellation, ConcurrentSubscribeAndCancel) {
    CancellationSource src;
    std::atomic<int> calls{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&]() {
            for (int k = 0; k < 200; ++k) {
                auto reg = src.Token().Subscribe([&]() { calls.fetch_add(1); });
            }
        });
    }
    std::thread canceller([&]() { src.Cancel(); });
    for (auto& t : threads) {
        t.join();
    }
    canceller.join();
    EXPECT_TRUE(src.IsCanceled());
    EXPECT_LE(calls.load(), 8 * 200);
}

TEST(RequestContext, DeadlineClampsExpiry) {
    using namespace std::chrono;
    RequestContext ctx;
    const auto before = steady_clock::now();
    EXPECT_GE(ctx.ClampedExpiry(milliseconds(500)), before + milliseconds(500));
    EXPECT_FALSE(ctx.Expired());

    ctx.deadline = steady_clock::now() + milliseconds(50);
    EXPECT_EQ(ctx.ClampedExpiry(seconds(10)), *ctx.deadline);
    EXPECT_FALSE(ctx.Expired());

    ctx.deadline = steady_clock::now() - milliseconds(1);
    EXPECT_TRUE(ctx.Expired());
}
