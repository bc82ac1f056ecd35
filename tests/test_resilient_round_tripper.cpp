//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_resilient_round_tripper.cpp
// Purpose: Tests for retry-with-backoff: transient-only retries, budgets, cancellation and deadlines
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include <boost/beast/http.hpp>

#include "authgate/http/ResilientRoundTripper.hpp"
#include "support/RunSync.hpp"
#include "support/ScriptedRoundTripper.hpp"

using namespace authgate;
using authgate::testing::RunSync;
using authgate::testing::ScriptedRoundTripper;
using http::TransportFailure;
using namespace std::chrono;

namespace {
http::Url testUrl() {
    http::Url u;
    std::string err;
    http::ParseAbsoluteUrl("http://127.0.0.1:9/introspect", u, err);
    return u;
}

http::Request testRequest() {
    return http::Request{boost::beast::http::verb::post, "/introspect", 11};
}

http::ResilienceProfile profile(milliseconds base, milliseconds giveUp) {
    http::ResilienceProfile p;
    p.baseDelay = base;
    p.giveUpAfter = giveUp;
    return p;
}
}

TEST(ResilientRoundTripper, RetriesTransientFailuresUntilSuccess) {
    auto inner = std::make_shared<ScriptedRoundTripper>(std::vector<ScriptedRoundTripper::Step>{
        {TransportFailure::Connection}, {TransportFailure::Timeout}, {std::nullopt, 200, "ok"}});
    http::ResilientRoundTripper rt(inner, profile(milliseconds(10), seconds(1)));
    RequestContext ctx;
    http::Response res = RunSync(rt.RoundTrip(testUrl(), testRequest(), ctx));
    EXPECT_EQ(res.result_int(), 200u);
    EXPECT_EQ(res.body(), std::string("ok"));
    EXPECT_EQ(inner->Calls(), 3u);
}

TEST(ResilientRoundTripper, NonTransientFailureNotRetried) {
    auto inner = std::make_shared<ScriptedRoundTripper>(std::vector<ScriptedRoundTripper::Step>{
        {TransportFailure::Credentials}});
    http::ResilientRoundTripper rt(inner, profile(milliseconds(10), seconds(1)));
    RequestContext ctx;
    try {
        (void)RunSync(rt.RoundTrip(testUrl(), testRequest(), ctx));
        FAIL() << "expected TransportError";
    } catch (const http::TransportError& e) {
        EXPECT_EQ(e.reason(), TransportFailure::Credentials);
    }
    EXPECT_EQ(inner->Calls(), 1u);
}

TEST(ResilientRoundTripper, HttpErrorStatusReturnedWithoutRetry) {
    auto inner = std::make_shared<ScriptedRoundTripper>(std::vector<ScriptedRoundTripper::Step>{
        {std::nullopt, 500, "boom"}});
    http::ResilientRoundTripper rt(inner, profile(milliseconds(10), seconds(1)));
    RequestContext ctx;
    http::Response res = RunSync(rt.RoundTrip(testUrl(), testRequest(), ctx));
    EXPECT_EQ(res.result_int(), 500u);
    EXPECT_EQ(inner->Calls(), 1u);
}

TEST(ResilientRoundTripper, GivesUpWhenBudgetExhausted) {
    auto inner = std::make_shared<ScriptedRoundTripper>(std::vector<ScriptedRoundTripper::Step>{
        {TransportFailure::Connection}});
    http::ResilientRoundTripper rt(inner, profile(milliseconds(20), milliseconds(100)));
    RequestContext ctx;
    const auto start = steady_clock::now();
    try {
        (void)RunSync(rt.RoundTrip(testUrl(), testRequest(), ctx));
        FAIL() << "expected TransportError";
    } catch (const http::TransportError& e) {
        EXPECT_EQ(e.reason(), TransportFailure::Connection);
        EXPECT_NE(std::string(e.what()).find("gave up"), std::string::npos);
    }
    // 0ms, 20ms, 60ms; the next 80ms delay would overrun the 100ms budget
    EXPECT_GE(inner->Calls(), 2u);
    EXPECT_LE(inner->Calls(), 4u);
    EXPECT_LT(steady_clock::now() - start, milliseconds(500));
}

TEST(ResilientRoundTripper, CancellationInterruptsBackoff) {
    auto inner = std::make_shared<ScriptedRoundTripper>(std::vector<ScriptedRoundTripper::Step>{
        {TransportFailure::Connection}});
    http::ResilientRoundTripper rt(inner, profile(seconds(5), seconds(60)));
    CancellationSource cancel;
    RequestContext ctx;
    ctx.cancel = cancel.Token();
    std::thread canceller([&]() {
        std::this_thread::sleep_for(milliseconds(100));
        cancel.Cancel();
    });
    const auto start = steady_clock::now();
    try {
        (void)RunSync(rt.RoundTrip(testUrl(), testRequest(), ctx));
        ADD_FAILURE() << "expected TransportError";
    } catch (const http::TransportError& e) {
        EXPECT_EQ(e.reason(), TransportFailure::Canceled);
    }
    canceller.join();
    EXPECT_LT(steady_clock::now() - start, seconds(2));
    EXPECT_EQ(inner->Calls(), 1u);
}

TEST(ResilientRoundTripper, DeadlineStopsRetrying) {
    auto inner = std::make_shared<ScriptedRoundTripper>(std::vector<ScriptedRoundTripper::Step>{
        {TransportFailure::Connection}});
    http::ResilientRoundTripper rt(inner, profile(milliseconds(200), seconds(10)));
    RequestContext ctx;
    ctx.deadline = steady_clock::now() + milliseconds(50);
    try {
        (void)RunSync(rt.RoundTrip(testUrl(), testRequest(), ctx));
        FAIL() << "expected TransportError";
    } catch (const http::TransportError& e) {
        EXPECT_EQ(e.reason(), TransportFailure::Timeout);
    }
    EXPECT_EQ(inner->Calls(), 1u);
}

TEST(ResilientRoundTripper, LatencyToleranceSmallProfile) {
    const auto p = http::ResilienceProfile::LatencyToleranceSmall();
    EXPECT_EQ(p.baseDelay, milliseconds(100));
    EXPECT_EQ(p.giveUpAfter, seconds(1));
}
