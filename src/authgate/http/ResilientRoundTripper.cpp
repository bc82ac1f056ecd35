//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/authgate/http/ResilientRoundTripper.cpp
// Purpose: Bounded retry-with-backoff around an inner round tripper
//==========================================================================================================

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "logging/Logger.h"
#include "authgate/Duration.hpp"
#include "authgate/http/ResilientRoundTripper.hpp"

namespace authgate::http {
namespace net = boost::asio;
using Clock = std::chrono::steady_clock;

namespace {
    // Runs on its own strand, which the cancellation callback posts to.
    net::awaitable<void> coBackoff(std::chrono::nanoseconds delay, const RequestContext& ctx) {
        auto ex = co_await net::this_coro::executor;
        auto timer = std::make_shared<net::steady_timer>(ex);
        timer->expires_after(std::chrono::duration_cast<Clock::duration>(delay));
        std::weak_ptr<net::steady_timer> weak = timer;
        CancellationRegistration reg = ctx.cancel.Subscribe([weak, ex]() {
            net::post(ex, [weak]() {
                if (auto t = weak.lock()) {
                    t->cancel();
                }
            });
        });
        boost::system::error_code ec;
        co_await timer->async_wait(net::redirect_error(net::use_awaitable, ec));
    }
}

ResilientRoundTripper::ResilientRoundTripper(RoundTripperPtr inner, ResilienceProfile profile)
    : inner(std::move(inner)), profile(profile) {}

net::awaitable<Response> ResilientRoundTripper::RoundTrip(const Url& url, Request request, const RequestContext& ctx) {
    const auto start = Clock::now();
    auto delay = profile.baseDelay;
    unsigned int attempt = 0;
    auto ex = co_await net::this_coro::executor;

    while (true) {
        ++attempt;
        std::optional<TransportError> failure;
        try {
            // Each attempt gets its own copy of the request
            co_return co_await inner->RoundTrip(url, request, ctx);
        } catch (const TransportError& e) {
            if (!e.transient()) {
                throw;
            }
            failure.emplace(e);
        }

        const auto elapsed = Clock::now() - start;
        if (elapsed + delay > profile.giveUpAfter) {
            LOG_WARN("HTTP {}: giving up after {} attempt(s): {}", url.ToString(), attempt, failure->what());
            throw TransportError(failure->reason(),
                std::string(failure->what()) + std::string(" (gave up after ") + std::to_string(attempt) + std::string(" attempts)"));
        }
        if (ctx.deadline && Clock::now() + delay >= *ctx.deadline) {
            throw TransportError(TransportFailure::Timeout, std::string(failure->what()) + std::string(" (request deadline reached)"));
        }

        if (ctx.cancel.IsCanceled()) {
            throw TransportError(TransportFailure::Canceled, "request canceled");
        }
        LOG_WARN("HTTP {}: attempt {} failed ({}), retrying in {}", url.ToString(), attempt, failure->what(), FormatDuration(delay));

        co_await net::co_spawn(net::make_strand(ex), coBackoff(delay, ctx), net::use_awaitable);
        if (ctx.cancel.IsCanceled()) {
            throw TransportError(TransportFailure::Canceled, "request canceled");
        }
        delay *= 2;
    }
}

} // namespace authgate::http
