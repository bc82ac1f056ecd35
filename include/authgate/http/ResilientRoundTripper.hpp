//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/authgate/http/ResilientRoundTripper.hpp
// Purpose: Retry-with-backoff decorator for connection-level failures
//==========================================================================================================
#pragma once

#include <chrono>
#include <memory>
#include <boost/asio/awaitable.hpp>

#include "authgate/http/IRoundTripper.hpp"

namespace authgate::http {

//==========================================================================================================
// ResilienceProfile
// Purpose: Bounds the retry schedule.
// Fields:
//   baseDelay: Delay before the first retry; each further retry doubles the previous delay.
//   giveUpAfter: No retry is scheduled once elapsed time plus the next delay would exceed this budget.
//==========================================================================================================
struct ResilienceProfile {
    std::chrono::nanoseconds baseDelay{std::chrono::milliseconds(100)};
    std::chrono::nanoseconds giveUpAfter{std::chrono::seconds(1)};

    // Fixed low-latency profile used when no retry configuration applies (100ms / 1s).
    static ResilienceProfile LatencyToleranceSmall() { return ResilienceProfile{}; }

    bool operator==(const ResilienceProfile& o) const {
        return baseDelay == o.baseDelay && giveUpAfter == o.giveUpAfter;
    }
};

//==========================================================================================================
// ResilientRoundTripper
// Purpose: Wraps another round tripper and retries transient TransportErrors (connection failures and
//          timeouts). Any HTTP response, whatever its status, is returned as-is without retrying.
//          Cancellation interrupts the backoff sleep.
//==========================================================================================================
class ResilientRoundTripper final : public IRoundTripper {
public:
    ResilientRoundTripper(RoundTripperPtr inner, ResilienceProfile profile);

    boost::asio::awaitable<Response> RoundTrip(const Url& url, Request request, const RequestContext& ctx) override;

    const ResilienceProfile& Profile() const { return profile; }

private:
    RoundTripperPtr inner;
    ResilienceProfile profile;
};

} // namespace authgate::http
