//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/authgate/auth/AuthorizingRoundTripper.cpp
// Purpose: Round tripper decorator that attaches credentials from a token source to every request
//==========================================================================================================

#include <utility>

#include "authgate/auth/AuthorizingRoundTripper.hpp"

namespace authgate::auth {
namespace net = boost::asio;

AuthorizingRoundTripper::AuthorizingRoundTripper(TokenSourcePtr source, http::RoundTripperPtr inner)
    : source(std::move(source)), inner(std::move(inner)) {}

net::awaitable<http::Response> AuthorizingRoundTripper::RoundTrip(const http::Url& url, http::Request request,
                                                                  const RequestContext& ctx) {
    co_await source->ensureReady(ctx);
    for (const auto& h : source->headers()) {
        request.set(h.name, h.value);
    }
    co_return co_await inner->RoundTrip(url, std::move(request), ctx);
}

} // namespace authgate::auth
