//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/authgate/auth/AuthorizingRoundTripper.hpp
// Purpose: Round tripper decorator that attaches credentials from a token source to every request
//==========================================================================================================
#pragma once

#include <boost/asio/awaitable.hpp>

#include "authgate/auth/ITokenSource.hpp"
#include "authgate/http/IRoundTripper.hpp"

namespace authgate::auth {

class AuthorizingRoundTripper final : public http::IRoundTripper {
public:
    AuthorizingRoundTripper(TokenSourcePtr source, http::RoundTripperPtr inner);

    // Headers from the token source replace any header of the same name already on the request.
    boost::asio::awaitable<http::Response> RoundTrip(const http::Url& url, http::Request request,
                                                     const RequestContext& ctx) override;

private:
    TokenSourcePtr source;
    http::RoundTripperPtr inner;
};

} // namespace authgate::auth
