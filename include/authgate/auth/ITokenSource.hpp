//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/authgate/auth/ITokenSource.hpp
// Purpose: Credential source interface for outbound requests made by authgate itself
//==========================================================================================================
#pragma once

#include <memory>
#include <vector>
#include <boost/asio/awaitable.hpp>

#include "authgate/Cancellation.hpp"
#include "authgate/http/HttpTypes.hpp"

namespace authgate::auth {

class ITokenSource {
public:
    virtual ~ITokenSource() = default;

    // Ensure credentials are ready (may perform network I/O, e.g. token fetch/refresh).
    // Throws http::TransportError when no credentials can be obtained.
    virtual boost::asio::awaitable<void> ensureReady(const RequestContext& ctx) = 0;

    // Headers to apply to an outgoing request; empty when no credentials are cached.
    virtual std::vector<http::HeaderKV> headers() const = 0;
};

using TokenSourcePtr = std::shared_ptr<ITokenSource>;

} // namespace authgate::auth
