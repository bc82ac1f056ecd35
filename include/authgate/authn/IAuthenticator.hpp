//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/authgate/authn/IAuthenticator.hpp
// Purpose: Pluggable authenticator contract
//==========================================================================================================
#pragma once

#include <memory>
#include <string>
#include <boost/asio/awaitable.hpp>

#include "authgate/Cancellation.hpp"
#include "authgate/Session.h"
#include "authgate/errors/Outcome.h"
#include "authgate/http/HttpTypes.hpp"

namespace authgate::authn {

//==========================================================================================================
// IAuthenticator
// Purpose: One authentication mechanism. A single instance serves every rule that references its identifier,
//          concurrently.
// Operations:
//   Identifier: Stable handler name used in rules.
//   Authenticate: Success mutates session; NotResponsible means "no credential for me here, try the next
//                 authenticator"; Failure(kind, detail) is terminal for the request.
//   Validate: Checks enablement (NotEnabled) and configuration (Misconfigured) without doing I/O.
//==========================================================================================================
class IAuthenticator {
public:
    virtual ~IAuthenticator() = default;

    virtual std::string Identifier() const = 0;

    virtual boost::asio::awaitable<errors::Outcome> Authenticate(const http::Request& request,
                                                                 AuthenticationSession& session,
                                                                 const std::string& rawConfig,
                                                                 const Rule& rule,
                                                                 const RequestContext& ctx) = 0;

    virtual errors::Outcome Validate(const std::string& rawConfig) const = 0;
};

using AuthenticatorPtr = std::shared_ptr<IAuthenticator>;

// Runs op to completion on a private io_context driven by the calling thread and rethrows its exception.
errors::Outcome RunToCompletion(boost::asio::awaitable<errors::Outcome> op);

// Runs Authenticate to completion on a private io_context driven by the calling thread.
errors::Outcome AuthenticateBlocking(IAuthenticator& authenticator, const http::Request& request,
                                     AuthenticationSession& session, const std::string& rawConfig,
                                     const Rule& rule, const RequestContext& ctx = RequestContext{});

} // namespace authgate::authn
