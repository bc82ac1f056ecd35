//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/authgate/authn/IAuthenticator.cpp
// Purpose: Blocking entry point for the coroutine authenticator contract
//==========================================================================================================

#include <exception>
#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>

#include "authgate/authn/IAuthenticator.hpp"

namespace authgate::authn {
namespace net = boost::asio;

errors::Outcome RunToCompletion(net::awaitable<errors::Outcome> op) {
    net::io_context ioc;
    errors::Outcome result;
    std::exception_ptr failure;
    net::co_spawn(ioc, std::move(op),
        [&](std::exception_ptr eptr, errors::Outcome outcome) {
            failure = eptr;
            result = std::move(outcome);
        });
    ioc.run();
    if (failure) {
        std::rethrow_exception(failure);
    }
    return result;
}

errors::Outcome AuthenticateBlocking(IAuthenticator& authenticator, const http::Request& request,
                                     AuthenticationSession& session, const std::string& rawConfig,
                                     const Rule& rule, const RequestContext& ctx) {
    return RunToCompletion(authenticator.Authenticate(request, session, rawConfig, rule, ctx));
}

} // namespace authgate::authn
