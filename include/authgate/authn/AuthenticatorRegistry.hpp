//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/authgate/authn/AuthenticatorRegistry.hpp
// Purpose: Authenticator lookup by identifier and rule-level authenticator chain dispatch
//==========================================================================================================
#pragma once

#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include <boost/asio/awaitable.hpp>

#include "authgate/authn/IAuthenticator.hpp"
#include "authgate/config/ConfigurationProvider.hpp"

namespace authgate::authn {

//==========================================================================================================
// AuthenticatorRegistry
// Purpose: Owns the shared authenticator instances and runs a rule's authenticator chain.
// Chain semantics:
//   - handlers are tried in rule order
//   - NotResponsible moves on to the next handler
//   - the first Success or Failure ends the chain and is returned
//   - an exhausted chain is NotResponsible
//   - unknown handler ids are Misconfigured, disabled ones NotEnabled
//==========================================================================================================
class AuthenticatorRegistry {
public:
    explicit AuthenticatorRegistry(std::shared_ptr<const config::IConfigurationProvider> provider);

    // Returns false when an authenticator with the same identifier is already registered.
    bool Register(AuthenticatorPtr authenticator);

    AuthenticatorPtr Find(const std::string& id) const;

    std::vector<std::string> Identifiers() const;

    // Validates every handler of the rule; the first failure is returned.
    errors::Outcome ValidateRule(const Rule& rule) const;

    boost::asio::awaitable<errors::Outcome> Authenticate(const http::Request& request, const Rule& rule,
                                                         AuthenticationSession& session, const RequestContext& ctx) const;

    // Runs the chain on a private io_context driven by the calling thread.
    errors::Outcome AuthenticateBlocking(const http::Request& request, const Rule& rule,
                                         AuthenticationSession& session,
                                         const RequestContext& ctx = RequestContext{}) const;

private:
    std::shared_ptr<const config::IConfigurationProvider> provider;
    mutable std::shared_mutex mtx;
    std::unordered_map<std::string, AuthenticatorPtr> authenticators;
};

} // namespace authgate::authn
