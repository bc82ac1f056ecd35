//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/authgate/authn/AuthenticatorRegistry.cpp
// Purpose: Authenticator lookup by identifier and rule-level authenticator chain dispatch
//==========================================================================================================

#include <algorithm>
#include <mutex>
#include <utility>

#include "logging/Logger.h"
#include "authgate/authn/AuthenticatorRegistry.hpp"

namespace authgate::authn {
namespace net = boost::asio;
using errors::ErrorKind;
using errors::Outcome;

AuthenticatorRegistry::AuthenticatorRegistry(std::shared_ptr<const config::IConfigurationProvider> provider)
    : provider(std::move(provider)) {}

bool AuthenticatorRegistry::Register(AuthenticatorPtr authenticator) {
    if (!authenticator) {
        return false;
    }
    const std::string id = authenticator->Identifier();
    std::unique_lock<std::shared_mutex> lk(mtx);
    return authenticators.emplace(id, std::move(authenticator)).second;
}

AuthenticatorPtr AuthenticatorRegistry::Find(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lk(mtx);
    auto it = authenticators.find(id);
    return it == authenticators.end() ? nullptr : it->second;
}

std::vector<std::string> AuthenticatorRegistry::Identifiers() const {
    std::vector<std::string> ids;
    {
        std::shared_lock<std::shared_mutex> lk(mtx);
        for (const auto& kv : authenticators) {
            ids.push_back(kv.first);
        }
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

Outcome AuthenticatorRegistry::ValidateRule(const Rule& rule) const {
    if (rule.authenticators.empty()) {
        return Outcome::Failure(ErrorKind::Misconfigured, std::string("rule ") + rule.id + std::string(" has no authenticators"));
    }
    for (const auto& h : rule.authenticators) {
        AuthenticatorPtr a = Find(h.handler);
        if (!a) {
            return Outcome::Failure(ErrorKind::Misconfigured,
                                    std::string("rule ") + rule.id + std::string(" references unknown authenticator ") + h.handler);
        }
        Outcome o = a->Validate(h.rawConfig);
        if (!o.IsSuccess()) {
            return o;
        }
    }
    return Outcome::Success();
}

net::awaitable<Outcome> AuthenticatorRegistry::Authenticate(const http::Request& request, const Rule& rule,
                                                            AuthenticationSession& session, const RequestContext& ctx) const {
    for (const auto& h : rule.authenticators) {
        AuthenticatorPtr a = Find(h.handler);
        if (!a) {
            co_return Outcome::Failure(ErrorKind::Misconfigured,
                                       std::string("rule ") + rule.id + std::string(" references unknown authenticator ") + h.handler);
        }
        if (!provider->AuthenticatorIsEnabled(h.handler)) {
            co_return Outcome::Failure(ErrorKind::NotEnabled, std::string("authenticator ") + h.handler + std::string(" is disabled"));
        }
        Outcome o = co_await a->Authenticate(request, session, h.rawConfig, rule, ctx);
        if (o.IsNotResponsible()) {
            LOG_DEBUG("rule {}: authenticator {} not responsible, trying next", rule.id, h.handler);
            continue;
        }
        co_return o;
    }
    LOG_DEBUG("rule {}: no authenticator was responsible", rule.id);
    co_return Outcome::NotResponsible();
}

Outcome AuthenticatorRegistry::AuthenticateBlocking(const http::Request& request, const Rule& rule,
                                                    AuthenticationSession& session, const RequestContext& ctx) const {
    return RunToCompletion(Authenticate(request, rule, session, ctx));
}

} // namespace authgate::authn
