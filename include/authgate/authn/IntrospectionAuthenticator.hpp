//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/authgate/authn/IntrospectionAuthenticator.hpp
// Purpose: OAuth2 token introspection authenticator (RFC 7662)
//==========================================================================================================
#pragma once

#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <boost/asio/awaitable.hpp>

#include "authgate/authn/IAuthenticator.hpp"
#include "authgate/config/ConfigurationProvider.hpp"
#include "authgate/config/IntrospectionConfig.hpp"
#include "authgate/http/IRoundTripper.hpp"
#include "authgate/http/ResilientRoundTripper.hpp"

namespace authgate::authn {

class IntrospectionAuthenticator final : public IAuthenticator {
public:
    static constexpr const char* kIdentifier = "oauth2_introspection";

    //==========================================================================================================
    // Options
    // Purpose: Process-level HTTP settings shared by every rule using this authenticator.
    // Fields:
    //   connectTimeoutMs: Resolve + connect + TLS handshake budget per attempt.
    //   readTimeoutMs: Write + read budget per attempt.
    //   caFile/caPath: Trust anchors for HTTPS endpoints (system defaults when both empty).
    //   tokenRefreshSkewSeconds: Pre-authorization tokens are refreshed this long before they expire.
    //   maxCachedTransports: Upper bound on cached pre-authorized transports; the oldest entry is
    //                        evicted first. Requests already holding an evicted transport finish on it.
    //==========================================================================================================
    struct Options {
        unsigned int connectTimeoutMs{1000};
        unsigned int readTimeoutMs{5000};
        std::string caFile;
        std::string caPath;
        unsigned int tokenRefreshSkewSeconds{10};
        std::size_t maxCachedTransports{64};
    };

    IntrospectionAuthenticator(std::shared_ptr<const config::IConfigurationProvider> provider, const Options& opts);

    // `base` performs the individual HTTP exchanges (introspection and token requests) instead of the
    // built-in Beast client.
    IntrospectionAuthenticator(std::shared_ptr<const config::IConfigurationProvider> provider, const Options& opts,
                               http::RoundTripperPtr base);

    std::string Identifier() const override { return kIdentifier; }

    boost::asio::awaitable<errors::Outcome> Authenticate(const http::Request& request,
                                                         AuthenticationSession& session,
                                                         const std::string& rawConfig,
                                                         const Rule& rule,
                                                         const RequestContext& ctx) override;

    errors::Outcome Validate(const std::string& rawConfig) const override;

    // Effective configuration of one rule: provider defaults merged with rawConfig, decoded and with the
    // retry schedule resolved. Failures are Misconfigured.
    errors::Outcome Config(const std::string& rawConfig, config::IntrospectionConfig& cfg,
                           http::ResilienceProfile& retry) const;

    // Number of pre-authorized transports currently cached, at most Options::maxCachedTransports.
    std::size_t CachedTransportCount() const;

private:
    http::RoundTripperPtr transportFor(const config::IntrospectionConfig& cfg, const http::ResilienceProfile& retry);

    std::shared_ptr<const config::IConfigurationProvider> provider;
    Options opts;
    http::RoundTripperPtr base;
    http::RoundTripperPtr defaultTransport;

    mutable std::mutex transportMtx;
    std::unordered_map<std::string, http::RoundTripperPtr> preAuthorizedTransports;
    std::deque<std::string> transportInsertionOrder;
};

} // namespace authgate::authn
