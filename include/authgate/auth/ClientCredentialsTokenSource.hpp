//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/authgate/auth/ClientCredentialsTokenSource.hpp
// Purpose: OAuth2 client-credentials grant with cached, single-flight token refresh
//==========================================================================================================
#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <boost/asio/awaitable.hpp>

#include "authgate/auth/ITokenSource.hpp"
#include "authgate/http/IRoundTripper.hpp"

namespace authgate::auth {

//==========================================================================================================
// ClientCredentials
// Fields:
//   tokenUrl: Token endpoint (already validated as absolute)
//   clientId/clientSecret: Client credentials sent in the form body
//   scopes: Requested scopes, sent space-joined; omitted when empty
//   refreshSkew: Tokens are refreshed this long before they expire
//==========================================================================================================
struct ClientCredentials {
    http::Url tokenUrl;
    std::string clientId;
    std::string clientSecret;
    std::vector<std::string> scopes;
    std::chrono::seconds refreshSkew{10};
};

//==========================================================================================================
// ClientCredentialsTokenSource
// Purpose: Obtains an access token from the token endpoint and caches it until shortly before expiry.
//          Concurrent callers share a single in-flight refresh: exactly one caller talks to the token
//          endpoint, the others wait asynchronously for its result (or for their own cancellation/deadline).
//          The cache lock is never held across network I/O.
//==========================================================================================================
class ClientCredentialsTokenSource final : public ITokenSource {
public:
    ClientCredentialsTokenSource(ClientCredentials credentials, http::RoundTripperPtr transport);

    boost::asio::awaitable<void> ensureReady(const RequestContext& ctx) override;
    std::vector<http::HeaderKV> headers() const override;

    // Number of requests sent to the token endpoint so far.
    uint64_t FetchCount() const;

private:
    struct Waiter;
    enum class WaitResult { Refreshed, Failed, Abandoned, Canceled, TimedOut };

    bool hasValidTokenLocked(std::chrono::steady_clock::time_point now) const;
    boost::asio::awaitable<WaitResult> coWaitForRefresh(uint64_t observedGeneration, const RequestContext& ctx,
                                                        std::optional<http::TransportError>& failure);
    boost::asio::awaitable<void> coFetch(const RequestContext& ctx);
    void publishToken(const std::string& token, std::chrono::seconds expiresIn);
    void publishFailure(const http::TransportError& failure);
    void wakeWaiters(std::vector<std::shared_ptr<Waiter>> woken);

    ClientCredentials credentials;
    http::RoundTripperPtr transport;

    mutable std::mutex mtx;
    std::string cachedAccessToken;
    std::chrono::steady_clock::time_point tokenExpiry{};
    bool fetching{false};
    uint64_t generation{0};
    uint64_t fetches{0};
    std::optional<http::TransportError> lastFailure;
    bool lastAbandoned{false};
    std::vector<std::shared_ptr<Waiter>> waiters;
};

} // namespace authgate::auth
