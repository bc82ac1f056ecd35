//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/authgate/authn/IntrospectionAuthenticator.cpp
// Purpose: OAuth2 token introspection authenticator (RFC 7662)
//==========================================================================================================

#include <algorithm>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <boost/beast/http.hpp>

#include "logging/Logger.h"
#include "authgate/BearerToken.hpp"
#include "authgate/JSONValue.h"
#include "authgate/ScopeStrategy.hpp"
#include "authgate/auth/AuthorizingRoundTripper.hpp"
#include "authgate/auth/ClientCredentialsTokenSource.hpp"
#include "authgate/authn/IntrospectionAuthenticator.hpp"
#include "authgate/http/BeastRoundTripper.hpp"

namespace authgate::authn {
namespace net = boost::asio;
namespace bhttp = boost::beast::http;
using errors::ErrorKind;
using errors::Outcome;

namespace {
    constexpr const char* kAccessTokenType = "access_token";

    struct IntrospectionResult {
        bool active{false};
        std::optional<JSONValue::Object> extra;
        std::string subject;
        std::string username;
        std::vector<std::string> audience;
        std::string tokenType;
        std::string issuer;
        std::string clientId;
        std::string scope;
    };

    bool readOptionalString(const JSONValue::Object& obj, const char* key, std::string& out, std::string& error) {
        auto it = obj.find(key);
        if (it == obj.end() || !it->second || it->second->isNull()) {
            return true;
        }
        if (!it->second->isString()) {
            error = std::string("field \"") + key + std::string("\" must be a string, got ") + JSONTypeName(*it->second);
            return false;
        }
        out = std::get<std::string>(it->second->value);
        return true;
    }

    bool decodeIntrospectionResult(const std::string& body, IntrospectionResult& out, std::string& error) {
        JSONValue doc;
        if (!ParseJSON(body, doc, error)) {
            return false;
        }
        if (!doc.isObject()) {
            error = std::string("expected a JSON object, got ") + JSONTypeName(doc);
            return false;
        }
        const auto& obj = std::get<JSONValue::Object>(doc.value);

        auto active = obj.find("active");
        if (active != obj.end() && active->second && !active->second->isNull()) {
            if (!active->second->isBool()) {
                error = std::string("field \"active\" must be a boolean, got ") + JSONTypeName(*active->second);
                return false;
            }
            out.active = std::get<bool>(active->second->value);
        }

        auto ext = obj.find("ext");
        if (ext != obj.end() && ext->second && !ext->second->isNull()) {
            if (!ext->second->isObject()) {
                error = std::string("field \"ext\" must be an object, got ") + JSONTypeName(*ext->second);
                return false;
            }
            out.extra = std::get<JSONValue::Object>(ext->second->value);
        }

        auto aud = obj.find("aud");
        if (aud != obj.end() && aud->second && !aud->second->isNull()) {
            if (aud->second->isString()) {
                // RFC 7662 allows a single audience as a plain string
                out.audience.push_back(std::get<std::string>(aud->second->value));
            } else if (aud->second->isArray()) {
                for (const auto& item : std::get<JSONValue::Array>(aud->second->value)) {
                    if (!item || !item->isString()) {
                        error = "field \"aud\" must contain only strings";
                        return false;
                    }
                    out.audience.push_back(std::get<std::string>(item->value));
                }
            } else {
                error = std::string("field \"aud\" must be an array of strings, got ") + JSONTypeName(*aud->second);
                return false;
            }
        }

        return readOptionalString(obj, "sub", out.subject, error) &&
               readOptionalString(obj, "username", out.username, error) &&
               readOptionalString(obj, "token_type", out.tokenType, error) &&
               readOptionalString(obj, "iss", out.issuer, error) &&
               readOptionalString(obj, "client_id", out.clientId, error) &&
               readOptionalString(obj, "scope", out.scope, error);
    }

    std::vector<std::string> splitSpaces(const std::string& s) {
        std::vector<std::string> parts;
        std::size_t start = 0;
        while (true) {
            std::size_t sp = s.find(' ', start);
            parts.push_back(s.substr(start, sp == std::string::npos ? std::string::npos : sp - start));
            if (sp == std::string::npos) {
                break;
            }
            start = sp + 1;
        }
        return parts;
    }

    std::string joinSpaces(const std::vector<std::string>& items) {
        std::string out;
        for (std::size_t i = 0; i < items.size(); ++i) {
            if (i > 0) { out += ' '; }
            out += items[i];
        }
        return out;
    }

    bool contains(const std::vector<std::string>& haystack, const std::string& needle) {
        return std::find(haystack.begin(), haystack.end(), needle) != haystack.end();
    }

    void appendKeyPart(std::string& key, const std::string& part) {
        key += std::to_string(part.size());
        key += ':';
        key += part;
    }

    Outcome reject(ErrorKind kind, std::string detail) {
        LOG_DEBUG("{}: {} ({})", IntrospectionAuthenticator::kIdentifier, errors::ErrorKindName(kind), detail);
        return Outcome::Failure(kind, std::move(detail));
    }
}

IntrospectionAuthenticator::IntrospectionAuthenticator(std::shared_ptr<const config::IConfigurationProvider> provider,
                                                       const Options& opts)
    : IntrospectionAuthenticator(std::move(provider), opts, nullptr) {}

IntrospectionAuthenticator::IntrospectionAuthenticator(std::shared_ptr<const config::IConfigurationProvider> provider,
                                                       const Options& opts, http::RoundTripperPtr base)
    : provider(std::move(provider)), opts(opts), base(std::move(base)) {
    if (!this->base) {
        http::BeastRoundTripper::Options beastOpts;
        beastOpts.connectTimeoutMs = opts.connectTimeoutMs;
        beastOpts.readTimeoutMs = opts.readTimeoutMs;
        beastOpts.caFile = opts.caFile;
        beastOpts.caPath = opts.caPath;
        this->base = std::make_shared<http::BeastRoundTripper>(beastOpts);
    }
    defaultTransport = std::make_shared<http::ResilientRoundTripper>(this->base, http::ResilienceProfile::LatencyToleranceSmall());
}

Outcome IntrospectionAuthenticator::Config(const std::string& rawConfig, config::IntrospectionConfig& cfg,
                                           http::ResilienceProfile& retry) const {
    JSONValue effective;
    std::string error;
    if (!provider->AuthenticatorConfig(kIdentifier, rawConfig, effective, error)) {
        return reject(ErrorKind::Misconfigured, std::string("configuration of ") + kIdentifier + std::string(" is invalid: ") + error);
    }
    if (!config::DecodeIntrospectionConfig(effective, cfg, error)) {
        return reject(ErrorKind::Misconfigured, std::string("configuration of ") + kIdentifier + std::string(" is invalid: ") + error);
    }
    if (!config::ResolveRetryProfile(cfg, retry, error)) {
        return reject(ErrorKind::Misconfigured, std::string("configuration of ") + kIdentifier + std::string(" is invalid: ") + error);
    }
    return Outcome::Success();
}

Outcome IntrospectionAuthenticator::Validate(const std::string& rawConfig) const {
    if (!provider->AuthenticatorIsEnabled(kIdentifier)) {
        return Outcome::Failure(ErrorKind::NotEnabled, std::string("authenticator ") + kIdentifier + std::string(" is disabled"));
    }
    config::IntrospectionConfig cfg;
    http::ResilienceProfile retry;
    return Config(rawConfig, cfg, retry);
}

std::size_t IntrospectionAuthenticator::CachedTransportCount() const {
    std::lock_guard<std::mutex> lk(transportMtx);
    return preAuthorizedTransports.size();
}

http::RoundTripperPtr IntrospectionAuthenticator::transportFor(const config::IntrospectionConfig& cfg,
                                                               const http::ResilienceProfile& retry) {
    if (!cfg.PreAuthorizationEnabled()) {
        return defaultTransport;
    }
    const auto& pre = *cfg.preAuthorization;
    std::string key;
    appendKeyPart(key, pre.tokenEndpoint.ToString());
    appendKeyPart(key, pre.clientId);
    appendKeyPart(key, pre.clientSecret);
    for (const auto& s : pre.scopes) {
        appendKeyPart(key, s);
    }
    key += '|';
    key += std::to_string(retry.baseDelay.count());
    key += '|';
    key += std::to_string(retry.giveUpAfter.count());

    std::lock_guard<std::mutex> lk(transportMtx);
    auto it = preAuthorizedTransports.find(key);
    if (it != preAuthorizedTransports.end()) {
        return it->second;
    }

    auth::ClientCredentials credentials;
    credentials.tokenUrl = pre.tokenEndpoint;
    credentials.clientId = pre.clientId;
    credentials.clientSecret = pre.clientSecret;
    credentials.scopes = pre.scopes;
    credentials.refreshSkew = std::chrono::seconds(opts.tokenRefreshSkewSeconds);
    auto source = std::make_shared<auth::ClientCredentialsTokenSource>(std::move(credentials), base);
    auto authorizing = std::make_shared<auth::AuthorizingRoundTripper>(std::move(source), base);
    http::RoundTripperPtr transport = std::make_shared<http::ResilientRoundTripper>(std::move(authorizing), retry);
    // Each rotated secret adds a key; the oldest entries make room
    const std::size_t capacity = std::max<std::size_t>(opts.maxCachedTransports, 1);
    while (!transportInsertionOrder.empty() && preAuthorizedTransports.size() >= capacity) {
        preAuthorizedTransports.erase(transportInsertionOrder.front());
        transportInsertionOrder.pop_front();
    }
    transportInsertionOrder.push_back(key);
    preAuthorizedTransports.emplace(std::move(key), transport);
    LOG_DEBUG("{}: new pre-authorized transport for client {} at {}", kIdentifier, pre.clientId, pre.tokenEndpoint.ToString());
    return transport;
}

net::awaitable<Outcome> IntrospectionAuthenticator::Authenticate(const http::Request& request,
                                                                 AuthenticationSession& session,
                                                                 const std::string& rawConfig,
                                                                 const Rule& rule,
                                                                 const RequestContext& ctx) {
    config::IntrospectionConfig cfg;
    http::ResilienceProfile retry;
    Outcome configured = Config(rawConfig, cfg, retry);
    if (!configured.IsSuccess()) {
        co_return configured;
    }

    const std::string token = ExtractBearerToken(request, cfg.tokenFrom);
    if (token.empty()) {
        co_return Outcome::NotResponsible();
    }

    ScopeMatcher matcher = ResolveScopeMatcher(cfg.scopeStrategy);
    std::vector<std::pair<std::string, std::string>> form;
    form.emplace_back("token", token);
    if (!matcher) {
        form.emplace_back("scope", joinSpaces(cfg.requiredScopes));
    }

    http::Request introspect{bhttp::verb::post, cfg.introspectionEndpoint.target, 11};
    for (const auto& [name, value] : cfg.introspectionRequestHeaders) {
        introspect.set(name, value);
    }
    introspect.set(bhttp::field::content_type, "application/x-www-form-urlencoded");
    introspect.body() = http::EncodeForm(form);

    http::RoundTripperPtr transport = transportFor(cfg, retry);
    std::optional<http::Response> response;
    std::string transportError;
    try {
        response = co_await transport->RoundTrip(cfg.introspectionEndpoint, std::move(introspect), ctx);
    } catch (const http::TransportError& e) {
        transportError = std::string("introspection request ") +
                         (e.reason() == http::TransportFailure::Canceled ? std::string("canceled: ") : std::string("failed: ")) +
                         e.what();
    }
    if (!response) {
        co_return reject(ErrorKind::Transport, transportError);
    }

    if (response->result_int() != 200) {
        co_return reject(ErrorKind::Transport, std::string("unexpected status ") + std::to_string(response->result_int()) +
                                                   std::string(" from introspection endpoint, expected 200"));
    }

    IntrospectionResult result;
    std::string decodeError;
    if (!decodeIntrospectionResult(response->body(), result, decodeError)) {
        co_return reject(ErrorKind::Decode, std::string("malformed introspection response: ") + decodeError);
    }

    if (!result.tokenType.empty() && result.tokenType != kAccessTokenType) {
        co_return reject(ErrorKind::Forbidden, std::string("not an access token but \"") + result.tokenType + std::string("\""));
    }
    if (!result.active) {
        co_return reject(ErrorKind::Unauthorized, "token not active");
    }
    for (const auto& audience : cfg.targetAudiences) {
        if (!contains(result.audience, audience)) {
            co_return reject(ErrorKind::Forbidden, std::string("audience mismatch: token is not intended for ") + audience);
        }
    }
    if (!cfg.trustedIssuers.empty() && !contains(cfg.trustedIssuers, result.issuer)) {
        co_return reject(ErrorKind::Forbidden, std::string("issuer mismatch: \"") + result.issuer + std::string("\" is not trusted"));
    }
    if (matcher) {
        const auto granted = splitSpaces(result.scope);
        for (const auto& scope : cfg.requiredScopes) {
            if (!matcher(granted, scope)) {
                co_return reject(ErrorKind::Forbidden, std::string("scope not granted: ") + scope);
            }
        }
    }

    JSONValue::Object extra = result.extra.value_or(JSONValue::Object{});
    extra["username"] = std::make_shared<JSONValue>(result.username);
    extra["client_id"] = std::make_shared<JSONValue>(result.clientId);
    extra["scope"] = std::make_shared<JSONValue>(result.scope);

    session.subject = result.subject;
    session.extra = std::move(extra);
    LOG_DEBUG("{}: rule {} authenticated subject {}", kIdentifier, rule.id, session.subject);
    co_return Outcome::Success();
}

} // namespace authgate::authn
