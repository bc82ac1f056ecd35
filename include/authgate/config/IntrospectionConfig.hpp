//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/authgate/config/IntrospectionConfig.hpp
// Purpose: Typed configuration of the OAuth2 introspection authenticator and its strict JSON decoder
//==========================================================================================================
#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "authgate/BearerToken.hpp"
#include "authgate/JSONValue.h"
#include "authgate/ScopeStrategy.hpp"
#include "authgate/http/HttpTypes.hpp"
#include "authgate/http/ResilientRoundTripper.hpp"

namespace authgate::config {

struct PreAuthorizationConfig {
    bool enabled{false};
    std::string clientId;
    std::string clientSecret;
    std::vector<std::string> scopes;
    std::string tokenUrl;
    http::Url tokenEndpoint;      // parsed tokenUrl, valid when enabled
};

// Duration strings as written in the configuration; blank fields get defaults on resolution.
struct RetryConfig {
    std::string maxDelay;
    std::string giveUpAfter;
};

//==========================================================================================================
// IntrospectionConfig
// JSON keys:
//   required_scope, target_audience, trusted_issuers: arrays of strings
//   scope_strategy: none|exact|hierarchic|wildcard (case-insensitive, empty = none)
//   introspection_url: absolute http(s) URL (required)
//   token_from: {header|query_parameter|cookie: name}, at most one key
//   introspection_request_headers: object of string values
//   pre_authorization: {enabled, client_id, client_secret, scope, token_url}
//   retry: {max_delay, give_up_after}
//==========================================================================================================
struct IntrospectionConfig {
    std::vector<std::string> requiredScopes;
    std::vector<std::string> targetAudiences;
    std::vector<std::string> trustedIssuers;
    ScopeStrategy scopeStrategy{ScopeStrategy::None};
    std::string introspectionUrl;
    http::Url introspectionEndpoint;
    std::optional<BearerTokenLocation> tokenFrom;
    std::map<std::string, std::string> introspectionRequestHeaders;
    std::optional<PreAuthorizationConfig> preAuthorization;
    std::optional<RetryConfig> retry;

    bool PreAuthorizationEnabled() const { return preAuthorization && preAuthorization->enabled; }
};

// Strict decode: unknown keys and wrong types are errors at every level, JSON null counts as absent.
bool DecodeIntrospectionConfig(const JSONValue& raw, IntrospectionConfig& out, std::string& error);

// Retry schedule for the introspection transport. Without pre-authorization this is always the fixed
// low-latency profile. With pre-authorization blank fields default to 500ms / 1s; values that do not
// parse as durations (or are negative) are errors.
bool ResolveRetryProfile(const IntrospectionConfig& cfg, http::ResilienceProfile& out, std::string& error);

inline constexpr const char* kDefaultRetryMaxDelay = "500ms";
inline constexpr const char* kDefaultRetryGiveUpAfter = "1s";

} // namespace authgate::config
