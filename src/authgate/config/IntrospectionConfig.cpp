//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/authgate/config/IntrospectionConfig.cpp
// Purpose: Strict decoding of the OAuth2 introspection authenticator configuration
//==========================================================================================================

#include <chrono>
#include <initializer_list>
#include <string>

#include "authgate/Duration.hpp"
#include "authgate/config/IntrospectionConfig.hpp"

namespace authgate::config {

namespace {
    using Object = JSONValue::Object;

    // Looks up key; null values are treated as absent.
    const JSONValue* field(const Object& obj, const char* key) {
        auto it = obj.find(key);
        if (it == obj.end() || !it->second || it->second->isNull()) {
            return nullptr;
        }
        return it->second.get();
    }

    bool rejectUnknownKeys(const Object& obj, std::initializer_list<const char*> known, const std::string& where,
                           std::string& error) {
        for (const auto& kv : obj) {
            bool ok = false;
            for (const char* k : known) {
                if (kv.first == k) {
                    ok = true;
                    break;
                }
            }
            if (!ok) {
                error = where + std::string(": unknown field \"") + kv.first + std::string("\"");
                return false;
            }
        }
        return true;
    }

    bool typeError(const std::string& path, const char* expected, const JSONValue& v, std::string& error) {
        error = path + std::string(": expected ") + expected + std::string(", got ") + JSONTypeName(v);
        return false;
    }

    bool readString(const Object& obj, const char* key, const std::string& path, std::string& out, std::string& error) {
        const JSONValue* v = field(obj, key);
        if (!v) {
            return true;
        }
        if (!v->isString()) {
            return typeError(path + key, "string", *v, error);
        }
        out = std::get<std::string>(v->value);
        return true;
    }

    bool readBool(const Object& obj, const char* key, const std::string& path, bool& out, std::string& error) {
        const JSONValue* v = field(obj, key);
        if (!v) {
            return true;
        }
        if (!v->isBool()) {
            return typeError(path + key, "boolean", *v, error);
        }
        out = std::get<bool>(v->value);
        return true;
    }

    bool readStringArray(const Object& obj, const char* key, const std::string& path,
                         std::vector<std::string>& out, std::string& error) {
        const JSONValue* v = field(obj, key);
        if (!v) {
            return true;
        }
        if (!v->isArray()) {
            return typeError(path + key, "array of strings", *v, error);
        }
        const auto& arr = std::get<JSONValue::Array>(v->value);
        out.clear();
        for (std::size_t i = 0; i < arr.size(); ++i) {
            if (!arr[i] || !arr[i]->isString()) {
                return typeError(path + key + std::string("[") + std::to_string(i) + std::string("]"), "string",
                                 arr[i] ? *arr[i] : JSONValue(), error);
            }
            out.push_back(std::get<std::string>(arr[i]->value));
        }
        return true;
    }

    const Object* readObject(const Object& obj, const char* key, const std::string& path, bool& ok, std::string& error) {
        ok = true;
        const JSONValue* v = field(obj, key);
        if (!v) {
            return nullptr;
        }
        if (!v->isObject()) {
            ok = typeError(path + key, "object", *v, error);
            return nullptr;
        }
        return &std::get<Object>(v->value);
    }

    bool decodeTokenFrom(const Object& obj, BearerTokenLocation& loc, std::string& error) {
        const std::string path = "token_from.";
        if (!rejectUnknownKeys(obj, {"header", "query_parameter", "cookie"}, "token_from", error)) {
            return false;
        }
        std::string value;
        int count = 0;
        if (field(obj, "header")) {
            if (!readString(obj, "header", path, value, error)) return false;
            loc.header = value;
            ++count;
        }
        if (field(obj, "query_parameter")) {
            if (!readString(obj, "query_parameter", path, value, error)) return false;
            loc.queryParameter = value;
            ++count;
        }
        if (field(obj, "cookie")) {
            if (!readString(obj, "cookie", path, value, error)) return false;
            loc.cookie = value;
            ++count;
        }
        if (count > 1) {
            error = "token_from: only one of header, query_parameter or cookie may be set";
            return false;
        }
        return true;
    }

    bool decodePreAuthorization(const Object& obj, PreAuthorizationConfig& pre, std::string& error) {
        const std::string path = "pre_authorization.";
        if (!rejectUnknownKeys(obj, {"enabled", "client_id", "client_secret", "scope", "token_url"}, "pre_authorization", error)) {
            return false;
        }
        if (!readBool(obj, "enabled", path, pre.enabled, error)) return false;
        if (!readString(obj, "client_id", path, pre.clientId, error)) return false;
        if (!readString(obj, "client_secret", path, pre.clientSecret, error)) return false;
        if (!readStringArray(obj, "scope", path, pre.scopes, error)) return false;
        if (!readString(obj, "token_url", path, pre.tokenUrl, error)) return false;
        if (!pre.enabled) {
            return true;
        }
        if (pre.clientId.empty()) {
            error = "pre_authorization.client_id is required when pre-authorization is enabled";
            return false;
        }
        if (pre.clientSecret.empty()) {
            error = "pre_authorization.client_secret is required when pre-authorization is enabled";
            return false;
        }
        if (pre.tokenUrl.empty()) {
            error = "pre_authorization.token_url is required when pre-authorization is enabled";
            return false;
        }
        std::string urlError;
        if (!http::ParseAbsoluteUrl(pre.tokenUrl, pre.tokenEndpoint, urlError)) {
            error = std::string("pre_authorization.token_url: ") + urlError;
            return false;
        }
        return true;
    }

    bool resolveDuration(const std::string& text, const char* fallback, const char* name,
                         std::chrono::nanoseconds& out, std::string& error) {
        const std::string effective = text.empty() ? std::string(fallback) : text;
        auto parsed = ParseDuration(effective);
        if (!parsed) {
            error = std::string("retry.") + name + std::string(": invalid duration \"") + effective + std::string("\"");
            return false;
        }
        if (parsed->count() <= 0) {
            error = std::string("retry.") + name + std::string(": duration must be positive, got \"") + effective + std::string("\"");
            return false;
        }
        out = *parsed;
        return true;
    }
}

bool DecodeIntrospectionConfig(const JSONValue& raw, IntrospectionConfig& out, std::string& error) {
    out = IntrospectionConfig{};
    if (!raw.isObject()) {
        return typeError("configuration", "object", raw, error);
    }
    const Object& obj = std::get<Object>(raw.value);
    if (!rejectUnknownKeys(obj, {"required_scope", "target_audience", "trusted_issuers", "pre_authorization",
                                 "scope_strategy", "introspection_url", "token_from",
                                 "introspection_request_headers", "retry"},
                           "configuration", error)) {
        return false;
    }

    if (!readStringArray(obj, "required_scope", "", out.requiredScopes, error)) return false;
    if (!readStringArray(obj, "target_audience", "", out.targetAudiences, error)) return false;
    if (!readStringArray(obj, "trusted_issuers", "", out.trustedIssuers, error)) return false;

    std::string strategy;
    if (!readString(obj, "scope_strategy", "", strategy, error)) return false;
    auto resolved = ScopeStrategyFromString(strategy);
    if (!resolved) {
        error = std::string("scope_strategy: unknown strategy \"") + strategy + std::string("\"");
        return false;
    }
    out.scopeStrategy = *resolved;

    if (!readString(obj, "introspection_url", "", out.introspectionUrl, error)) return false;
    if (out.introspectionUrl.empty()) {
        error = "introspection_url is required";
        return false;
    }
    std::string urlError;
    if (!http::ParseAbsoluteUrl(out.introspectionUrl, out.introspectionEndpoint, urlError)) {
        error = std::string("introspection_url: ") + urlError;
        return false;
    }

    bool ok = true;
    if (const Object* tf = readObject(obj, "token_from", "", ok, error)) {
        BearerTokenLocation loc;
        if (!decodeTokenFrom(*tf, loc, error)) return false;
        out.tokenFrom = loc;
    }
    if (!ok) return false;

    if (const Object* headers = readObject(obj, "introspection_request_headers", "", ok, error)) {
        for (const auto& [name, value] : *headers) {
            if (!value || !value->isString()) {
                return typeError(std::string("introspection_request_headers.") + name, "string",
                                 value ? *value : JSONValue(), error);
            }
            const std::string& headerValue = std::get<std::string>(value->value);
            if (!http::IsHeaderName(name)) {
                error = std::string("introspection_request_headers: \"") + name + std::string("\" is not a valid header name");
                return false;
            }
            if (!http::IsHeaderValue(headerValue)) {
                error = std::string("introspection_request_headers.") + name +
                        std::string(": value contains CR, LF or NUL");
                return false;
            }
            out.introspectionRequestHeaders[name] = headerValue;
        }
    }
    if (!ok) return false;

    if (const Object* pre = readObject(obj, "pre_authorization", "", ok, error)) {
        PreAuthorizationConfig cfg;
        if (!decodePreAuthorization(*pre, cfg, error)) return false;
        out.preAuthorization = cfg;
    }
    if (!ok) return false;

    if (const Object* retry = readObject(obj, "retry", "", ok, error)) {
        if (!rejectUnknownKeys(*retry, {"max_delay", "give_up_after"}, "retry", error)) return false;
        RetryConfig cfg;
        if (!readString(*retry, "max_delay", "retry.", cfg.maxDelay, error)) return false;
        if (!readString(*retry, "give_up_after", "retry.", cfg.giveUpAfter, error)) return false;
        out.retry = cfg;
    }
    if (!ok) return false;

    return true;
}

bool ResolveRetryProfile(const IntrospectionConfig& cfg, http::ResilienceProfile& out, std::string& error) {
    if (!cfg.PreAuthorizationEnabled()) {
        out = http::ResilienceProfile::LatencyToleranceSmall();
        return true;
    }
    const RetryConfig retry = cfg.retry.value_or(RetryConfig{});
    http::ResilienceProfile profile;
    if (!resolveDuration(retry.maxDelay, kDefaultRetryMaxDelay, "max_delay", profile.baseDelay, error)) {
        return false;
    }
    if (!resolveDuration(retry.giveUpAfter, kDefaultRetryGiveUpAfter, "give_up_after", profile.giveUpAfter, error)) {
        return false;
    }
    out = profile;
    return true;
}

} // namespace authgate::config
