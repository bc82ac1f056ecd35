//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/authgate/config/ConfigurationProvider.cpp
// Purpose: Authenticator enablement and per-rule configuration lookup
//==========================================================================================================

#include <cctype>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>

#include "authgate/config/ConfigurationProvider.hpp"

namespace authgate::config {

namespace {
    bool isBlank(const std::string& s) {
        for (char c : s) {
            if (!std::isspace(static_cast<unsigned char>(c))) {
                return false;
            }
        }
        return true;
    }
}

JSONValue MergeJSON(const JSONValue& base, const JSONValue& overrides) {
    if (!base.isObject() || !overrides.isObject()) {
        return overrides;
    }
    JSONValue::Object merged = std::get<JSONValue::Object>(base.value);
    for (const auto& [key, value] : std::get<JSONValue::Object>(overrides.value)) {
        if (!value) {
            continue;
        }
        auto it = merged.find(key);
        if (it != merged.end() && it->second) {
            merged[key] = std::make_shared<JSONValue>(MergeJSON(*it->second, *value));
        } else {
            merged[key] = std::make_shared<JSONValue>(*value);
        }
    }
    return JSONValue(std::move(merged));
}

bool StaticConfigurationProvider::SetAuthenticator(const std::string& id, bool enabled,
                                                   const std::string& defaultConfigJson, std::string& error) {
    Entry entry;
    entry.enabled = enabled;
    if (!isBlank(defaultConfigJson)) {
        JSONValue parsed;
        if (!ParseJSON(defaultConfigJson, parsed, error)) {
            error = std::string("default configuration of authenticator ") + id + std::string(" is not valid JSON: ") + error;
            return false;
        }
        if (!parsed.isObject()) {
            error = std::string("default configuration of authenticator ") + id + std::string(" must be a JSON object");
            return false;
        }
        entry.defaults = std::move(parsed);
    }
    std::unique_lock<std::shared_mutex> lk(mtx);
    entries[id] = std::move(entry);
    return true;
}

void StaticConfigurationProvider::SetEnabled(const std::string& id, bool enabled) {
    std::unique_lock<std::shared_mutex> lk(mtx);
    entries[id].enabled = enabled;
}

bool StaticConfigurationProvider::AuthenticatorIsEnabled(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lk(mtx);
    auto it = entries.find(id);
    return it != entries.end() && it->second.enabled;
}

bool StaticConfigurationProvider::AuthenticatorConfig(const std::string& id, const std::string& rawRuleConfig,
                                                      JSONValue& out, std::string& error) const {
    JSONValue defaults{JSONValue::Object{}};
    {
        std::shared_lock<std::shared_mutex> lk(mtx);
        auto it = entries.find(id);
        if (it != entries.end()) {
            defaults = it->second.defaults;
        }
    }
    if (isBlank(rawRuleConfig)) {
        out = std::move(defaults);
        return true;
    }
    JSONValue rule;
    if (!ParseJSON(rawRuleConfig, rule, error)) {
        error = std::string("rule configuration is not valid JSON: ") + error;
        return false;
    }
    if (rule.isNull()) {
        out = std::move(defaults);
        return true;
    }
    out = MergeJSON(defaults, rule);
    return true;
}

} // namespace authgate::config
