//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/authgate/config/ConfigurationProvider.hpp
// Purpose: Authenticator enablement and per-rule configuration lookup
//==========================================================================================================
#pragma once

#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "authgate/JSONValue.h"

namespace authgate::config {

//==========================================================================================================
// IConfigurationProvider
// Purpose: Process-wide view of which authenticators are enabled and what their default configuration is.
//          Implementations must be safe for concurrent use.
//==========================================================================================================
class IConfigurationProvider {
public:
    virtual ~IConfigurationProvider() = default;

    virtual bool AuthenticatorIsEnabled(const std::string& id) const = 0;

    // Produces the effective configuration of authenticator `id` for one rule: the rule's raw JSON merged
    // over the authenticator's defaults. An empty (or whitespace-only) raw config yields the defaults.
    // Returns false with a message in `error` when the raw config is not valid JSON.
    virtual bool AuthenticatorConfig(const std::string& id, const std::string& rawRuleConfig,
                                     JSONValue& out, std::string& error) const = 0;
};

// Objects merge key by key (recursively); any other override value replaces the base value.
JSONValue MergeJSON(const JSONValue& base, const JSONValue& overrides);

//==========================================================================================================
// StaticConfigurationProvider
// Purpose: In-memory provider populated at startup (or by tests). Unknown authenticators are disabled and
//          have an empty default configuration.
//==========================================================================================================
class StaticConfigurationProvider final : public IConfigurationProvider {
public:
    // Registers (or replaces) an authenticator's enabled flag and default configuration JSON text.
    bool SetAuthenticator(const std::string& id, bool enabled, const std::string& defaultConfigJson, std::string& error);

    void SetEnabled(const std::string& id, bool enabled);

    bool AuthenticatorIsEnabled(const std::string& id) const override;
    bool AuthenticatorConfig(const std::string& id, const std::string& rawRuleConfig,
                             JSONValue& out, std::string& error) const override;

private:
    struct Entry {
        bool enabled{false};
        JSONValue defaults{JSONValue::Object{}};
    };

    mutable std::shared_mutex mtx;
    std::unordered_map<std::string, Entry> entries;
};

} // namespace authgate::config
