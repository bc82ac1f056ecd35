//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/authgate/ScopeStrategy.hpp
// Purpose: Scope comparison strategies (exact, hierarchic, wildcard) resolved once at configuration time
//==========================================================================================================
#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace authgate {

enum class ScopeStrategy {
    None,        // scopes are forwarded to the introspection endpoint, no local check
    Exact,
    Hierarchic,
    Wildcard
};

// Decides whether the granted scopes satisfy one required scope.
using ScopeMatcher = std::function<bool(const std::vector<std::string>& granted, const std::string& required)>;

//==========================================================================================================
// ScopeStrategyFromString
// Purpose: Case-insensitive lookup of "none", "exact", "hierarchic" and "wildcard". An empty string
//          selects None. Unknown names yield std::nullopt.
//==========================================================================================================
std::optional<ScopeStrategy> ScopeStrategyFromString(const std::string& name);

const char* ScopeStrategyName(ScopeStrategy strategy);

// Returns the comparison for a strategy; empty function for ScopeStrategy::None.
ScopeMatcher ResolveScopeMatcher(ScopeStrategy strategy);

// "foo" grants "foo" only.
bool ExactScopeMatch(const std::vector<std::string>& granted, const std::string& required);

// "foo" grants "foo", "foo.bar" and "foo.bar.baz"; "foo.bar" does not grant "foo".
bool HierarchicScopeMatch(const std::vector<std::string>& granted, const std::string& required);

// "foo.*" grants "foo.bar" and "foo.bar.baz"; "foo.*.baz" grants "foo.bar.baz" but not "foo..baz".
bool WildcardScopeMatch(const std::vector<std::string>& granted, const std::string& required);

} // namespace authgate
