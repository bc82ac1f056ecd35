//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/authgate/ScopeStrategy.cpp
// Purpose: Scope strategy implementations
//==========================================================================================================

#include <cctype>
#include <string>
#include <vector>

#include "authgate/ScopeStrategy.hpp"

namespace authgate {

namespace {
    // Splits on '.', keeping empty segments ("a..b" -> {"a", "", "b"}).
    std::vector<std::string> splitDots(const std::string& s) {
        std::vector<std::string> parts;
        std::size_t start = 0;
        while (true) {
            std::size_t dot = s.find('.', start);
            if (dot == std::string::npos) {
                parts.push_back(s.substr(start));
                break;
            }
            parts.push_back(s.substr(start, dot - start));
            start = dot + 1;
        }
        return parts;
    }

    std::string toLower(const std::string& s) {
        std::string out; out.reserve(s.size());
        for (char c : s) {
            out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
        return out;
    }
}

std::optional<ScopeStrategy> ScopeStrategyFromString(const std::string& name) {
    const std::string n = toLower(name);
    if (n.empty() || n == "none") {
        return ScopeStrategy::None;
    }
    if (n == "exact") {
        return ScopeStrategy::Exact;
    }
    if (n == "hierarchic") {
        return ScopeStrategy::Hierarchic;
    }
    if (n == "wildcard") {
        return ScopeStrategy::Wildcard;
    }
    return std::nullopt;
}

const char* ScopeStrategyName(ScopeStrategy strategy) {
    switch (strategy) {
        case ScopeStrategy::None: return "none";
        case ScopeStrategy::Exact: return "exact";
        case ScopeStrategy::Hierarchic: return "hierarchic";
        case ScopeStrategy::Wildcard: return "wildcard";
    }
    return "none";
}

ScopeMatcher ResolveScopeMatcher(ScopeStrategy strategy) {
    switch (strategy) {
        case ScopeStrategy::Exact: return &ExactScopeMatch;
        case ScopeStrategy::Hierarchic: return &HierarchicScopeMatch;
        case ScopeStrategy::Wildcard: return &WildcardScopeMatch;
        case ScopeStrategy::None: break;
    }
    return ScopeMatcher();
}

bool ExactScopeMatch(const std::vector<std::string>& granted, const std::string& required) {
    for (const auto& g : granted) {
        if (g == required) {
            return true;
        }
    }
    return false;
}

bool HierarchicScopeMatch(const std::vector<std::string>& granted, const std::string& required) {
    const std::vector<std::string> needles = splitDots(required);
    for (const auto& g : granted) {
        if (g == required) {
            return true;
        }
        // "picture.read" never grants "picture"
        if (g.size() > required.size()) {
            continue;
        }
        const std::vector<std::string> hay = splitDots(g);
        for (std::size_t k = 0; k < needles.size(); ++k) {
            if (k >= hay.size()) {
                return true;
            }
            if (hay[k] != needles[k]) {
                break;
            }
        }
    }
    return false;
}

bool WildcardScopeMatch(const std::vector<std::string>& granted, const std::string& required) {
    const std::vector<std::string> needle = splitDots(required);
    for (const auto& g : granted) {
        const std::vector<std::string> matcher = splitDots(g);
        if (matcher.size() > needle.size()) {
            continue;
        }
        bool equal = true;
        for (std::size_t k = 0; k < matcher.size(); ++k) {
            const std::string& c = matcher[k];
            // Only a trailing "*" may stand for more than one segment
            if (k == matcher.size() - 1 && matcher.size() != needle.size() && c != "*") {
                equal = false;
                break;
            }
            if (c == "*" && !needle[k].empty()) {
                continue;
            }
            if (c != needle[k]) {
                equal = false;
                break;
            }
        }
        if (equal) {
            return true;
        }
    }
    return false;
}

} // namespace authgate
