//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/authgate/BearerToken.cpp
// Purpose: Bearer credential extraction from header, query/form parameter or cookie
//==========================================================================================================

#include <cctype>
#include <string>

#include <boost/beast/http.hpp>

#include "authgate/BearerToken.hpp"

namespace authgate {

namespace beasthttp = boost::beast::http;

namespace {
    bool icaseEqual(const std::string& a, const std::string& b) {
        if (a.size() != b.size()) {
            return false;
        }
        for (std::size_t i = 0; i < a.size(); ++i) {
            if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
                return false;
            }
        }
        return true;
    }

    std::string trim(const std::string& s) {
        std::size_t b = 0, e = s.size();
        while (b < e && (s[b] == ' ' || s[b] == '\t')) {
            ++b;
        }
        while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t')) {
            --e;
        }
        return s.substr(b, e - b);
    }

    // First value of `name` in an "a=1&b=2" encoded string.
    std::optional<std::string> findFormValue(const std::string& encoded, const std::string& name) {
        std::size_t start = 0;
        while (start <= encoded.size()) {
            std::size_t amp = encoded.find('&', start);
            if (amp == std::string::npos) {
                amp = encoded.size();
            }
            std::string kv = encoded.substr(start, amp - start);
            std::size_t eq = kv.find('=');
            std::string key = http::UrlDecodeForm(kv.substr(0, eq));
            if (!kv.empty() && key == name) {
                return (eq == std::string::npos) ? std::string() : http::UrlDecodeForm(kv.substr(eq + 1));
            }
            start = amp + 1;
        }
        return std::nullopt;
    }

    std::string queryOrFormValue(const http::Request& request, const std::string& name) {
        // Body parameters take precedence over the query string for form posts
        const auto method = request.method();
        if (method == beasthttp::verb::post || method == beasthttp::verb::put || method == beasthttp::verb::patch) {
            std::string ct = std::string(request[beasthttp::field::content_type]);
            if (ct.rfind("application/x-www-form-urlencoded", 0) == 0) {
                auto v = findFormValue(request.body(), name);
                if (v) {
                    return *v;
                }
            }
        }
        const std::string target = std::string(request.target());
        std::size_t q = target.find('?');
        if (q == std::string::npos) {
            return std::string();
        }
        std::string query = target.substr(q + 1);
        std::size_t hash = query.find('#');
        if (hash != std::string::npos) {
            query.erase(hash);
        }
        auto v = findFormValue(query, name);
        return v ? *v : std::string();
    }

    std::string cookieValue(const http::Request& request, const std::string& name) {
        auto range = request.equal_range(beasthttp::field::cookie);
        for (auto it = range.first; it != range.second; ++it) {
            const std::string header = std::string(it->value());
            std::size_t start = 0;
            while (start < header.size()) {
                std::size_t semi = header.find(';', start);
                if (semi == std::string::npos) {
                    semi = header.size();
                }
                std::string pair = trim(header.substr(start, semi - start));
                std::size_t eq = pair.find('=');
                if (eq != std::string::npos && pair.substr(0, eq) == name) {
                    std::string v = pair.substr(eq + 1);
                    if (v.size() >= 2 && v.front() == '"' && v.back() == '"') {
                        v = v.substr(1, v.size() - 2);
                    }
                    return v;
                }
                start = semi + 1;
            }
        }
        return std::string();
    }
}

std::string DefaultBearerToken(const http::Request& request) {
    const std::string value = std::string(request[beasthttp::field::authorization]);
    std::size_t space = value.find(' ');
    if (space == std::string::npos) {
        return std::string();
    }
    if (!icaseEqual(value.substr(0, space), "bearer")) {
        return std::string();
    }
    return value.substr(space + 1);
}

std::string ExtractBearerToken(const http::Request& request, const std::optional<BearerTokenLocation>& location) {
    if (location) {
        if (location->header) {
            if (icaseEqual(*location->header, "Authorization")) {
                return DefaultBearerToken(request);
            }
            return std::string(request[*location->header]);
        }
        if (location->queryParameter) {
            return queryOrFormValue(request, *location->queryParameter);
        }
        if (location->cookie) {
            return cookieValue(request, *location->cookie);
        }
    }
    return DefaultBearerToken(request);
}

} // namespace authgate
