//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/authgate/Duration.cpp
// Purpose: Duration string parsing
//==========================================================================================================

#include <cctype>
#include <cmath>
#include <cstdint>
#include <limits>
#include <string>

#include "authgate/Duration.hpp"

namespace authgate {

namespace {
    struct Unit {
        const char* suffix;
        long double nanos;
    };

    // Longest suffixes first so "ms" wins over "m" and "s".
    const Unit kUnits[] = {
        { "ns", 1.0L },
        { "us", 1e3L },
        { "\xC2\xB5s", 1e3L }, // U+00B5 micro sign
        { "\xCE\xBCs", 1e3L }, // U+03BC greek mu
        { "ms", 1e6L },
        { "s", 1e9L },
        { "m", 60e9L },
        { "h", 3600e9L },
    };

    bool matchUnit(const std::string& s, std::size_t pos, long double& nanos, std::size_t& len) {
        len = 0;
        for (const Unit& u : kUnits) {
            std::size_t n = std::char_traits<char>::length(u.suffix);
            if (s.compare(pos, n, u.suffix) == 0 && n > len) {
                len = n;
                nanos = u.nanos;
            }
        }
        return len > 0;
    }
}

std::optional<std::chrono::nanoseconds> ParseDuration(const std::string& text) {
    std::string s = text;
    bool negative = false;
    if (!s.empty() && (s[0] == '-' || s[0] == '+')) {
        negative = (s[0] == '-');
        s.erase(0, 1);
    }
    if (s == "0") {
        return std::chrono::nanoseconds(0);
    }
    if (s.empty()) {
        return std::nullopt;
    }

    long double total = 0.0L;
    std::size_t i = 0;
    while (i < s.size()) {
        std::size_t start = i;
        long double value = 0.0L;
        while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) {
            value = value * 10.0L + static_cast<long double>(s[i] - '0');
            ++i;
        }
        bool haveInt = i > start;
        bool haveFrac = false;
        if (i < s.size() && s[i] == '.') {
            ++i;
            long double scale = 0.1L;
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) {
                value += scale * static_cast<long double>(s[i] - '0');
                scale /= 10.0L;
                haveFrac = true;
                ++i;
            }
        }
        if (!haveInt && !haveFrac) {
            return std::nullopt;
        }
        long double unitNanos = 0.0L;
        std::size_t unitLen = 0;
        if (!matchUnit(s, i, unitNanos, unitLen)) {
            return std::nullopt;
        }
        i += unitLen;
        total += value * unitNanos;
        if (total > static_cast<long double>(std::numeric_limits<int64_t>::max())) {
            return std::nullopt;
        }
    }
    auto nanos = static_cast<int64_t>(std::llround(total));
    return std::chrono::nanoseconds(negative ? -nanos : nanos);
}

std::string FormatDuration(std::chrono::nanoseconds d) {
    const int64_t n = d.count();
    if (n != 0 && n % 1000000000LL == 0) {
        return std::to_string(n / 1000000000LL) + "s";
    }
    if (n != 0 && n % 1000000LL == 0) {
        return std::to_string(n / 1000000LL) + "ms";
    }
    if (n != 0 && n % 1000LL == 0) {
        return std::to_string(n / 1000LL) + "us";
    }
    return std::to_string(n) + "ns";
}

} // namespace authgate
