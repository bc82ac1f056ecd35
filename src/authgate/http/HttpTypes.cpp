//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/authgate/http/HttpTypes.cpp
// Purpose: URL parsing and form encoding
//==========================================================================================================

#include <cctype>
#include <sstream>
#include <string>

#include "authgate/http/HttpTypes.hpp"

namespace authgate::http {

namespace {
    std::string toLower(const std::string& s) {
        std::string out; out.reserve(s.size());
        for (char c : s) {
            out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
        return out;
    }

    std::string defaultPort(const std::string& scheme) {
        return (scheme == std::string("https")) ? std::string("443") : std::string("80");
    }

    int hexValue(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
        if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
        return -1;
    }
}

std::string Url::HostHeader() const {
    std::string h = (host.find(':') != std::string::npos) ? std::string("[") + host + std::string("]") : host;
    if (port != defaultPort(scheme)) {
        h += ":" + port;
    }
    return h;
}

std::string Url::ToString() const {
    return scheme + "://" + HostHeader() + target;
}

bool ParseAbsoluteUrl(const std::string& text, Url& out, std::string& error) {
    Url parts;
    std::size_t schemeEnd = text.find("://");
    if (schemeEnd == std::string::npos || schemeEnd == 0) {
        error = "URL must be absolute (scheme://host/...)";
        return false;
    }
    parts.scheme = toLower(text.substr(0, schemeEnd));
    if (parts.scheme != "http" && parts.scheme != "https") {
        error = "unsupported URL scheme \"" + parts.scheme + "\"";
        return false;
    }
    std::size_t pos = schemeEnd + 3;

    std::size_t authorityEnd = text.find_first_of("/?#", pos);
    std::string authority = text.substr(pos, authorityEnd == std::string::npos ? std::string::npos : authorityEnd - pos);
    if (authority.find('@') != std::string::npos) {
        error = "URL must not carry userinfo";
        return false;
    }
    if (authority.find_first_of(" \t\r\n") != std::string::npos) {
        error = "URL host contains whitespace";
        return false;
    }

    std::string portText;
    if (!authority.empty() && authority[0] == '[') {
        std::size_t close = authority.find(']');
        if (close == std::string::npos) {
            error = "unterminated IPv6 literal";
            return false;
        }
        parts.host = authority.substr(1, close - 1);
        std::string rest = authority.substr(close + 1);
        if (!rest.empty()) {
            if (rest[0] != ':') {
                error = "unexpected characters after IPv6 literal";
                return false;
            }
            portText = rest.substr(1);
        }
    } else {
        std::size_t colon = authority.rfind(':');
        if (colon == std::string::npos) {
            parts.host = authority;
        } else {
            parts.host = authority.substr(0, colon);
            portText = authority.substr(colon + 1);
        }
    }
    if (parts.host.empty()) {
        error = "URL host is empty";
        return false;
    }

    if (portText.empty()) {
        parts.port = defaultPort(parts.scheme);
    } else {
        unsigned long n = 0;
        for (char c : portText) {
            if (!std::isdigit(static_cast<unsigned char>(c)) || n > 65535ul) {
                error = "invalid URL port \"" + portText + "\"";
                return false;
            }
            n = n * 10ul + static_cast<unsigned long>(c - '0');
        }
        if (n == 0ul || n > 65535ul) {
            error = "invalid URL port \"" + portText + "\"";
            return false;
        }
        parts.port = std::to_string(n);
    }

    std::string target = (authorityEnd == std::string::npos) ? std::string() : text.substr(authorityEnd);
    std::size_t hash = target.find('#');
    if (hash != std::string::npos) {
        target.erase(hash);
    }
    if (target.empty() || target[0] != '/') {
        target = "/" + target;
    }
    parts.target = target;

    out = std::move(parts);
    return true;
}

bool IsHeaderName(const std::string& name) {
    if (name.empty()) {
        return false;
    }
    static const std::string kSeparators = "()<>@,;:\\\"/[]?={} \t";
    for (char c : name) {
        const auto u = static_cast<unsigned char>(c);
        if (u <= 0x20 || u >= 0x7F || kSeparators.find(c) != std::string::npos) {
            return false;
        }
    }
    return true;
}

bool IsHeaderValue(const std::string& value) {
    return value.find_first_of(std::string("\r\n\0", 3)) == std::string::npos;
}

std::string UrlEncodeForm(const std::string& s) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < s.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' || c == '~') {
            oss << static_cast<char>(c);
        } else if (c == ' ') {
            oss << '+';
        } else {
            oss << '%';
            const char* hex = "0123456789ABCDEF";
            oss << hex[(c >> 4) & 0xFu] << hex[c & 0xFu];
        }
    }
    return oss.str();
}

std::string EncodeForm(const std::vector<std::pair<std::string, std::string>>& fields) {
    std::string out;
    for (const auto& kv : fields) {
        if (!out.empty()) {
            out += "&";
        }
        out += UrlEncodeForm(kv.first) + "=" + UrlEncodeForm(kv.second);
    }
    return out;
}

std::string UrlDecodeForm(const std::string& s) {
    std::string out; out.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (c == '+') {
            out.push_back(' ');
        } else if (c == '%' && i + 2 < s.size() && hexValue(s[i + 1]) >= 0 && hexValue(s[i + 2]) >= 0) {
            out.push_back(static_cast<char>(hexValue(s[i + 1]) * 16 + hexValue(s[i + 2])));
            i += 2;
        } else {
            out.push_back(c);
        }
    }
    return out;
}

} // namespace authgate::http
