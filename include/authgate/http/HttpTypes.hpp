//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/authgate/http/HttpTypes.hpp
// Purpose: HTTP message aliases, absolute URL parsing and form/query encoding helpers
//==========================================================================================================
#pragma once

#include <optional>
#include <string>
#include <vector>
#include <utility>
#include <boost/beast/http.hpp>

namespace authgate::http {

using Request = boost::beast::http::request<boost::beast::http::string_body>;
using Response = boost::beast::http::response<boost::beast::http::string_body>;

struct HeaderKV {
    std::string name;
    std::string value;
};

//==========================================================================================================
// Url
// Purpose: Absolute http/https URL split into the pieces needed to open a connection.
// Fields:
//   scheme: "http" or "https" (lowercase)
//   host: Hostname or IP literal (IPv6 without brackets)
//   port: Explicit port or the scheme default ("80"/"443")
//   target: Path plus optional "?query"; "/" when the URL has no path. Fragments are dropped.
//==========================================================================================================
struct Url {
    std::string scheme;
    std::string host;
    std::string port;
    std::string target;

    // Host header value: host, plus ":port" when the port is not the scheme default.
    std::string HostHeader() const;

    std::string ToString() const;
};

//==========================================================================================================
// ParseAbsoluteUrl
// Purpose: Validate and split an absolute http(s) URL.
// Returns: true on success; false with error populated when the URL is relative, uses another scheme,
//          carries userinfo, has an empty host or a port outside 1..65535.
//==========================================================================================================
bool ParseAbsoluteUrl(const std::string& text, Url& out, std::string& error);

// RFC 7230 token: non-empty, visible ASCII without separators.
bool IsHeaderName(const std::string& name);

// Header field value that cannot split into further header lines (no CR, LF or NUL).
bool IsHeaderValue(const std::string& value);

// application/x-www-form-urlencoded encoding of one key or value (space -> '+').
std::string UrlEncodeForm(const std::string& s);

// Form encoding of ordered key/value pairs: "k1=v1&k2=v2".
std::string EncodeForm(const std::vector<std::pair<std::string, std::string>>& fields);

// Decodes "%XX" escapes and '+' as space; malformed escapes are kept verbatim.
std::string UrlDecodeForm(const std::string& s);

} // namespace authgate::http
