//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/authgate/BearerToken.hpp
// Purpose: Locate the caller's bearer credential in an inbound request
//==========================================================================================================
#pragma once

#include <optional>
#include <string>

#include "authgate/http/HttpTypes.hpp"

namespace authgate {

//==========================================================================================================
// BearerTokenLocation
// Purpose: Where to look for the credential. At most one field is set; none set means the default
//          "Authorization: Bearer <token>" header.
// Fields:
//   header: Name of a request header. "Authorization" keeps the Bearer-scheme parsing; any other header
//           is taken verbatim.
//   queryParameter: Name of a query (or form body) parameter.
//   cookie: Name of a cookie.
//==========================================================================================================
struct BearerTokenLocation {
    std::optional<std::string> header;
    std::optional<std::string> queryParameter;
    std::optional<std::string> cookie;
};

//==========================================================================================================
// ExtractBearerToken
// Purpose: Return the credential found at the configured location, or an empty string when there is none.
//==========================================================================================================
std::string ExtractBearerToken(const http::Request& request, const std::optional<BearerTokenLocation>& location);

// Token from "Authorization: Bearer <token>" (scheme compared case-insensitively).
std::string DefaultBearerToken(const http::Request& request);

} // namespace authgate
