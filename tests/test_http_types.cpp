//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_http_types.cpp
// Purpose: Tests for URL parsing, form encoding and outcome-to-status mapping
//==========================================================================================================

#include <gtest/gtest.h>

#include <string>

#include "authgate/errors/Outcome.h"
#include "authgate/http/HttpTypes.hpp"
#include "authgate/http/IRoundTripper.hpp"

using namespace authgate;

TEST(HttpTypes, ParseAbsoluteUrl_Defaults) {
    http::Url u;
    std::string err;
    ASSERT_TRUE(http::ParseAbsoluteUrl("https://auth.example.com", u, err)) << err;
    EXPECT_EQ(u.scheme, std::string("https"));
    EXPECT_EQ(u.host, std::string("auth.example.com"));
    EXPECT_EQ(u.port, std::string("443"));
    EXPECT_EQ(u.target, std::string("/"));
    EXPECT_EQ(u.HostHeader(), std::string("auth.example.com"));
}

TEST(HttpTypes, ParseAbsoluteUrl_PortPathQueryFragment) {
    http::Url u;
    std::string err;
    ASSERT_TRUE(http::ParseAbsoluteUrl("HTTP://127.0.0.1:8080/oauth2/introspect?x=1#frag", u, err)) << err;
    EXPECT_EQ(u.scheme, std::string("http"));
    EXPECT_EQ(u.port, std::string("8080"));
    EXPECT_EQ(u.target, std::string("/oauth2/introspect?x=1"));
    EXPECT_EQ(u.HostHeader(), std::string("127.0.0.1:8080"));
    EXPECT_EQ(u.ToString(), std::string("http://127.0.0.1:8080/oauth2/introspect?x=1"));

    ASSERT_TRUE(http::ParseAbsoluteUrl("http://[::1]:9000/i", u, err)) << err;
    EXPECT_EQ(u.host, std::string("::1"));
    EXPECT_EQ(u.HostHeader(), std::string("[::1]:9000"));
}

TEST(HttpTypes, ParseAbsoluteUrl_Rejects) {
    http::Url u;
    std::string err;
    EXPECT_FALSE(http::ParseAbsoluteUrl("/relative/path", u, err));
    EXPECT_FALSE(http::ParseAbsoluteUrl("ftp://host/x", u, err));
    EXPECT_FALSE(http::ParseAbsoluteUrl("http:///nohost", u, err));
    EXPECT_FALSE(http::ParseAbsoluteUrl("http://user:pw@host/", u, err));
    EXPECT_FALSE(http::ParseAbsoluteUrl("http://host:0/", u, err));
    EXPECT_FALSE(http::ParseAbsoluteUrl("http://host:70000/", u, err));
    EXPECT_FALSE(http::ParseAbsoluteUrl("http://host:8a/", u, err));
    EXPECT_FALSE(http::ParseAbsoluteUrl("", u, err));
}

TEST(HttpTypes, FormEncoding) {
    EXPECT_EQ(http::UrlEncodeForm("read write"), std::string("read+write"));
    EXPECT_EQ(http::UrlEncodeForm("a&b=c/d"), std::string("a%26b%3Dc%2Fd"));
    EXPECT_EQ(http::EncodeForm({{"token", "abc"}, {"scope", "read write"}}), std::string("token=abc&scope=read+write"));
    EXPECT_EQ(http::UrlDecodeForm("read+write%21"), std::string("read write!"));
    EXPECT_EQ(http::UrlDecodeForm("100%"), std::string("100%"));
    EXPECT_EQ(http::UrlDecodeForm("%zz"), std::string("%zz"));
}

TEST(HttpTypes, HeaderNameAndValueChecks) {
    EXPECT_TRUE(http::IsHeaderName("X-Tenant"));
    EXPECT_TRUE(http::IsHeaderName("x_custom.1!"));
    EXPECT_FALSE(http::IsHeaderName(""));
    EXPECT_FALSE(http::IsHeaderName("X Tenant"));
    EXPECT_FALSE(http::IsHeaderName("X:A"));
    EXPECT_FALSE(http::IsHeaderName("X\r\nY"));
    EXPECT_FALSE(http::IsHeaderName("caf\xc3\xa9"));

    EXPECT_TRUE(http::IsHeaderValue(""));
    EXPECT_TRUE(http::IsHeaderValue("Bearer a b\tc"));
    EXPECT_FALSE(http::IsHeaderValue("v\r\nX-Evil: 1"));
    EXPECT_FALSE(http::IsHeaderValue("v\n"));
    EXPECT_FALSE(http::IsHeaderValue(std::string("v\0w", 3)));
}

TEST(HttpTypes, TransportErrorTransience) {
    EXPECT_TRUE(http::TransportError(http::TransportFailure::Connection, "x").transient());
    EXPECT_TRUE(http::TransportError(http::TransportFailure::Timeout, "x").transient());
    EXPECT_FALSE(http::TransportError(http::TransportFailure::Canceled, "x").transient());
    EXPECT_FALSE(http::TransportError(http::TransportFailure::Protocol, "x").transient());
    EXPECT_FALSE(http::TransportError(http::TransportFailure::Credentials, "x").transient());
    EXPECT_EQ(std::string(http::TransportFailureName(http::TransportFailure::Credentials)), std::string("credentials"));
}

TEST(Outcome, HttpStatusMapping) {
    using errors::ErrorKind;
    using errors::Outcome;
    EXPECT_EQ(errors::HttpStatusFor(Outcome::Success()), 200);
    EXPECT_EQ(errors::HttpStatusFor(Outcome::NotResponsible()), 401);
    EXPECT_EQ(errors::HttpStatusFor(Outcome::Failure(ErrorKind::Unauthorized, "x")), 401);
    EXPECT_EQ(errors::HttpStatusFor(Outcome::Failure(ErrorKind::Forbidden, "x")), 403);
    EXPECT_EQ(errors::HttpStatusFor(Outcome::Failure(ErrorKind::Transport, "x")), 502);
    EXPECT_EQ(errors::HttpStatusFor(Outcome::Failure(ErrorKind::Decode, "x")), 502);
    EXPECT_EQ(errors::HttpStatusFor(Outcome::Failure(ErrorKind::Misconfigured, "x")), 500);
    EXPECT_EQ(errors::HttpStatusFor(Outcome::Failure(ErrorKind::NotEnabled, "x")), 500);
}

TEST(Outcome, PredicatesAndDescribe) {
    using errors::ErrorKind;
    using errors::Outcome;
    Outcome f = Outcome::Failure(ErrorKind::Forbidden, "scope not granted: write");
    EXPECT_TRUE(f.IsFailure());
    EXPECT_TRUE(f.Is(ErrorKind::Forbidden));
    EXPECT_FALSE(f.Is(ErrorKind::Unauthorized));
    EXPECT_FALSE(Outcome::NotResponsible().Is(ErrorKind::Forbidden));
    EXPECT_EQ(errors::Describe(f), std::string("failure(forbidden): scope not granted: write"));
    EXPECT_EQ(errors::Describe(Outcome::NotResponsible()), std::string("not_responsible"));
    EXPECT_EQ(std::string(errors::ErrorKindName(ErrorKind::Misconfigured)), std::string("misconfigured"));
}
