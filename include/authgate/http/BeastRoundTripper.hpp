//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/authgate/http/BeastRoundTripper.hpp
// Purpose: Coroutine-based HTTP/HTTPS client using Boost.Beast (one connection per exchange)
//==========================================================================================================
#pragma once

#include <memory>
#include <string>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ssl/context.hpp>

#include "authgate/http/IRoundTripper.hpp"

namespace authgate::http {

//==========================================================================================================
// BeastRoundTripper
// Purpose: Plain network transport. Resolves, connects, optionally performs a TLS handshake (peer
//          verification, SNI), writes the request with "Connection: close" and reads one response.
//          Socket operations honor the RequestContext deadline and abort promptly on cancellation.
//          Each exchange runs on its own strand. Name lookups run on a thread owned by the transport;
//          destruction waits for a lookup that is still in progress.
//==========================================================================================================
class BeastRoundTripper final : public IRoundTripper {
public:
    //======================================================================================================
    // Options
    // Fields:
    //   connectTimeoutMs: One budget for resolve + connect + TLS handshake, in milliseconds
    //   readTimeoutMs: Write + read timeout in milliseconds
    //   caFile/caPath: Optional CA bundle/path; system defaults are used when both are empty
    //======================================================================================================
    struct Options {
        unsigned int connectTimeoutMs{1000};
        unsigned int readTimeoutMs{5000};
        std::string caFile;
        std::string caPath;
    };

    explicit BeastRoundTripper(const Options& opts);
    ~BeastRoundTripper() override;

    boost::asio::awaitable<Response> RoundTrip(const Url& url, Request request, const RequestContext& ctx) override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace authgate::http
