//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/authgate/http/IRoundTripper.hpp
// Purpose: Outbound HTTP exchange interface and its failure type
//==========================================================================================================
#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <boost/asio/awaitable.hpp>

#include "authgate/Cancellation.hpp"
#include "authgate/http/HttpTypes.hpp"

namespace authgate::http {

// Why an exchange produced no response.
enum class TransportFailure {
    Connection,   // resolve/connect/handshake/read/write error
    Timeout,      // per-operation timeout or request deadline
    Canceled,     // inbound request canceled
    Protocol,     // malformed request or URL
    Credentials   // could not obtain the transport's own credentials
};

const char* TransportFailureName(TransportFailure reason);

//==========================================================================================================
// TransportError
// Purpose: Thrown by round trippers when no HTTP response is available. Responses with any status code are
//          returned normally and are never turned into a TransportError.
//==========================================================================================================
class TransportError : public std::runtime_error {
public:
    TransportError(TransportFailure reason, const std::string& what)
        : std::runtime_error(what), failure(reason) {}

    TransportFailure reason() const { return failure; }

    // Connection and timeout failures may succeed on a later attempt.
    bool transient() const {
        return failure == TransportFailure::Connection || failure == TransportFailure::Timeout;
    }

private:
    TransportFailure failure;
};

//==========================================================================================================
// IRoundTripper
// Purpose: Sends one request to an absolute URL and returns the response. Implementations are shared
//          between concurrent requests and must be safe to call from many threads at once. The caller's
//          executor may be run by several threads; implementations serialize their own handlers on a strand.
//==========================================================================================================
class IRoundTripper {
public:
    virtual ~IRoundTripper() = default;

    virtual boost::asio::awaitable<Response> RoundTrip(const Url& url, Request request, const RequestContext& ctx) = 0;
};

using RoundTripperPtr = std::shared_ptr<IRoundTripper>;

} // namespace authgate::http
