//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_beast_round_tripper.cpp
// Purpose: Beast transport failure classification, deadlines and cancellation against a local server
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <thread>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/http.hpp>

#include "authgate/http/BeastRoundTripper.hpp"
#include "support/MiniHttpServer.hpp"
#include "support/RunSync.hpp"

using namespace authgate;
using authgate::testing::Always;
using authgate::testing::MiniHttpServer;
using authgate::testing::Reply;
using authgate::testing::RunSync;
using http::TransportError;
using http::TransportFailure;
using namespace std::chrono;
namespace bhttp = boost::beast::http;

namespace {

http::BeastRoundTripper::Options fastOptions(unsigned int readMs) {
    http::BeastRoundTripper::Options o;
    o.connectTimeoutMs = 500;
    o.readTimeoutMs = readMs;
    return o;
}

http::Url mustParse(const std::string& s) {
    http::Url u;
    std::string err;
    EXPECT_TRUE(http::ParseAbsoluteUrl(s, u, err)) << err;
    return u;
}

TransportFailure failureOf(http::BeastRoundTripper& rt, const http::Url& url, const RequestContext& ctx) {
    try {
        RunSync(rt.RoundTrip(url, http::Request{bhttp::verb::get, "/", 11}, ctx));
    } catch (const TransportError& e) {
        return e.reason();
    }
    ADD_FAILURE() << "round trip unexpectedly succeeded";
    return TransportFailure::Protocol;
}

} // namespace

TEST(BeastRoundTripper, SendsHostAndBodyAndReturnsResponse) {
    MiniHttpServer srv;
    srv.route("/echo", Always(Reply{201, "{\"ok\":true}"}));
    srv.start();

    http::BeastRoundTripper rt(fastOptions(2000));
    http::Request req{bhttp::verb::post, "/ignored", 11};
    req.set(bhttp::field::content_type, "application/x-www-form-urlencoded");
    req.body() = "a=1&b=2";
    http::Response res = RunSync(rt.RoundTrip(mustParse(srv.url("/echo?x=1")), std::move(req), RequestContext{}));
    EXPECT_EQ(res.result_int(), 201u);
    EXPECT_EQ(res.body(), std::string("{\"ok\":true}"));

    auto reqs = srv.requests("/echo");
    ASSERT_EQ(reqs.size(), 1u);
    EXPECT_EQ(reqs[0].target, std::string("/echo?x=1"));
    EXPECT_EQ(reqs[0].header("host"), std::string("127.0.0.1:") + std::to_string(srv.port()));
    EXPECT_EQ(reqs[0].header("content-length"), std::string("7"));
    EXPECT_EQ(reqs[0].body, std::string("a=1&b=2"));
    srv.stop();
}

TEST(BeastRoundTripper, RefusedConnectionIsTransient) {
    http::BeastRoundTripper rt(fastOptions(1000));
    auto url = mustParse(std::string("http://127.0.0.1:") + std::to_string(MiniHttpServer::UnusedPort()) + std::string("/x"));
    EXPECT_EQ(failureOf(rt, url, RequestContext{}), TransportFailure::Connection);
}

TEST(BeastRoundTripper, DroppedConnectionIsConnectionFailure) {
    MiniHttpServer srv;
    Reply drop;
    drop.dropConnection = true;
    srv.route("/", Always(drop));
    srv.start();
    http::BeastRoundTripper rt(fastOptions(2000));
    EXPECT_EQ(failureOf(rt, mustParse(srv.url("/")), RequestContext{}), TransportFailure::Connection);
    srv.stop();
}

TEST(BeastRoundTripper, SlowServerHitsReadTimeout) {
    MiniHttpServer srv;
    Reply slow{200, "{}"};
    slow.delay = milliseconds(1500);
    srv.route("/", Always(slow));
    srv.start();
    http::BeastRoundTripper rt(fastOptions(200));
    const auto start = steady_clock::now();
    EXPECT_EQ(failureOf(rt, mustParse(srv.url("/")), RequestContext{}), TransportFailure::Timeout);
    EXPECT_LT(steady_clock::now() - start, milliseconds(1200));
    srv.stop();
}

TEST(BeastRoundTripper, DeadlineShorterThanReadTimeoutWins) {
    MiniHttpServer srv;
    Reply slow{200, "{}"};
    slow.delay = milliseconds(1500);
    srv.route("/", Always(slow));
    srv.start();
    http::BeastRoundTripper rt(fastOptions(5000));
    RequestContext ctx;
    ctx.deadline = steady_clock::now() + milliseconds(150);
    const auto start = steady_clock::now();
    EXPECT_EQ(failureOf(rt, mustParse(srv.url("/")), ctx), TransportFailure::Timeout);
    EXPECT_LT(steady_clock::now() - start, milliseconds(1200));

    RequestContext expired;
    expired.deadline = steady_clock::now() - milliseconds(1);
    EXPECT_EQ(failureOf(rt, mustParse(srv.url("/")), expired), TransportFailure::Timeout);
    srv.stop();
}

TEST(BeastRoundTripper, CancellationAbortsInFlightRead) {
    MiniHttpServer srv;
    Reply slow{200, "{}"};
    slow.delay = milliseconds(1500);
    srv.route("/", Always(slow));
    srv.start();
    http::BeastRoundTripper rt(fastOptions(5000));

    CancellationSource cancel;
    RequestContext ctx;
    ctx.cancel = cancel.Token();
    std::thread canceller([&]() {
        std::this_thread::sleep_for(milliseconds(100));
        cancel.Cancel();
    });
    const auto start = steady_clock::now();
    EXPECT_EQ(failureOf(rt, mustParse(srv.url("/")), ctx), TransportFailure::Canceled);
    EXPECT_LT(steady_clock::now() - start, milliseconds(1200));
    canceller.join();

    // Already canceled before the call starts
    EXPECT_EQ(failureOf(rt, mustParse(srv.url("/")), ctx), TransportFailure::Canceled);
    srv.stop();
}

TEST(BeastRoundTripper, StalledTlsHandshakeUsesConnectBudget) {
    // The listener completes TCP connects through its backlog but never speaks TLS
    boost::asio::io_context lctx;
    boost::asio::ip::tcp::acceptor silent{lctx, {boost::asio::ip::make_address("127.0.0.1"), 0}};
    const auto url = mustParse(std::string("https://127.0.0.1:") + std::to_string(silent.local_endpoint().port()) + std::string("/"));

    http::BeastRoundTripper::Options o;
    o.connectTimeoutMs = 300;
    o.readTimeoutMs = 5000;
    http::BeastRoundTripper rt(o);
    auto start = steady_clock::now();
    EXPECT_EQ(failureOf(rt, url, RequestContext{}), TransportFailure::Timeout);
    EXPECT_LT(steady_clock::now() - start, milliseconds(1000));

    // A request deadline shorter than the connect budget bounds the handshake as well
    o.connectTimeoutMs = 5000;
    http::BeastRoundTripper slowConnect(o);
    RequestContext ctx;
    ctx.deadline = steady_clock::now() + milliseconds(200);
    start = steady_clock::now();
    EXPECT_EQ(failureOf(slowConnect, url, ctx), TransportFailure::Timeout);
    EXPECT_LT(steady_clock::now() - start, milliseconds(1000));
}

TEST(BeastRoundTripper, NameLookupIsBoundedByDeadline) {
    http::BeastRoundTripper::Options o;
    o.connectTimeoutMs = 5000;
    o.readTimeoutMs = 5000;
    http::BeastRoundTripper rt(o);
    RequestContext ctx;
    ctx.deadline = steady_clock::now() + milliseconds(200);

    // Depending on the resolver the lookup either stalls (timeout) or fails fast (connection)
    const auto start = steady_clock::now();
    const TransportFailure reason = failureOf(rt, mustParse("http://authgate-lookup.invalid:8080/"), ctx);
    EXPECT_LT(steady_clock::now() - start, milliseconds(1000));
    EXPECT_TRUE(reason == TransportFailure::Timeout || reason == TransportFailure::Connection)
        << http::TransportFailureName(reason);
}
