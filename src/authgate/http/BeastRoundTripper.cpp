//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/authgate/http/BeastRoundTripper.cpp
// Purpose: HTTP/HTTPS exchange over Boost.Beast with per-operation timeouts and cancellation
//==========================================================================================================

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/http.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include "logging/Logger.h"
#include "authgate/http/BeastRoundTripper.hpp"

namespace authgate::http {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace beast = boost::beast;
namespace bhttp = boost::beast::http;
using tcp = net::ip::tcp;

const char* TransportFailureName(TransportFailure reason) {
    switch (reason) {
        case TransportFailure::Connection: return "connection";
        case TransportFailure::Timeout: return "timeout";
        case TransportFailure::Canceled: return "canceled";
        case TransportFailure::Protocol: return "protocol";
        case TransportFailure::Credentials: return "credentials";
    }
    return "unknown";
}

namespace {
    using Clock = std::chrono::steady_clock;

    // Per-exchange state shared with the cancellation callback through a weak_ptr. All members are
    // touched only on the exchange's strand.
    template <class Stream>
    struct Call {
        net::steady_timer wake;   // parks the exchange while a name lookup is outstanding
        Stream stream;

        template <class... Args>
        explicit Call(net::any_io_executor ex, Args&&... args)
            : wake(ex), stream(ex, std::forward<Args>(args)...) {}

        void cancel() {
            wake.cancel();
            beast::get_lowest_layer(stream).cancel();
        }
    };

    using PlainCall = Call<beast::tcp_stream>;
    using TlsCall = Call<beast::ssl_stream<beast::tcp_stream>>;

    // Name lookup handed from the resolver thread to the exchange. Once the exchange stops waiting,
    // waiter is cleared and a late result is dropped.
    struct Lookup {
        std::mutex mtx;
        bool finished{false};
        std::optional<net::any_io_executor> waiter;
        boost::system::error_code ec;
        tcp::resolver::results_type results;
    };

    struct AbandonLookup {
        std::shared_ptr<Lookup> lookup;
        ~AbandonLookup() {
            std::lock_guard<std::mutex> lock(lookup->mtx);
            lookup->waiter.reset();
        }
    };

    net::awaitable<void> coHandshake(beast::tcp_stream&, const Url&, Clock::time_point) {
        co_return;
    }

    net::awaitable<void> coHandshake(beast::ssl_stream<beast::tcp_stream>& stream, const Url& url,
                                     Clock::time_point expiry) {
        if (!::SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
            throw TransportError(TransportFailure::Connection, "HTTPS: failed to set SNI hostname");
        }
        (void)::SSL_set1_host(stream.native_handle(), url.host.c_str());
        beast::get_lowest_layer(stream).expires_at(expiry);
        co_await stream.async_handshake(ssl::stream_base::client, net::use_awaitable);
    }
}

class BeastRoundTripper::Impl {
public:
    BeastRoundTripper::Options opts;
    ssl::context sslCtx{ssl::context::tls_client};
    bool caInitOk{true};

    // getaddrinfo cannot be interrupted, so lookups run here and never hold the caller's executor
    net::io_context resolverIoc;
    net::executor_work_guard<net::io_context::executor_type> resolverWork{net::make_work_guard(resolverIoc)};
    std::thread resolverThread;

    explicit Impl(const BeastRoundTripper::Options& o) : opts(o) {
        ::SSL_CTX_set_min_proto_version(sslCtx.native_handle(), TLS1_2_VERSION);
        ::ERR_clear_error();
        const bool userProvidedCA = !opts.caFile.empty() || !opts.caPath.empty();
        if (userProvidedCA) {
            try {
                if (!opts.caFile.empty()) { sslCtx.load_verify_file(opts.caFile); }
                if (!opts.caPath.empty()) { sslCtx.add_verify_path(opts.caPath); }
            } catch (const std::exception& e) {
                LOG_ERROR("HTTPS: failed to load user-provided CA file/path: {}", e.what());
                caInitOk = false;
            }
        } else {
            try {
                sslCtx.set_default_verify_paths();
            } catch (const std::exception& e) {
                LOG_DEBUG("HTTPS: set_default_verify_paths failed: {}", e.what());
            }
        }
        sslCtx.set_verify_mode(ssl::verify_peer);
        resolverThread = std::thread([this]() { resolverIoc.run(); });
    }

    ~Impl() {
        resolverWork.reset();
        resolverIoc.stop();
        if (resolverThread.joinable()) {
            resolverThread.join();
        }
    }

    // Resolves on the resolver thread and waits on the strand until the result arrives, the expiry
    // passes or the request is canceled.
    template <class CallT>
    net::awaitable<tcp::resolver::results_type> coResolve(std::shared_ptr<CallT> call, const Url& url,
                                                          Clock::time_point expiry, const RequestContext& ctx) {
        auto lookup = std::make_shared<Lookup>();
        lookup->waiter = co_await net::this_coro::executor;
        AbandonLookup abandonOnExit{lookup};
        std::weak_ptr<CallT> weak = call;

        call->wake.expires_at(expiry);
        auto resolver = std::make_shared<tcp::resolver>(resolverIoc);
        resolver->async_resolve(url.host, url.port,
            [lookup, resolver, weak](const boost::system::error_code& ec, tcp::resolver::results_type results) {
                std::lock_guard<std::mutex> lock(lookup->mtx);
                lookup->finished = true;
                lookup->ec = ec;
                lookup->results = std::move(results);
                if (lookup->waiter) {
                    net::post(*lookup->waiter, [weak]() {
                        if (auto c = weak.lock()) {
                            c->wake.cancel();
                        }
                    });
                }
            });

        boost::system::error_code waitEc;
        co_await call->wake.async_wait(net::redirect_error(net::use_awaitable, waitEc));

        boost::system::error_code lookupEc;
        tcp::resolver::results_type results;
        {
            std::lock_guard<std::mutex> lock(lookup->mtx);
            if (!lookup->finished) {
                lookupEc = ctx.cancel.IsCanceled() ? boost::system::error_code(net::error::operation_aborted)
                                                   : boost::system::error_code(beast::error::timeout);
            } else {
                lookupEc = lookup->ec;
                results = lookup->results;
            }
        }
        if (lookupEc) {
            throw boost::system::system_error(lookupEc);
        }
        co_return results;
    }

    template <class CallT>
    net::awaitable<Response> coExchange(std::shared_ptr<CallT> call, const Url& url, Request& req, const RequestContext& ctx) {
        // Runs on the exchange's strand; the cancellation callback posts back onto it
        auto ex = co_await net::this_coro::executor;
        std::weak_ptr<CallT> weak = call;
        CancellationRegistration reg = ctx.cancel.Subscribe([weak, ex]() {
            net::post(ex, [weak]() {
                if (auto c = weak.lock()) {
                    c->cancel();
                }
            });
        });

        // Resolve, connect and handshake share one budget
        const auto connectExpiry = ctx.ClampedExpiry(std::chrono::milliseconds(opts.connectTimeoutMs));
        auto results = co_await coResolve(call, url, connectExpiry, ctx);
        auto& lowest = beast::get_lowest_layer(call->stream);
        lowest.expires_at(connectExpiry);
        co_await lowest.async_connect(results, net::use_awaitable);
        co_await coHandshake(call->stream, url, connectExpiry);

        lowest.expires_at(ctx.ClampedExpiry(std::chrono::milliseconds(opts.readTimeoutMs)));
        co_await bhttp::async_write(call->stream, req, net::use_awaitable);
        beast::flat_buffer buffer;
        Response res;
        co_await bhttp::async_read(call->stream, buffer, res, net::use_awaitable);

        boost::system::error_code ec;
        lowest.socket().shutdown(tcp::socket::shutdown_both, ec);
        co_return res;
    }
};

BeastRoundTripper::BeastRoundTripper(const Options& opts)
    : pImpl(std::make_unique<Impl>(opts)) {}

BeastRoundTripper::~BeastRoundTripper() = default;

net::awaitable<Response> BeastRoundTripper::RoundTrip(const Url& url, Request request, const RequestContext& ctx) {
    if (ctx.cancel.IsCanceled()) {
        throw TransportError(TransportFailure::Canceled, "request canceled");
    }
    if (ctx.Expired()) {
        throw TransportError(TransportFailure::Timeout, "request deadline exceeded");
    }
    if (url.scheme == std::string("https") && !pImpl->caInitOk) {
        throw TransportError(TransportFailure::Protocol, "HTTPS: CA initialization failed (bad caFile/caPath)");
    }

    request.target(url.target);
    request.set(bhttp::field::host, url.HostHeader());
    request.set(bhttp::field::connection, "close");
    request.keep_alive(false);
    request.prepare_payload();

    // One strand per exchange keeps socket work and cancellation serialized on multi-threaded executors
    auto strand = net::make_strand(co_await net::this_coro::executor);
    bool failed = false;
    boost::system::error_code failure;
    std::string failureWhat;
    try {
        if (url.scheme == std::string("https")) {
            auto call = std::make_shared<TlsCall>(strand, pImpl->sslCtx);
            co_return co_await net::co_spawn(strand, pImpl->coExchange(call, url, request, ctx), net::use_awaitable);
        }
        auto call = std::make_shared<PlainCall>(strand);
        co_return co_await net::co_spawn(strand, pImpl->coExchange(call, url, request, ctx), net::use_awaitable);
    } catch (const boost::system::system_error& e) {
        failed = true;
        failure = e.code();
        failureWhat = e.what();
    }

    if (failed && ctx.cancel.IsCanceled()) {
        throw TransportError(TransportFailure::Canceled, "request canceled");
    }
    if (failure == beast::error::timeout) {
        throw TransportError(TransportFailure::Timeout, std::string("HTTP ") + url.ToString() + std::string(" timed out"));
    }
    throw TransportError(TransportFailure::Connection, std::string("HTTP ") + url.ToString() + std::string(" failed: ") + failureWhat);
}

} // namespace authgate::http
