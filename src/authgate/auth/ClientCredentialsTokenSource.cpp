//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/authgate/auth/ClientCredentialsTokenSource.cpp
// Purpose: OAuth2 client-credentials grant with cached, single-flight token refresh
//==========================================================================================================

#include <algorithm>
#include <chrono>
#include <cmath>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/http.hpp>

#include "logging/Logger.h"
#include "authgate/JSONValue.h"
#include "authgate/auth/ClientCredentialsTokenSource.hpp"

using namespace std::chrono;

namespace authgate::auth {
namespace net = boost::asio;
namespace bhttp = boost::beast::http;
using http::TransportError;
using http::TransportFailure;

namespace {
    constexpr seconds kDefaultExpiresIn{3600};

    std::string joinScopes(const std::vector<std::string>& scopes) {
        std::string out;
        for (const auto& s : scopes) {
            if (!out.empty()) { out += ' '; }
            out += s;
        }
        return out;
    }

    bool parseTokenResponse(const http::Response& res, std::string& token, seconds& expiresIn, std::string& error) {
        if (res.result_int() != 200) {
            error = std::string("token endpoint returned status ") + std::to_string(res.result_int());
            return false;
        }
        JSONValue doc;
        std::string parseError;
        if (!ParseJSON(res.body(), doc, parseError)) {
            error = std::string("token endpoint returned malformed JSON: ") + parseError;
            return false;
        }
        if (!doc.isObject()) {
            error = "token endpoint response is not a JSON object";
            return false;
        }
        const auto& obj = std::get<JSONValue::Object>(doc.value);
        auto it = obj.find("access_token");
        if (it == obj.end() || !it->second || !it->second->isString() || std::get<std::string>(it->second->value).empty()) {
            error = "token endpoint response has no access_token";
            return false;
        }
        token = std::get<std::string>(it->second->value);

        expiresIn = kDefaultExpiresIn;
        auto exp = obj.find("expires_in");
        if (exp != obj.end() && exp->second) {
            const auto& v = exp->second->value;
            if (std::holds_alternative<int64_t>(v) && std::get<int64_t>(v) > 0) {
                expiresIn = seconds(std::get<int64_t>(v));
            } else if (std::holds_alternative<double>(v) && std::get<double>(v) >= 1.0) {
                expiresIn = seconds(static_cast<int64_t>(std::floor(std::get<double>(v))));
            }
        }
        return true;
    }
}

struct ClientCredentialsTokenSource::Waiter {
    explicit Waiter(net::any_io_executor ex) : ex(ex), timer(ex) {}

    // Only ever invoked on ex, the waiting coroutine's strand. Moving the expiry into the past also completes a wait that has not started yet.
    void wake() { timer.expires_at(net::steady_timer::time_point::min()); }

    net::any_io_executor ex;
    net::steady_timer timer;
};

ClientCredentialsTokenSource::ClientCredentialsTokenSource(ClientCredentials credentials, http::RoundTripperPtr transport)
    : credentials(std::move(credentials)), transport(std::move(transport)) {}

bool ClientCredentialsTokenSource::hasValidTokenLocked(steady_clock::time_point now) const {
    return !cachedAccessToken.empty() && (now + credentials.refreshSkew < tokenExpiry);
}

uint64_t ClientCredentialsTokenSource::FetchCount() const {
    std::lock_guard<std::mutex> lk(mtx);
    return fetches;
}

std::vector<http::HeaderKV> ClientCredentialsTokenSource::headers() const {
    std::lock_guard<std::mutex> lk(mtx);
    std::vector<http::HeaderKV> out;
    if (!cachedAccessToken.empty()) {
        out.push_back({std::string("Authorization"), std::string("Bearer ") + cachedAccessToken});
    }
    return out;
}

net::awaitable<void> ClientCredentialsTokenSource::ensureReady(const RequestContext& ctx) {
    while (true) {
        bool fetcher = false;
        uint64_t observed = 0;
        {
            std::lock_guard<std::mutex> lk(mtx);
            if (hasValidTokenLocked(steady_clock::now())) {
                co_return;
            }
            if (!fetching) {
                fetching = true;
                ++fetches;
                fetcher = true;
            } else {
                observed = generation;
            }
        }

        if (fetcher) {
            co_await coFetch(ctx);
            co_return;
        }

        std::optional<TransportError> failure;
        // The wait and every wake-up of it run on one strand
        auto strand = net::make_strand(co_await net::this_coro::executor);
        switch (co_await net::co_spawn(strand, coWaitForRefresh(observed, ctx, failure), net::use_awaitable)) {
            case WaitResult::Refreshed:
                co_return;
            case WaitResult::Failed:
                throw *failure;
            case WaitResult::Abandoned:
                // The fetching request was canceled or ran out of time; try again on our own budget
                break;
            case WaitResult::Canceled:
                throw TransportError(TransportFailure::Canceled, "request canceled while waiting for access token");
            case WaitResult::TimedOut:
                throw TransportError(TransportFailure::Timeout, "request deadline reached while waiting for access token");
        }
    }
}

net::awaitable<ClientCredentialsTokenSource::WaitResult> ClientCredentialsTokenSource::coWaitForRefresh(
    uint64_t observedGeneration, const RequestContext& ctx, std::optional<TransportError>& failure) {
    auto ex = co_await net::this_coro::executor;
    auto waiter = std::make_shared<Waiter>(ex);
    waiter->timer.expires_at(ctx.deadline ? *ctx.deadline : net::steady_timer::time_point::max());

    bool pending = false;
    {
        std::lock_guard<std::mutex> lk(mtx);
        if (generation == observedGeneration) {
            waiters.push_back(waiter);
            pending = true;
        }
    }

    if (pending) {
        std::weak_ptr<Waiter> weak = waiter;
        CancellationRegistration reg = ctx.cancel.Subscribe([weak, ex]() {
            net::post(ex, [weak]() {
                if (auto w = weak.lock()) {
                    w->wake();
                }
            });
        });
        boost::system::error_code ec;
        co_await waiter->timer.async_wait(net::redirect_error(net::use_awaitable, ec));
        reg.Reset();
    }

    std::lock_guard<std::mutex> lk(mtx);
    if (generation != observedGeneration) {
        if (lastAbandoned) {
            co_return WaitResult::Abandoned;
        }
        if (lastFailure) {
            failure = lastFailure;
            co_return WaitResult::Failed;
        }
        co_return WaitResult::Refreshed;
    }
    waiters.erase(std::remove(waiters.begin(), waiters.end(), waiter), waiters.end());
    if (ctx.cancel.IsCanceled()) {
        co_return WaitResult::Canceled;
    }
    co_return WaitResult::TimedOut;
}

net::awaitable<void> ClientCredentialsTokenSource::coFetch(const RequestContext& ctx) {
    // Releases the waiters even when the coroutine is torn down mid-flight
    struct FetchGuard {
        ClientCredentialsTokenSource* self;
        bool done{false};
        ~FetchGuard() {
            if (!done) {
                self->publishFailure(TransportError(TransportFailure::Canceled, "token request abandoned"));
            }
        }
    };
    FetchGuard guard{this};

    std::vector<std::pair<std::string, std::string>> form;
    form.emplace_back("grant_type", "client_credentials");
    if (!credentials.clientId.empty()) { form.emplace_back("client_id", credentials.clientId); }
    if (!credentials.clientSecret.empty()) { form.emplace_back("client_secret", credentials.clientSecret); }
    if (!credentials.scopes.empty()) { form.emplace_back("scope", joinScopes(credentials.scopes)); }

    http::Request req{bhttp::verb::post, credentials.tokenUrl.target, 11};
    req.set(bhttp::field::content_type, "application/x-www-form-urlencoded");
    req.set(bhttp::field::accept, "application/json");
    req.body() = http::EncodeForm(form);

    const std::string endpoint = credentials.tokenUrl.ToString();
    std::optional<TransportError> failure;
    std::string token;
    seconds expiresIn = kDefaultExpiresIn;
    try {
        http::Response res = co_await transport->RoundTrip(credentials.tokenUrl, std::move(req), ctx);
        std::string error;
        if (!parseTokenResponse(res, token, expiresIn, error)) {
            failure.emplace(TransportFailure::Credentials, std::string("OAuth2: ") + error);
        }
    } catch (const TransportError& e) {
        failure.emplace(e);
    }

    guard.done = true;
    if (failure) {
        LOG_ERROR("OAuth2: token request to {} failed: {}", endpoint, failure->what());
        publishFailure(*failure);
        throw *failure;
    }
    LOG_INFO("OAuth2: obtained access token for client {} from {} (expires in {}s)",
             credentials.clientId, endpoint, expiresIn.count());
    publishToken(token, expiresIn);
}

void ClientCredentialsTokenSource::publishToken(const std::string& token, seconds expiresIn) {
    std::vector<std::shared_ptr<Waiter>> woken;
    {
        std::lock_guard<std::mutex> lk(mtx);
        cachedAccessToken = token;
        tokenExpiry = steady_clock::now() + expiresIn;
        lastFailure.reset();
        lastAbandoned = false;
        fetching = false;
        ++generation;
        woken.swap(waiters);
    }
    wakeWaiters(std::move(woken));
}

void ClientCredentialsTokenSource::publishFailure(const TransportError& failure) {
    std::vector<std::shared_ptr<Waiter>> woken;
    {
        std::lock_guard<std::mutex> lk(mtx);
        lastFailure = failure;
        // Cancellation or deadline of the fetching request says nothing about the token endpoint
        lastAbandoned = failure.reason() == TransportFailure::Canceled || failure.reason() == TransportFailure::Timeout;
        fetching = false;
        ++generation;
        woken.swap(waiters);
    }
    wakeWaiters(std::move(woken));
}

void ClientCredentialsTokenSource::wakeWaiters(std::vector<std::shared_ptr<Waiter>> woken) {
    for (auto& w : woken) {
        net::post(w->ex, [w]() { w->wake(); });
    }
}

} // namespace authgate::auth
