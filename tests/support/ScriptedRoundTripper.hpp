//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/support/ScriptedRoundTripper.hpp
// Purpose: Round tripper test double replaying a fixed script of failures and responses
//==========================================================================================================
#pragma once

#include <algorithm>
#include <atomic>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio/awaitable.hpp>
#include <boost/beast/http.hpp>

#include "authgate/http/IRoundTripper.hpp"

namespace authgate::testing {

class ScriptedRoundTripper : public http::IRoundTripper {
public:
    struct Step {
        std::optional<http::TransportFailure> failure;
        unsigned int status{200};
        std::string body;
    };

    explicit ScriptedRoundTripper(std::vector<Step> steps) : steps(std::move(steps)) {}

    boost::asio::awaitable<http::Response> RoundTrip(const http::Url& url, http::Request request,
                                                     const RequestContext&) override {
        Step step;
        {
            std::lock_guard<std::mutex> lk(mtx);
            step = steps[std::min<std::size_t>(calls, steps.size() - 1)];
            ++calls;
            seen.push_back(std::move(request));
            urls.push_back(url.ToString());
        }
        if (step.failure) {
            throw http::TransportError(*step.failure, "scripted failure");
        }
        http::Response res{static_cast<boost::beast::http::status>(step.status), 11};
        res.body() = step.body;
        co_return res;
    }

    std::size_t Calls() const {
        std::lock_guard<std::mutex> lk(mtx);
        return calls;
    }

    std::vector<http::Request> Requests() const {
        std::lock_guard<std::mutex> lk(mtx);
        return seen;
    }

    std::vector<std::string> Urls() const {
        std::lock_guard<std::mutex> lk(mtx);
        return urls;
    }

private:
    mutable std::mutex mtx;
    std::vector<Step> steps;
    std::size_t calls{0};
    std::vector<http::Request> seen;
    std::vector<std::string> urls;
};

} // namespace authgate::testing
