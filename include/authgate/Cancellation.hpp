//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/authgate/Cancellation.hpp
// Purpose: Cross-thread cancellation signal and per-request context (cancellation + deadline)
//==========================================================================================================
#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace authgate {

namespace detail {
struct CancellationState {
    std::mutex mtx;
    bool canceled{false};
    uint64_t nextId{1};
    std::unordered_map<uint64_t, std::function<void()>> callbacks;
};
} // namespace detail

//==========================================================================================================
// CancellationRegistration
// Purpose: RAII handle for a callback registered on a CancellationToken. Destroying it unregisters the
//          callback; once the destructor returns the callback is guaranteed not to be running.
//==========================================================================================================
class CancellationRegistration {
public:
    CancellationRegistration() = default;
    CancellationRegistration(std::weak_ptr<detail::CancellationState> state, uint64_t id);
    CancellationRegistration(CancellationRegistration&& other) noexcept;
    CancellationRegistration& operator=(CancellationRegistration&& other) noexcept;
    CancellationRegistration(const CancellationRegistration&) = delete;
    CancellationRegistration& operator=(const CancellationRegistration&) = delete;
    ~CancellationRegistration();

    void Reset();

private:
    std::weak_ptr<detail::CancellationState> state;
    uint64_t id{0};
};

//==========================================================================================================
// CancellationToken
// Purpose: Read side of a cancellation signal. A default-constructed token is never canceled.
//==========================================================================================================
class CancellationToken {
public:
    CancellationToken() = default;
    explicit CancellationToken(std::shared_ptr<detail::CancellationState> state) : state(std::move(state)) {}

    bool IsCanceled() const;

    // Registers fn to run once on cancellation. When the token is already canceled fn runs immediately on
    // the calling thread. Callbacks run with the token's lock held and must not touch the token again.
    [[nodiscard]] CancellationRegistration Subscribe(std::function<void()> fn) const;

private:
    std::shared_ptr<detail::CancellationState> state;
};

//==========================================================================================================
// CancellationSource
// Purpose: Write side owned by the party that controls the inbound request (server, test, ...).
//==========================================================================================================
class CancellationSource {
public:
    CancellationSource() : state(std::make_shared<detail::CancellationState>()) {}

    CancellationToken Token() const { return CancellationToken(state); }

    // Idempotent. Runs every registered callback on the calling thread.
    void Cancel();

    bool IsCanceled() const { return Token().IsCanceled(); }

private:
    std::shared_ptr<detail::CancellationState> state;
};

//==========================================================================================================
// RequestContext
// Purpose: Bounds outbound work done on behalf of one inbound request.
// Fields:
//   cancel: Aborts socket operations, retry sleeps and token waits when signalled.
//   deadline: Optional absolute deadline that clamps every socket timeout.
//==========================================================================================================
struct RequestContext {
    CancellationToken cancel;
    std::optional<std::chrono::steady_clock::time_point> deadline;

    // min(now + timeout, deadline)
    std::chrono::steady_clock::time_point ClampedExpiry(std::chrono::milliseconds timeout) const;

    bool Expired() const;
};

} // namespace authgate
