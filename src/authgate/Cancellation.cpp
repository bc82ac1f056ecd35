//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/authgate/Cancellation.cpp
// Purpose: Cancellation signal implementation
//==========================================================================================================

#include <utility>

#include "authgate/Cancellation.hpp"

namespace authgate {

CancellationRegistration::CancellationRegistration(std::weak_ptr<detail::CancellationState> state, uint64_t id)
    : state(std::move(state)), id(id) {}

CancellationRegistration::CancellationRegistration(CancellationRegistration&& other) noexcept
    : state(std::move(other.state)), id(other.id) {
    other.id = 0;
}

CancellationRegistration& CancellationRegistration::operator=(CancellationRegistration&& other) noexcept {
    if (this != &other) {
        Reset();
        state = std::move(other.state);
        id = other.id;
        other.id = 0;
    }
    return *this;
}

CancellationRegistration::~CancellationRegistration() {
    Reset();
}

void CancellationRegistration::Reset() {
    if (id == 0) {
        return;
    }
    if (auto s = state.lock()) {
        std::lock_guard<std::mutex> lk(s->mtx);
        s->callbacks.erase(id);
    }
    state.reset();
    id = 0;
}

bool CancellationToken::IsCanceled() const {
    if (!state) {
        return false;
    }
    std::lock_guard<std::mutex> lk(state->mtx);
    return state->canceled;
}

CancellationRegistration CancellationToken::Subscribe(std::function<void()> fn) const {
    if (!state) {
        return CancellationRegistration();
    }
    std::lock_guard<std::mutex> lk(state->mtx);
    if (state->canceled) {
        fn();
        return CancellationRegistration();
    }
    uint64_t id = state->nextId++;
    state->callbacks.emplace(id, std::move(fn));
    return CancellationRegistration(state, id);
}

void CancellationSource::Cancel() {
    std::lock_guard<std::mutex> lk(state->mtx);
    if (state->canceled) {
        return;
    }
    state->canceled = true;
    // Run under the lock so a concurrently destroyed registration never races its callback
    for (auto& kv : state->callbacks) {
        if (kv.second) {
            kv.second();
        }
    }
    state->callbacks.clear();
}

std::chrono::steady_clock::time_point RequestContext::ClampedExpiry(std::chrono::milliseconds timeout) const {
    auto expiry = std::chrono::steady_clock::now() + timeout;
    if (deadline && *deadline < expiry) {
        return *deadline;
    }
    return expiry;
}

bool RequestContext::Expired() const {
    return deadline && std::chrono::steady_clock::now() >= *deadline;
}

} // namespace authgate
