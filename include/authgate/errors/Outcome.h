//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/authgate/errors/Outcome.h
// Purpose: Tagged authentication outcome and failure taxonomy shared by authenticators and dispatch
//==========================================================================================================

#pragma once

#include <string>
#include <utility>

namespace authgate {
namespace errors {

// Categorization of authenticator failures.
enum class ErrorKind {
    NotEnabled,     // authenticator administratively disabled
    Misconfigured,  // configuration decode/validation failure
    Unauthorized,   // token present but not active
    Forbidden,      // token active but fails type/audience/issuer/scope policy
    Transport,      // network failure or unexpected status from a remote endpoint
    Decode          // malformed response body
};

//==========================================================================================================
// Outcome
// Purpose: Result of one authenticator invocation.
// Fields:
//   status: Success (session mutated), NotResponsible (try the next authenticator) or Failure.
//   kind/detail: Only meaningful for Failure; detail names the failing check.
//==========================================================================================================
struct Outcome {
    enum class Status {
        Success,
        NotResponsible,
        Failure
    };

    Status status{Status::Success};
    ErrorKind kind{ErrorKind::Transport};
    std::string detail;

    static Outcome Success() { return Outcome{}; }

    static Outcome NotResponsible() {
        Outcome o;
        o.status = Status::NotResponsible;
        return o;
    }

    static Outcome Failure(ErrorKind kind, std::string detail) {
        Outcome o;
        o.status = Status::Failure;
        o.kind = kind;
        o.detail = std::move(detail);
        return o;
    }

    bool IsSuccess() const { return status == Status::Success; }
    bool IsNotResponsible() const { return status == Status::NotResponsible; }
    bool IsFailure() const { return status == Status::Failure; }
    bool Is(ErrorKind k) const { return status == Status::Failure && kind == k; }
};

// Stable lowercase name of an ErrorKind ("forbidden", "transport", ...).
const char* ErrorKindName(ErrorKind kind);

//==========================================================================================================
// HttpStatusFor
// Purpose: Map an outcome to the HTTP status a proxy should answer the rejected request with.
// Returns:
//   200 Success; 401 NotResponsible (no authenticator applied) and Unauthorized; 403 Forbidden;
//   502 Transport/Decode (upstream authentication failure); 500 NotEnabled/Misconfigured.
//==========================================================================================================
int HttpStatusFor(const Outcome& outcome);

// One-line description used in logs, e.g. "failure(forbidden): audience mismatch".
std::string Describe(const Outcome& outcome);

} // namespace errors
} // namespace authgate
