//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/authgate/errors/Outcome.cpp
// Purpose: Outcome naming and HTTP status mapping
//==========================================================================================================

#include "authgate/errors/Outcome.h"

namespace authgate {
namespace errors {

const char* ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotEnabled: return "not_enabled";
        case ErrorKind::Misconfigured: return "misconfigured";
        case ErrorKind::Unauthorized: return "unauthorized";
        case ErrorKind::Forbidden: return "forbidden";
        case ErrorKind::Transport: return "transport";
        case ErrorKind::Decode: return "decode";
    }
    return "unknown";
}

int HttpStatusFor(const Outcome& outcome) {
    switch (outcome.status) {
        case Outcome::Status::Success: return 200;
        case Outcome::Status::NotResponsible: return 401;
        case Outcome::Status::Failure: break;
    }
    switch (outcome.kind) {
        case ErrorKind::Unauthorized: return 401;
        case ErrorKind::Forbidden: return 403;
        case ErrorKind::Transport:
        case ErrorKind::Decode: return 502;
        case ErrorKind::NotEnabled:
        case ErrorKind::Misconfigured: return 500;
    }
    return 500;
}

std::string Describe(const Outcome& outcome) {
    switch (outcome.status) {
        case Outcome::Status::Success: return "success";
        case Outcome::Status::NotResponsible: return "not_responsible";
        case Outcome::Status::Failure: break;
    }
    return std::string("failure(") + ErrorKindName(outcome.kind) + std::string("): ") + outcome.detail;
}

} // namespace errors
} // namespace authgate
