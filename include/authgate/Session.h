//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/authgate/Session.h
// Purpose: Per-request authentication session and the rule that selected the authenticator chain
//==========================================================================================================
#pragma once

#include <string>
#include <vector>

#include "authgate/JSONValue.h"

namespace authgate {

// Created once per inbound request; mutated only by the authenticator that succeeds.
struct AuthenticationSession {
    std::string subject;
    JSONValue::Object extra;
};

struct RuleHandler {
    std::string handler;      // authenticator identifier
    std::string rawConfig;    // rule-level JSON configuration, may be empty
};

struct Rule {
    std::string id;
    std::vector<RuleHandler> authenticators;
};

} // namespace authgate
