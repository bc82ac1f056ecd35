//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/authgate/Duration.hpp
// Purpose: Parsing of duration strings such as "500ms", "1.5s" or "2m30s"
//==========================================================================================================
#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace authgate {

//==========================================================================================================
// ParseDuration
// Purpose: Parse a signed sequence of decimal numbers, each with an optional fraction and a unit suffix.
//          Valid units are "ns", "us" (or "µs"), "ms", "s", "m", "h". "0" alone is accepted.
// Returns:
//   The duration in nanoseconds, or std::nullopt when the string is malformed or overflows.
//==========================================================================================================
std::optional<std::chrono::nanoseconds> ParseDuration(const std::string& text);

// Renders a duration with its largest whole unit, for logs ("1500ms", "2s").
std::string FormatDuration(std::chrono::nanoseconds d);

} // namespace authgate
