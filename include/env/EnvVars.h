//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/env/EnvVars.h
// Purpose: Helpers to read AUTHGATE_* environment variables safely.
//==========================================================================================================
#pragma once
#include <cstdlib>
#include <string>

//==========================================================================================================
// GetEnvOrDefault
// Purpose: Returns the value of the environment variable or a provided default when unset.
// Args:
//   name: C-string name of the environment variable. When null or empty, returns defaultValue.
//   defaultValue: Value to return when the variable is not set.
// Returns:
//   std::string with the environment value (when set) or defaultValue otherwise.
//==========================================================================================================
inline std::string GetEnvOrDefault(const char* name, const std::string& defaultValue) {
    if (name == nullptr || *name == '\0') {
        return defaultValue;
    }
    const char* v = std::getenv(name);
    return v ? std::string(v) : defaultValue;
}

//==========================================================================================================
// GetEnvFlag
// Purpose: Interprets "1", "true" and "TRUE" as enabled; anything else (or unset) falls back to defaultValue
//          only when the variable is absent.
//==========================================================================================================
inline bool GetEnvFlag(const char* name, bool defaultValue) {
    const std::string v = GetEnvOrDefault(name, defaultValue ? "1" : "0");
    return (v == "1" || v == "true" || v == "TRUE");
}
