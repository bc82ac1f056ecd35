//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/logging/Logger.h
// Purpose: Process-wide logger with level filtering, optional file sink and {}-style formatting
//==========================================================================================================
#pragma once

#include <atomic>
#include <string>
#include <fmt/format.h>

namespace authgate {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3
};

//==========================================================================================================
// Logger
// Purpose: Static sink shared by the whole library. Lines look like
//            2025-01-31T12:00:00.123 [WARN] ResilientRoundTripper.cpp:58: message
// Environment:
//   AUTHGATE_LOG_LEVEL: initial level (debug|info|warn|error, default info)
//   AUTHGATE_LOG_COLOR: colorize the level label (default on)
//   AUTHGATE_LOG_STDERR: write console output to stderr instead of stdout
//==========================================================================================================
class Logger {
public:
    // Case-insensitive; "warning" is accepted. Unknown names map to Info.
    static LogLevel levelFromString(const std::string& name);
    static const char* levelName(LogLevel level);

    static void setLogLevel(LogLevel level) { sLogLevel.store(level, std::memory_order_relaxed); }
    static LogLevel logLevel() { return sLogLevel.load(std::memory_order_relaxed); }
    static bool enabled(LogLevel level) { return level >= logLevel(); }

    // Appends to filePath in addition to the console. Returns false when the file cannot be opened;
    // an empty path closes the current file.
    static bool setLogFile(const std::string& filePath);

    template <typename... Args>
    static void logf(LogLevel level, const char* file, unsigned int line, const char* fmt, Args&&... args) {
        std::string msg;
        try {
            msg = fmt::vformat(fmt, fmt::make_format_args(args...));
        } catch (const fmt::format_error& e) {
            msg = std::string("bad log format \"") + fmt + std::string("\": ") + e.what();
        }
        write(level, file, line, msg);
    }

    static void write(LogLevel level, const char* file, unsigned int line, const std::string& msg);

private:
    static std::atomic<LogLevel> sLogLevel;
};

} // namespace authgate

#define AUTHGATE_LOG_AT(lvl, fmt, ...) \
    if (::authgate::Logger::enabled(lvl)) ::authgate::Logger::logf(lvl, __FILE__, __LINE__, fmt, ##__VA_ARGS__)

#define LOG_DEBUG(fmt, ...) AUTHGATE_LOG_AT(::authgate::LogLevel::Debug, fmt, ##__VA_ARGS__)
#define LOG_INFO(fmt, ...)  AUTHGATE_LOG_AT(::authgate::LogLevel::Info, fmt, ##__VA_ARGS__)
#define LOG_WARN(fmt, ...)  AUTHGATE_LOG_AT(::authgate::LogLevel::Warn, fmt, ##__VA_ARGS__)
#define LOG_ERROR(fmt, ...) AUTHGATE_LOG_AT(::authgate::LogLevel::Error, fmt, ##__VA_ARGS__)
