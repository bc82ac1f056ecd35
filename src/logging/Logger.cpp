//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/logging/Logger.cpp
// Purpose: Logger sinks and level parsing
//==========================================================================================================

#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iostream>
#include <mutex>
#include <string>

#include "env/EnvVars.h"
#include "logging/Logger.h"

namespace authgate {

namespace {
    std::mutex& sinkMutex() {
        static std::mutex m;
        return m;
    }

    std::ofstream& logFile() {
        static std::ofstream f;
        return f;
    }

    const char* baseName(const char* path) {
        const char* base = path;
        for (const char* p = path; *p != '\0'; ++p) {
            if (*p == '/' || *p == '\\') {
                base = p + 1;
            }
        }
        return base;
    }

    std::string timestamp() {
        const auto now = std::chrono::system_clock::now();
        const std::time_t secs = std::chrono::system_clock::to_time_t(now);
        const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
        std::tm tm{};
        ::localtime_r(&secs, &tm);
        return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}", tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                           tm.tm_hour, tm.tm_min, tm.tm_sec, millis);
    }

    const char* labelColor(LogLevel level) {
        switch (level) {
            case LogLevel::Error: return "\033[38;5;88m";
            case LogLevel::Warn: return "\033[33m";
            default: return "\033[35m";
        }
    }
}

std::atomic<LogLevel> Logger::sLogLevel{Logger::levelFromString(GetEnvOrDefault("AUTHGATE_LOG_LEVEL", "info"))};

LogLevel Logger::levelFromString(const std::string& name) {
    std::string s;
    for (char c : name) {
        s.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (s == "debug") return LogLevel::Debug;
    if (s == "warn" || s == "warning") return LogLevel::Warn;
    if (s == "error") return LogLevel::Error;
    return LogLevel::Info;
}

const char* Logger::levelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

bool Logger::setLogFile(const std::string& filePath) {
    std::lock_guard<std::mutex> lk(sinkMutex());
    auto& f = logFile();
    if (f.is_open()) {
        f.close();
    }
    if (filePath.empty()) {
        return true;
    }
    f.open(filePath, std::ios::out | std::ios::app);
    if (!f.is_open()) {
        return false;
    }
    f << "=== log opened at " << timestamp() << " ===\n";
    f.flush();
    return true;
}

void Logger::write(LogLevel level, const char* file, unsigned int line, const std::string& msg) {
    static const bool color = GetEnvFlag("AUTHGATE_LOG_COLOR", true);
    static const bool toStderr = GetEnvFlag("AUTHGATE_LOG_STDERR", false);

    const std::string stamp = timestamp();
    const std::string where = fmt::format("{}:{}: {}\n", baseName(file), line, msg);
    const char* name = levelName(level);

    std::lock_guard<std::mutex> lk(sinkMutex());
    std::ostream& console = toStderr ? std::cerr : std::cout;
    if (color) {
        console << stamp << " [" << labelColor(level) << name << "\033[0m] " << where;
    } else {
        console << stamp << " [" << name << "] " << where;
    }
    console.flush();

    auto& f = logFile();
    if (f.is_open()) {
        f << stamp << " [" << name << "] " << where;
        f.flush();
    }
}

} // namespace authgate
