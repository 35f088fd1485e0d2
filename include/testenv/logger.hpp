/*
 * testenv - Virtualized Test Environment Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>

namespace testenv {

enum class LogLevel : uint8_t { ERROR = 0, WARN = 1, INFO = 2, DEBUG = 3, TRACE = 4 };

// Case-insensitive level name ("warning" is accepted for WARN). Unknown names
// yield fallback.
[[nodiscard]] LogLevel parseLogLevel(const std::string& name, LogLevel fallback) noexcept;
[[nodiscard]] const char* toString(LogLevel level) noexcept;

// Process-wide leveled log. Lines go to stderr unless redirected, one
// "[time] [LEVEL] [thread] message" line per call.
class Logger {
public:
    static void setLevel(LogLevel level) noexcept;
    // Level from TESTENV_LOG_LEVEL, INFO when unset or unknown
    static void initFromEnv() noexcept;
    [[nodiscard]] static LogLevel level() noexcept;
    [[nodiscard]] static bool enabled(LogLevel level) noexcept;

    // Pass nullptr to go back to stderr. The stream must outlive its use.
    static void setStream(std::ostream* stream) noexcept;

    static void log(LogLevel level, const std::string& message) noexcept;
};

// Names shown in the thread column; unnamed threads show their id
void setThreadName(const std::string& name);
void clearThreadName();
std::string jobThreadName(std::size_t index);

}

#define LOG_ERROR(msg) ::testenv::Logger::log(::testenv::LogLevel::ERROR, msg)
#define LOG_WARN(msg) ::testenv::Logger::log(::testenv::LogLevel::WARN, msg)
#define LOG_INFO(msg) ::testenv::Logger::log(::testenv::LogLevel::INFO, msg)
#define LOG_DEBUG(msg) ::testenv::Logger::log(::testenv::LogLevel::DEBUG, msg)
#define LOG_TRACE(msg) ::testenv::Logger::log(::testenv::LogLevel::TRACE, msg)
