/*
 * testenv - Virtualized Test Environment Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "testenv/logger.hpp"
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <thread>
#include <unordered_map>

namespace testenv {

namespace {

struct LogState {
    std::mutex mutex;
    LogLevel level = LogLevel::INFO;
    bool configured = false;
    std::ostream* stream = nullptr;
    std::unordered_map<std::thread::id, std::string> threadNames;
};

LogState& state() {
    static LogState instance;
    return instance;
}

LogLevel envLevel() noexcept {
    const char* value = std::getenv("TESTENV_LOG_LEVEL");
    return value ? parseLogLevel(value, LogLevel::INFO) : LogLevel::INFO;
}

std::string threadLabel(const LogState& s) {
    auto it = s.threadNames.find(std::this_thread::get_id());
    if (it != s.threadNames.end()) {
        return it->second;
    }
    std::ostringstream id;
    id << "T" << std::this_thread::get_id();
    return id.str();
}

}

LogLevel parseLogLevel(const std::string& name, LogLevel fallback) noexcept {
    std::string lower;
    for (char c : name) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    if (lower == "error") return LogLevel::ERROR;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "trace") return LogLevel::TRACE;
    return fallback;
}

const char* toString(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN: return "WARN";
        case LogLevel::INFO: return "INFO";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::TRACE: return "TRACE";
    }
    return "?";
}

void Logger::setLevel(LogLevel level) noexcept {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.level = level;
    s.configured = true;
}

void Logger::initFromEnv() noexcept {
    setLevel(envLevel());
}

LogLevel Logger::level() noexcept {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (!s.configured) {
        s.level = envLevel();
        s.configured = true;
    }
    return s.level;
}

bool Logger::enabled(LogLevel level) noexcept {
    return static_cast<uint8_t>(level) <= static_cast<uint8_t>(Logger::level());
}

void Logger::setStream(std::ostream* stream) noexcept {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.stream = stream;
}

void Logger::log(LogLevel level, const std::string& message) noexcept {
    if (!enabled(level)) {
        return;
    }

    try {
        const auto now = std::chrono::system_clock::now();
        const auto seconds = std::chrono::system_clock::to_time_t(now);
        const auto millis =
            std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
        std::tm local{};
        localtime_r(&seconds, &local);

        auto& s = state();
        std::lock_guard<std::mutex> lock(s.mutex);

        std::ostringstream line;
        line << "[" << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << "." << std::setfill('0') << std::setw(3)
             << millis << "] [" << std::left << std::setfill(' ') << std::setw(5) << toString(level) << "] ["
             << threadLabel(s) << "] " << message << '\n';

        // stdout is reserved for command output
        std::ostream& out = s.stream ? *s.stream : std::cerr;
        out << line.str() << std::flush;
    } catch (const std::exception&) {
        // A log line that cannot be formatted is dropped
    }
}

void setThreadName(const std::string& name) {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.threadNames[std::this_thread::get_id()] = name;
}

void clearThreadName() {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.threadNames.erase(std::this_thread::get_id());
}

std::string jobThreadName(std::size_t index) {
    return "Job-" + std::to_string(index);
}

}
