/*
 * testenv - Virtualized Test Environment Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "testenv/settings.hpp"
#include "testenv/logger.hpp"
#include <cstdlib>
#include <string>

namespace testenv {

namespace {
constexpr long long kMaxTimeoutSeconds = 7 * 24 * 60 * 60;
constexpr long long kMaxPollIntervalMs = 60 * 60 * 1000;

long long env_count(const char* name, long long defv, long long maxv) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    try {
        long long parsed = std::stoll(val);
        if (parsed <= 0) {
            LOG_WARN(std::string("Ignoring non-positive ") + name + "=" + val);
            return defv;
        }
        if (parsed > maxv) {
            LOG_WARN(std::string("Clamping ") + name + "=" + val + " to " + std::to_string(maxv));
            return maxv;
        }
        return parsed;
    } catch (const std::exception&) {
        LOG_WARN(std::string("Ignoring invalid ") + name + "=" + val);
        return defv;
    }
}
}

Settings Settings::fromEnv() {
    Settings settings;
    settings.shortTimeout = std::chrono::seconds(
        env_count("TESTENV_SHORT_TIMEOUT", std::chrono::duration_cast<std::chrono::seconds>(settings.shortTimeout).count(),
                  kMaxTimeoutSeconds));
    settings.longTimeout = std::chrono::seconds(
        env_count("TESTENV_LONG_TIMEOUT", std::chrono::duration_cast<std::chrono::seconds>(settings.longTimeout).count(),
                  kMaxTimeoutSeconds));
    settings.pollInterval = std::chrono::milliseconds(
        env_count("TESTENV_POLL_INTERVAL_MS", settings.pollInterval.count(), kMaxPollIntervalMs));

    LOG_DEBUG("Settings: short=" + std::to_string(settings.shortTimeout.count()) +
              "ms long=" + std::to_string(settings.longTimeout.count()) +
              "ms interval=" + std::to_string(settings.pollInterval.count()) + "ms");
    return settings;
}

}
