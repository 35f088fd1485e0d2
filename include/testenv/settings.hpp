/*
 * testenv - Virtualized Test Environment Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>

namespace testenv {

struct Settings {
    // Host convergence and other quick transitions
    std::chrono::milliseconds shortTimeout = std::chrono::minutes(3);
    // Storage domain convergence, SSH reachability, API reconnects
    std::chrono::milliseconds longTimeout = std::chrono::minutes(10);
    std::chrono::milliseconds pollInterval = std::chrono::seconds(3);

    // Reads TESTENV_SHORT_TIMEOUT, TESTENV_LONG_TIMEOUT (seconds) and
    // TESTENV_POLL_INTERVAL_MS; unset or invalid values keep the defaults.
    // Timeouts are capped at seven days and the interval at one hour.
    [[nodiscard]] static Settings fromEnv();
};

}
