/*
 * testenv - Virtualized Test Environment Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "testenv/poll.hpp"
#include "testenv/errors.hpp"
#include "testenv/logger.hpp"
#include <thread>

namespace testenv {

void pollUntil(const std::function<bool()>& predicate,
               std::chrono::milliseconds timeout,
               std::chrono::milliseconds interval,
               const std::string& subject) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    LOG_DEBUG("Waiting for " + subject);

    while (true) {
        try {
            if (predicate()) {
                LOG_TRACE("Converged: " + subject);
                return;
            }
        } catch (const RequestError& e) {
            LOG_DEBUG("Request rejected while waiting for " + subject + ": " + e.what());
        }

        if (std::chrono::steady_clock::now() >= deadline) {
            LOG_ERROR("Timed out waiting for " + subject);
            throw ConvergenceTimeout(subject, timeout);
        }
        std::this_thread::sleep_for(interval);
    }
}

}
