/*
 * testenv - Virtualized Test Environment Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <functional>
#include <string>

namespace testenv {

// Evaluates predicate until it holds, sleeping interval between attempts.
// Throws ConvergenceTimeout once timeout has elapsed. A RequestError from the
// predicate counts as "not yet"; any other exception propagates.
void pollUntil(const std::function<bool()>& predicate,
               std::chrono::milliseconds timeout,
               std::chrono::milliseconds interval,
               const std::string& subject);

}
