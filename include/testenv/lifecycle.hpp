/*
 * testenv - Virtualized Test Environment Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include "testenv/environment.hpp"
#include "testenv/settings.hpp"

namespace testenv {

// Polls ManagementApi::connect() until it succeeds, within the long bound.
void waitForApi(ManagementApi& api, const Settings& settings);

// Waits for SSH on every machine, then activates hosts, then storage domains.
void activateEnvironment(Environment& env, const Settings& settings);

// Puts storage domains, then hosts, into maintenance.
void deactivateEnvironment(Environment& env, const Settings& settings);

}
