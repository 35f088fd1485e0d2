/*
 * testenv - Virtualized Test Environment Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "testenv/lifecycle.hpp"
#include "testenv/activation.hpp"
#include "testenv/errors.hpp"
#include "testenv/logger.hpp"
#include "testenv/poll.hpp"

namespace testenv {

std::vector<std::shared_ptr<Machine>> Environment::machines() const {
    std::vector<std::shared_ptr<Machine>> all;
    if (engine) {
        all.push_back(engine);
    }
    all.insert(all.end(), hosts.begin(), hosts.end());
    return all;
}

void waitForApi(ManagementApi& api, const Settings& settings) {
    pollUntil(
        [&] {
            api.connect();
            return true;
        },
        settings.longTimeout,
        settings.pollInterval,
        "management API");
}

void activateEnvironment(Environment& env, const Settings& settings) {
    if (!env.api) {
        throw Error("Environment has no management API");
    }

    for (const auto& machine : env.machines()) {
        machine->waitForSsh();
    }
    LOG_INFO("Hosts up");

    waitForApi(*env.api, settings);

    ActivationController controller(*env.api, settings);
    controller.activateAllHosts();
    controller.activateAllStorageDomains();
}

void deactivateEnvironment(Environment& env, const Settings& settings) {
    if (!env.api) {
        throw Error("Environment has no management API");
    }

    ActivationController controller(*env.api, settings);
    controller.deactivateAllStorageDomains();
    controller.deactivateAllHosts();
}

}
