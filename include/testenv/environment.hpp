/*
 * testenv - Virtualized Test Environment Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <memory>
#include <string>
#include <vector>

#include "testenv/machine.hpp"
#include "testenv/management_api.hpp"
#include "testenv/repo_server.hpp"
#include "testenv/virt.hpp"

namespace testenv {

// The live environment of a prefix. Passed explicitly to every operation
// that touches it.
struct Environment {
    std::shared_ptr<Machine> engine;
    std::vector<std::shared_ptr<Machine>> hosts;
    std::shared_ptr<ManagementApi> api;
    std::shared_ptr<VirtBackend> virt;
    // Optional; runs around deploy and test runs when set
    std::shared_ptr<RepoServer> repoServer;

    std::string engineService = "ovirt-engine";
    std::vector<std::string> hostServices = {"vdsmd", "supervdsmd"};

    // Engine first, then hosts
    [[nodiscard]] std::vector<std::shared_ptr<Machine>> machines() const;
};

}
