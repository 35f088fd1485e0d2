/*
 * testenv - Virtualized Test Environment Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <string>

namespace testenv {

// VM power and disk snapshot control. How VMs are created is not our concern.
class VirtBackend {
public:
    virtual ~VirtBackend() = default;

    virtual void startVms() = 0;
    virtual void stopVms() = 0;
    virtual void createSnapshots(const std::string& name) = 0;
    virtual void revertSnapshots(const std::string& name) = 0;
};

}
