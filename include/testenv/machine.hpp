/*
 * testenv - Virtualized Test Environment Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <string>
#include <vector>

#include "testenv/command.hpp"

namespace testenv {

class Machine {
public:
    virtual ~Machine() = default;

    [[nodiscard]] virtual const std::string& name() const = 0;
    [[nodiscard]] virtual const std::string& distro() const = 0;
    [[nodiscard]] virtual std::vector<std::filesystem::path> deployScripts() const = 0;

    virtual void waitForSsh() = 0;
    virtual void startService(const std::string& unit) = 0;
    virtual void stopService(const std::string& unit) = 0;
    virtual CommandResult runScript(const std::filesystem::path& script) = 0;
    virtual void copyTo(const std::filesystem::path& local, const std::string& remote) = 0;
    virtual void collectArtifacts(const std::filesystem::path& dir) = 0;
};

}
