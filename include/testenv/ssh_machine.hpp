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
#include "testenv/machine.hpp"
#include "testenv/settings.hpp"

namespace testenv {

struct SshTarget {
    std::string name;
    std::string address;
    std::string user = "root";
    std::string distro;
    std::filesystem::path identityFile;
    std::vector<std::filesystem::path> deployScripts;
    std::vector<std::string> artifactPaths;
};

// Machine reached through the ssh and scp clients.
class SshMachine final : public Machine {
public:
    SshMachine(SshTarget target, CommandRunner& runner, const Settings& settings);

    [[nodiscard]] const std::string& name() const override { return target_.name; }
    [[nodiscard]] const std::string& distro() const override { return target_.distro; }
    [[nodiscard]] std::vector<std::filesystem::path> deployScripts() const override { return target_.deployScripts; }

    void waitForSsh() override;
    void startService(const std::string& unit) override;
    void stopService(const std::string& unit) override;
    CommandResult runScript(const std::filesystem::path& script) override;
    void copyTo(const std::filesystem::path& local, const std::string& remote) override;
    void collectArtifacts(const std::filesystem::path& dir) override;

private:
    [[nodiscard]] std::vector<std::string> sshCommand(const std::vector<std::string>& remote) const;
    [[nodiscard]] std::vector<std::string> scpCommand() const;
    [[nodiscard]] std::string destination() const;
    void serviceAction(const std::string& action, const std::string& unit);

    SshTarget target_;
    CommandRunner& runner_;
    Settings settings_;
};

}
