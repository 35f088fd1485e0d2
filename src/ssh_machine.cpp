/*
 * testenv - Virtualized Test Environment Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "testenv/ssh_machine.hpp"
#include "testenv/errors.hpp"
#include "testenv/logger.hpp"
#include "testenv/poll.hpp"
#include <utility>

namespace testenv {

namespace {
const std::vector<std::string> kSshOptions = {
    "-o", "StrictHostKeyChecking=no",
    "-o", "UserKnownHostsFile=/dev/null",
    "-o", "BatchMode=yes",
    "-o", "ConnectTimeout=10",
    "-o", "LogLevel=ERROR",
};
}

SshMachine::SshMachine(SshTarget target, CommandRunner& runner, const Settings& settings)
    : target_(std::move(target)), runner_(runner), settings_(settings) {
    if (target_.address.empty()) {
        target_.address = target_.name;
    }
}

void SshMachine::waitForSsh() {
    pollUntil(
        [this] { return runner_.run(sshCommand({"true"})).ok(); },
        settings_.longTimeout,
        settings_.pollInterval,
        "ssh on " + target_.name);
    LOG_DEBUG("ssh ready on " + target_.name);
}

void SshMachine::startService(const std::string& unit) {
    serviceAction("start", unit);
}

void SshMachine::stopService(const std::string& unit) {
    serviceAction("stop", unit);
}

CommandResult SshMachine::runScript(const std::filesystem::path& script) {
    LOG_DEBUG("Running " + script.string() + " on " + target_.name);
    CommandOptions options;
    options.stdinFile = script;
    return runner_.run(sshCommand({"bash", "-s"}), options);
}

void SshMachine::copyTo(const std::filesystem::path& local, const std::string& remote) {
    auto argv = scpCommand();
    argv.push_back(local.string());
    argv.push_back(destination() + ":" + remote);

    auto result = runner_.run(argv);
    if (!result) {
        throw CommandError("Copying " + local.string() + " to " + target_.name + ":" + remote +
                           " failed (" + std::to_string(result.status) + "): " + result.err);
    }
}

void SshMachine::collectArtifacts(const std::filesystem::path& dir) {
    for (const auto& path : target_.artifactPaths) {
        auto argv = scpCommand();
        argv.push_back("-r");
        argv.push_back(destination() + ":" + path);
        argv.push_back(dir.string());

        auto result = runner_.run(argv);
        if (!result) {
            // Missing logs are common on half-deployed machines
            LOG_WARN("Could not collect " + path + " from " + target_.name + ": " + result.err);
        }
    }
}

std::vector<std::string> SshMachine::sshCommand(const std::vector<std::string>& remote) const {
    std::vector<std::string> argv = {"ssh"};
    argv.insert(argv.end(), kSshOptions.begin(), kSshOptions.end());
    if (!target_.identityFile.empty()) {
        argv.push_back("-i");
        argv.push_back(target_.identityFile.string());
    }
    argv.push_back(destination());
    argv.insert(argv.end(), remote.begin(), remote.end());
    return argv;
}

std::vector<std::string> SshMachine::scpCommand() const {
    std::vector<std::string> argv = {"scp"};
    argv.insert(argv.end(), kSshOptions.begin(), kSshOptions.end());
    if (!target_.identityFile.empty()) {
        argv.push_back("-i");
        argv.push_back(target_.identityFile.string());
    }
    return argv;
}

std::string SshMachine::destination() const {
    return target_.user.empty() ? target_.address : target_.user + "@" + target_.address;
}

void SshMachine::serviceAction(const std::string& action, const std::string& unit) {
    LOG_INFO("systemctl " + action + " " + unit + " on " + target_.name);
    auto result = runner_.run(sshCommand({"systemctl", action, unit}));
    if (!result) {
        throw CommandError("systemctl " + action + " " + unit + " on " + target_.name +
                           " failed (" + std::to_string(result.status) + "): " + result.err);
    }
}

}
