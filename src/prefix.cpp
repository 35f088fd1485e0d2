/*
 * testenv - Virtualized Test Environment Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "testenv/prefix.hpp"
#include "testenv/batch.hpp"
#include "testenv/errors.hpp"
#include "testenv/lifecycle.hpp"
#include "testenv/logger.hpp"
#include "testenv/snapshot.hpp"
#include <fstream>

namespace testenv {

Prefix::Prefix(const std::filesystem::path& root, Environment env, Settings settings)
    : paths_(root), env_(std::move(env)), settings_(settings) {
    LOG_DEBUG("Prefix at " + paths_.root().string() + " with " +
              std::to_string(env_.hosts.size()) + " hosts");
}

void Prefix::start() {
    requireVirt();
    LOG_INFO("Starting prefix " + paths_.root().string());
    env_.virt->startVms();
    activate();
}

void Prefix::stop() {
    requireVirt();
    LOG_INFO("Stopping prefix " + paths_.root().string());
    deactivate();
    env_.virt->stopVms();
}

void Prefix::activate() {
    activateEnvironment(env_, settings_);
}

void Prefix::deactivate() {
    deactivateEnvironment(env_, settings_);
}

void Prefix::createSnapshot(const std::string& name, bool restore) {
    SnapshotTransaction transaction(env_, settings_);
    transaction.run(name, restore);
}

void Prefix::revertSnapshot(const std::string& name) {
    requireVirt();
    LOG_INFO("Reverting to snapshot '" + name + "'");
    env_.virt->revertSnapshots(name);
    activate();
}

void Prefix::deploy() {
    RepoServerScope served(env_.repoServer, paths_.internalRepoRoot());

    std::vector<Job> jobs;
    for (const auto& machine : env_.machines()) {
        jobs.push_back([this, machine] { deployMachine(*machine); });
    }
    runBatch(std::move(jobs)).throwIfFailed();
    LOG_INFO("Deployment complete");
}

bool Prefix::runTest(CommandRunner& runner, const std::filesystem::path& scenario) {
    const auto root = std::filesystem::absolute(paths_.root());
    const auto report = std::filesystem::absolute(paths_.testReport(scenario));

    CommandOptions options;
    options.env["TESTENV_PREFIX"] = root.string();

    RepoServerScope served(env_.repoServer, paths_.internalRepoRoot());
    LOG_INFO("Running test scenario " + scenario.string());
    auto result = runner.run({"nosetests", "-v", scenario.string(), "--with-xunit", "--xunit-file=" + report.string()},
                             options);
    if (!result) {
        LOG_ERROR("Test scenario " + scenario.string() + " failed with status " + std::to_string(result.status));
        LOG_DEBUG(result.out);
        LOG_DEBUG(result.err);
        return false;
    }
    LOG_INFO("Test scenario " + scenario.string() + " passed, report in " + report.string());
    return true;
}

void Prefix::deployMachine(Machine& machine) {
    machine.waitForSsh();
    for (const auto& script : machine.deployScripts()) {
        auto result = machine.runScript(script);
        if (!result) {
            throw Error(script.string() + " failed with status " + std::to_string(result.status) +
                        " on " + machine.name());
        }
    }
}

void Prefix::collectArtifacts(const std::filesystem::path& outputDir) {
    std::filesystem::create_directories(outputDir);

    std::vector<Job> jobs;
    for (const auto& machine : env_.machines()) {
        auto dir = outputDir / machine->name();
        jobs.push_back([machine, dir] {
            std::filesystem::create_directory(dir);
            machine->collectArtifacts(dir);
        });
    }
    runBatch(std::move(jobs)).throwIfFailed();
}

void Prefix::save() const {
    std::filesystem::create_directories(paths_.root());

    auto path = paths_.metadataFile();
    auto tmp = path;
    tmp += ".tmp";
    {
        std::ofstream file(tmp, std::ios::trunc);
        if (!file) {
            throw Error("Cannot write " + tmp.string());
        }
        for (const auto& kv : metadata_) {
            file << kv.first << "=" << kv.second << "\n";
        }
        if (!file) {
            throw Error("Failed writing " + tmp.string());
        }
    }
    std::filesystem::rename(tmp, path);
    LOG_DEBUG("Saved metadata to " + path.string());
}

void Prefix::load() {
    metadata_.clear();
    std::ifstream file(paths_.metadataFile());
    if (!file) {
        return;
    }
    std::string line;
    while (std::getline(file, line)) {
        auto eq = line.find('=');
        if (eq == std::string::npos || eq == 0) {
            continue;
        }
        metadata_[line.substr(0, eq)] = line.substr(eq + 1);
    }
}

void Prefix::requireVirt() const {
    if (!env_.virt) {
        throw Error("Prefix has no virt backend");
    }
}

}
