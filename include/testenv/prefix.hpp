/*
 * testenv - Virtualized Test Environment Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <map>
#include <string>
#include <utility>

#include "testenv/command.hpp"
#include "testenv/environment.hpp"
#include "testenv/settings.hpp"

namespace testenv {

// On-disk layout of a prefix directory.
class PrefixPaths {
public:
    explicit PrefixPaths(std::filesystem::path root) : root_(std::move(root)) {}

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }
    [[nodiscard]] std::filesystem::path buildDir(const std::string& name) const { return root_ / "build" / name; }
    [[nodiscard]] std::filesystem::path internalRepoRoot() const { return root_ / "internal_repo"; }
    [[nodiscard]] std::filesystem::path internalRepo(const std::string& dist) const { return internalRepoRoot() / dist; }
    // xunit report of a test scenario run against this prefix
    [[nodiscard]] std::filesystem::path testReport(const std::filesystem::path& scenario) const {
        return root_ / ("nosetests-" + scenario.filename().string() + ".xml");
    }
    [[nodiscard]] std::filesystem::path metadataFile() const { return root_ / "metadata"; }

private:
    std::filesystem::path root_;
};

using Metadata = std::map<std::string, std::string>;

// A provisioned test environment and the operations that move it between
// running, quiesced and stopped.
class Prefix final {
public:
    Prefix(const std::filesystem::path& root, Environment env, Settings settings = Settings::fromEnv());

    Prefix(const Prefix&) = delete;
    Prefix& operator=(const Prefix&) = delete;

    void start();
    void stop();
    void activate();
    void deactivate();

    void createSnapshot(const std::string& name, bool restore = true);
    void revertSnapshot(const std::string& name);

    // Runs every machine's deployment scripts, machines in parallel, with the
    // internal repositories served.
    void deploy();
    // Runs a nose scenario against this prefix and writes its xunit report
    // to paths().testReport(scenario). Returns whether the scenario passed.
    bool runTest(CommandRunner& runner, const std::filesystem::path& scenario);
    void collectArtifacts(const std::filesystem::path& outputDir);

    [[nodiscard]] Metadata& metadata() noexcept { return metadata_; }
    void save() const;
    void load();

    [[nodiscard]] Environment& environment() noexcept { return env_; }
    [[nodiscard]] const PrefixPaths& paths() const noexcept { return paths_; }
    [[nodiscard]] const Settings& settings() const noexcept { return settings_; }

private:
    void deployMachine(Machine& machine);
    void requireVirt() const;

    PrefixPaths paths_;
    Environment env_;
    Settings settings_;
    Metadata metadata_;
};

}
