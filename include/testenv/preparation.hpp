/*
 * testenv - Virtualized Test Environment Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "testenv/batch.hpp"
#include "testenv/command.hpp"
#include "testenv/prefix.hpp"

namespace testenv {

struct PrepareOptions {
    std::filesystem::path rpmRepo;
    std::filesystem::path reposyncConfig;
    bool skipSync = false;
    std::filesystem::path vdsmDir;
    std::filesystem::path engineDir;
    bool engineBuildGwt = false;
    std::filesystem::path jsonrpcJavaDir;
};

struct BuildSpec {
    std::string name;
    std::string script;
    std::filesystem::path sourceDir;
    std::filesystem::path outputDir;
    std::vector<std::string> dists;
    std::map<std::string, std::string> env;
};

// Combines package directories into a single repository.
class RepoMerger {
public:
    virtual ~RepoMerger() = default;
    virtual void merge(const std::filesystem::path& output, const std::vector<std::filesystem::path>& inputs) = 0;
};

// Links every package into output, first file name wins, then runs createrepo.
class CreaterepoMerger final : public RepoMerger {
public:
    explicit CreaterepoMerger(CommandRunner& runner) : runner_(runner) {}
    void merge(const std::filesystem::path& output, const std::vector<std::filesystem::path>& inputs) override;

private:
    CommandRunner& runner_;
};

// Section names of a reposync yum config whose trailing "-<dist>" matches.
[[nodiscard]] std::vector<std::string> selectRepositories(const std::filesystem::path& yumConfig,
                                                          const std::vector<std::string>& dists);

// Mirrors repos into repoPath under an exclusive lock on repoPath/.lock.
void syncRpmRepository(CommandRunner& runner,
                       const std::filesystem::path& repoPath,
                       const std::filesystem::path& yumConfig,
                       const std::vector<std::string>& repos);

// True when every repo has a non-empty package directory under repoPath.
[[nodiscard]] bool verifyReposync(const std::filesystem::path& repoPath, const std::vector<std::string>& repos);

void buildRpms(CommandRunner& runner, const BuildSpec& spec);

// HEAD of the git checkout at path, or "unknown".
[[nodiscard]] std::string gitRevisionAt(CommandRunner& runner, const std::filesystem::path& path);

// Builds and syncs packages in parallel and merges them into the prefix's
// internal repositories, one per distribution.
class PreparationPipeline final {
public:
    PreparationPipeline(Prefix& prefix, CommandRunner& runner, RepoMerger& merger);

    PreparationPipeline(const PreparationPipeline&) = delete;
    PreparationPipeline& operator=(const PreparationPipeline&) = delete;

    void run(const PrepareOptions& options);

    [[nodiscard]] std::vector<std::string> engineDists() const;
    [[nodiscard]] std::vector<std::string> hostDists() const;

private:
    void createRpmRepository(const std::vector<std::string>& dists,
                             const std::filesystem::path& reposPath,
                             const std::vector<std::string>& repoNames);

    Prefix& prefix_;
    CommandRunner& runner_;
    RepoMerger& merger_;
};

}
