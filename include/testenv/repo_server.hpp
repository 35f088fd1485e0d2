/*
 * testenv - Virtualized Test Environment Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <memory>

namespace testenv {

// Serves the prefix's internal repositories to the VMs while they install
// packages. How the repository is exposed is up to the implementation.
class RepoServer {
public:
    virtual ~RepoServer() = default;

    virtual void start(const std::filesystem::path& repoRoot) = 0;
    virtual void stop() = 0;
};

// Keeps a repo server running for the lifetime of the scope. A null server
// makes the scope a no-op.
class RepoServerScope final {
public:
    RepoServerScope(std::shared_ptr<RepoServer> server, const std::filesystem::path& repoRoot);
    ~RepoServerScope();

    RepoServerScope(const RepoServerScope&) = delete;
    RepoServerScope& operator=(const RepoServerScope&) = delete;
    RepoServerScope(RepoServerScope&&) = delete;
    RepoServerScope& operator=(RepoServerScope&&) = delete;

private:
    std::shared_ptr<RepoServer> server_;
};

}
