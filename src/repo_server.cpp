/*
 * testenv - Virtualized Test Environment Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "testenv/repo_server.hpp"
#include "testenv/logger.hpp"
#include <exception>
#include <utility>

namespace testenv {

RepoServerScope::RepoServerScope(std::shared_ptr<RepoServer> server, const std::filesystem::path& repoRoot)
    : server_(std::move(server)) {
    if (!server_) {
        return;
    }
    LOG_DEBUG("Serving repositories from " + repoRoot.string());
    server_->start(repoRoot);
}

RepoServerScope::~RepoServerScope() {
    if (!server_) {
        return;
    }
    try {
        server_->stop();
        LOG_DEBUG("Repository server stopped");
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Failed to stop repository server: ") + e.what());
    }
}

}
