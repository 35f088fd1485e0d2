/*
 * testenv - Virtualized Test Environment Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <functional>
#include <string>
#include <utility>

#include "testenv/environment.hpp"
#include "testenv/rollback.hpp"
#include "testenv/settings.hpp"
#include "testenv/types.hpp"

namespace testenv {

// Quiesces the environment, captures a disk snapshot, and reverses the
// quiesce steps when anything fails or when restoration is requested.
//
//   Running -> Quiescing -> Captured -> Running     (success)
//   Running -> Quiescing -> Restoring -> Running    (failure, or restore)
//
// A failure is rethrown unchanged after a clean rollback. If any undo step
// also fails, RollbackIncomplete is thrown carrying the original failure.
class SnapshotTransaction final {
public:
    using PhaseObserver = std::function<void(TransactionPhase)>;

    SnapshotTransaction(Environment& env, const Settings& settings);

    SnapshotTransaction(const SnapshotTransaction&) = delete;
    SnapshotTransaction& operator=(const SnapshotTransaction&) = delete;

    void run(const std::string& name, bool restore);

    [[nodiscard]] TransactionPhase phase() const noexcept { return phase_; }
    void setObserver(PhaseObserver observer) { observer_ = std::move(observer); }

private:
    void quiesce(RollbackStack& rollback);
    void deactivateStorage(RollbackStack& rollback);
    void stopEngine(RollbackStack& rollback);
    void stopHostServices(RollbackStack& rollback);
    void reactivate(RollbackStack& rollback, const std::string& name);
    void enter(TransactionPhase phase);

    Environment& env_;
    Settings settings_;
    TransactionPhase phase_ = TransactionPhase::Running;
    PhaseObserver observer_;
};

}
