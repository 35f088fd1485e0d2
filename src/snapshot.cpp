/*
 * testenv - Virtualized Test Environment Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "testenv/snapshot.hpp"
#include "testenv/activation.hpp"
#include "testenv/batch.hpp"
#include "testenv/lifecycle.hpp"
#include "testenv/logger.hpp"
#include <memory>
#include <utility>
#include <vector>

namespace testenv {

namespace {
// Reactivation may target a domain whose deactivation was never accepted;
// the engine refusing to activate an active domain is not a failure.
RetryPolicies undoPolicies() {
    RetryPolicies policies;
    policies.domainRequests = RetryPolicy::Swallow;
    return policies;
}
}

SnapshotTransaction::SnapshotTransaction(Environment& env, const Settings& settings)
    : env_(env), settings_(settings) {
}

void SnapshotTransaction::run(const std::string& name, bool restore) {
    if (!env_.api || !env_.virt || !env_.engine) {
        throw Error("Environment is incomplete, cannot snapshot");
    }

    RollbackStack rollback;
    enter(TransactionPhase::Quiescing);

    try {
        quiesce(rollback);

        LOG_INFO("Creating snapshots '" + name + "'");
        env_.virt->createSnapshots(name);
        enter(TransactionPhase::Captured);
    } catch (...) {
        LOG_ERROR("Snapshot '" + name + "' failed: " + describe(std::current_exception()));
        enter(TransactionPhase::Restoring);
        auto failures = rollback.unwind();
        enter(TransactionPhase::Running);
        if (!failures.empty()) {
            throw RollbackIncomplete(std::current_exception(), std::move(failures));
        }
        throw;
    }

    if (restore) {
        reactivate(rollback, name);
        return;
    }

    rollback.discard();
    LOG_INFO("Snapshot '" + name + "' captured, environment left deactivated");
    enter(TransactionPhase::Running);
}

void SnapshotTransaction::quiesce(RollbackStack& rollback) {
    deactivateStorage(rollback);

    rollback.push([this] { ActivationController(*env_.api, settings_).activateAllHosts(); },
                  "activate hosts");
    ActivationController(*env_.api, settings_).deactivateAllHosts();

    stopEngine(rollback);
    stopHostServices(rollback);
}

// Every undo below is registered before its forward step runs, so a step that
// fails halfway is still reversed. The undos tolerate entities that were never
// touched.
void SnapshotTransaction::deactivateStorage(RollbackStack& rollback) {
    ActivationController controller(*env_.api, settings_);

    for (const auto& dc : env_.api->listDataCenters()) {
        std::vector<StorageDomain> masters;
        std::vector<StorageDomain> others;
        partitionByMaster(env_.api->listStorageDomains(dc.id), masters, others);

        // Undo per group so unwinding brings masters back before the rest
        for (auto* group : {&others, &masters}) {
            if (group->empty()) {
                continue;
            }
            rollback.push([this, domains = *group] {
                              ActivationController(*env_.api, settings_, undoPolicies()).activateStorageDomains(domains);
                          },
                          "activate storage domains of " + dc.name);
            controller.deactivateStorageDomains(*group);
        }
    }
}

void SnapshotTransaction::stopEngine(RollbackStack& rollback) {
    auto engine = env_.engine;
    const auto service = env_.engineService;

    // Unwinds as: restart the service, then wait for its API
    rollback.push([this] { waitForApi(*env_.api, settings_); }, "reconnect management API");
    rollback.push([engine, service] { engine->startService(service); },
                  "start " + service + " on " + engine->name());
    engine->stopService(service);
}

void SnapshotTransaction::stopHostServices(RollbackStack& rollback) {
    // Each job records its own undos; they join the main stack after the
    // batch so the stack is never touched by more than one thread.
    std::vector<std::unique_ptr<RollbackStack>> hostUndos;
    std::vector<Job> jobs;

    for (const auto& host : env_.hosts) {
        hostUndos.push_back(std::make_unique<RollbackStack>());
        RollbackStack* undos = hostUndos.back().get();
        const auto services = env_.hostServices;

        jobs.push_back([host, services, undos] {
            for (const auto& service : services) {
                undos->push([host, service] { host->startService(service); },
                            "start " + service + " on " + host->name());
                host->stopService(service);
            }
        });
    }

    auto result = runBatch(std::move(jobs));
    for (auto& undos : hostUndos) {
        rollback.splice(*undos);
    }
    result.throwIfFailed();
}

void SnapshotTransaction::reactivate(RollbackStack& rollback, const std::string& name) {
    LOG_INFO("Restoring environment after snapshot '" + name + "'");
    enter(TransactionPhase::Restoring);
    auto failures = rollback.unwind();
    enter(TransactionPhase::Running);

    if (!failures.empty()) {
        throw RollbackIncomplete(
            std::make_exception_ptr(Error("Snapshot '" + name + "' captured but the environment was not restored")),
            std::move(failures));
    }
}

void SnapshotTransaction::enter(TransactionPhase phase) {
    LOG_DEBUG(std::string("Snapshot transaction: ") + toString(phase_) + " -> " + toString(phase));
    phase_ = phase;
    if (observer_) {
        observer_(phase);
    }
}

}
