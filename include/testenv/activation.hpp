/*
 * testenv - Virtualized Test Environment Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <functional>
#include <string>
#include <vector>

#include "testenv/management_api.hpp"
#include "testenv/settings.hpp"
#include "testenv/types.hpp"

namespace testenv {

// Per-operation handling of transient request rejections.
struct RetryPolicies {
    RetryPolicy domainRequests = RetryPolicy::Propagate;
    RetryPolicy hostActivation = RetryPolicy::Swallow;
    RetryPolicy hostDeactivation = RetryPolicy::Requeue;
};

// Issues call under policy. Returns false when the call was rejected with a
// RequestError that the policy does not propagate.
bool applyRetryPolicy(RetryPolicy policy, const std::function<void()>& call, const std::string& what);

// Drives storage domains and hosts between their active and maintenance
// states and waits for the API to report convergence.
//
// Storage domain operations act on one group at a time. Callers sequence the
// groups: masters before non-masters when activating, the reverse when
// deactivating, so a master is active whenever any sibling is.
class ActivationController final {
public:
    ActivationController(ManagementApi& api, const Settings& settings, RetryPolicies policies = {});

    ActivationController(const ActivationController&) = delete;
    ActivationController& operator=(const ActivationController&) = delete;

    void activateStorageDomains(const std::vector<StorageDomain>& domains);
    void deactivateStorageDomains(const std::vector<StorageDomain>& domains);

    // Every data center, masters first.
    void activateAllStorageDomains();
    // Every data center, non-masters first.
    void deactivateAllStorageDomains();

    void activateAllHosts();
    void deactivateAllHosts();

    [[nodiscard]] const RetryPolicies& policies() const noexcept { return policies_; }

private:
    void waitForDomain(const StorageDomain& domain, DomainState target);
    void waitForHost(const std::string& name, HostState target);

    ManagementApi& api_;
    Settings settings_;
    RetryPolicies policies_;
};

// Splits a data center's domains into its master group and the rest.
void partitionByMaster(const std::vector<StorageDomain>& domains,
                       std::vector<StorageDomain>& masters,
                       std::vector<StorageDomain>& others);

}
