/*
 * testenv - Virtualized Test Environment Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "testenv/activation.hpp"
#include "testenv/errors.hpp"
#include "testenv/logger.hpp"
#include "testenv/poll.hpp"
#include <deque>
#include <thread>

namespace testenv {

bool applyRetryPolicy(RetryPolicy policy, const std::function<void()>& call, const std::string& what) {
    if (policy == RetryPolicy::Propagate) {
        call();
        return true;
    }

    try {
        call();
        return true;
    } catch (const RequestError& e) {
        if (policy == RetryPolicy::Requeue) {
            LOG_WARN("Request rejected, will retry: " + what + ": " + e.what());
        } else {
            LOG_DEBUG("Ignoring rejected request: " + what + ": " + e.what());
        }
        return false;
    }
}

void partitionByMaster(const std::vector<StorageDomain>& domains,
                       std::vector<StorageDomain>& masters,
                       std::vector<StorageDomain>& others) {
    for (const auto& domain : domains) {
        (domain.master ? masters : others).push_back(domain);
    }
}

ActivationController::ActivationController(ManagementApi& api, const Settings& settings, RetryPolicies policies)
    : api_(api), settings_(settings), policies_(policies) {
}

void ActivationController::activateStorageDomains(const std::vector<StorageDomain>& domains) {
    for (const auto& domain : domains) {
        LOG_DEBUG("Activating storage domain " + domain.name);
        applyRetryPolicy(policies_.domainRequests,
                         [&] { api_.activateStorageDomain(domain); },
                         "activate storage domain " + domain.name);
    }

    for (const auto& domain : domains) {
        waitForDomain(domain, DomainState::Active);
    }
}

void ActivationController::deactivateStorageDomains(const std::vector<StorageDomain>& domains) {
    for (const auto& domain : domains) {
        LOG_DEBUG("Deactivating storage domain " + domain.name);
        applyRetryPolicy(policies_.domainRequests,
                         [&] { api_.deactivateStorageDomain(domain); },
                         "deactivate storage domain " + domain.name);
    }

    for (const auto& domain : domains) {
        waitForDomain(domain, DomainState::Maintenance);
    }
}

void ActivationController::activateAllStorageDomains() {
    for (const auto& dc : api_.listDataCenters()) {
        std::vector<StorageDomain> masters;
        std::vector<StorageDomain> others;
        partitionByMaster(api_.listStorageDomains(dc.id), masters, others);

        activateStorageDomains(masters);
        activateStorageDomains(others);
    }
    LOG_INFO("Storage domains activated");
}

void ActivationController::deactivateAllStorageDomains() {
    for (const auto& dc : api_.listDataCenters()) {
        std::vector<StorageDomain> masters;
        std::vector<StorageDomain> others;
        partitionByMaster(api_.listStorageDomains(dc.id), masters, others);

        deactivateStorageDomains(others);
        deactivateStorageDomains(masters);
    }
    LOG_INFO("Storage domains in maintenance");
}

void ActivationController::activateAllHosts() {
    std::vector<std::string> names;
    for (const auto& host : api_.listHosts()) {
        names.push_back(host.name);
    }

    for (const auto& name : names) {
        applyRetryPolicy(policies_.hostActivation,
                         [&] { api_.activateHost(name); },
                         "activate host " + name);
    }

    for (const auto& name : names) {
        waitForHost(name, HostState::Up);
    }
    LOG_INFO("Hosts activated");
}

void ActivationController::deactivateAllHosts() {
    std::deque<std::string> pending;
    for (const auto& host : api_.listHosts()) {
        pending.push_back(host.name);
    }

    while (!pending.empty()) {
        std::string name = pending.back();
        pending.pop_back();

        if (applyRetryPolicy(policies_.hostDeactivation,
                             [&] { api_.deactivateHost(name); },
                             "deactivate host " + name)) {
            LOG_INFO("Sent host " + name + " to maintenance");
            continue;
        }

        pending.push_front(name);
        std::this_thread::sleep_for(settings_.pollInterval);
    }

    for (const auto& host : api_.listHosts()) {
        LOG_DEBUG("Waiting for " + host.name + " to go into maintenance");
        waitForHost(host.name, HostState::Maintenance);
    }
}

void ActivationController::waitForDomain(const StorageDomain& domain, DomainState target) {
    pollUntil(
        [&] { return api_.getStorageDomain(domain.dataCenterId, domain.name).state == target; },
        settings_.longTimeout,
        settings_.pollInterval,
        "storage domain " + domain.name + " to become " + toString(target));
}

void ActivationController::waitForHost(const std::string& name, HostState target) {
    pollUntil(
        [&] { return api_.getHost(name).state == target; },
        settings_.shortTimeout,
        settings_.pollInterval,
        "host " + name + " to become " + toString(target));
}

}
