/*
 * testenv - Virtualized Test Environment Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <string>
#include <vector>

#include "testenv/types.hpp"

namespace testenv {

struct DataCenter {
    std::string id;
    std::string name;
};

struct StorageDomain {
    std::string id;
    std::string name;
    std::string dataCenterId;
    bool master = false;
    DomainState state = DomainState::Active;
};

struct Host {
    std::string id;
    std::string name;
    HostState state = HostState::Up;
};

// Remote management API of the engine. Any call may throw RequestError when
// the engine refuses it; callers decide whether that is fatal.
class ManagementApi {
public:
    virtual ~ManagementApi() = default;

    // Single attempt to (re)establish the session.
    virtual void connect() = 0;

    virtual std::vector<DataCenter> listDataCenters() = 0;
    virtual std::vector<StorageDomain> listStorageDomains(const std::string& dataCenterId) = 0;
    virtual StorageDomain getStorageDomain(const std::string& dataCenterId, const std::string& name) = 0;
    virtual void activateStorageDomain(const StorageDomain& domain) = 0;
    virtual void deactivateStorageDomain(const StorageDomain& domain) = 0;

    virtual std::vector<Host> listHosts() = 0;
    virtual Host getHost(const std::string& name) = 0;
    virtual void activateHost(const std::string& name) = 0;
    virtual void deactivateHost(const std::string& name) = 0;
};

}
