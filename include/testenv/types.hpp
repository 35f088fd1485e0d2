#pragma once
#include <cstdint>
#include <string>

namespace testenv {

// Observed storage domain states as reported by the management API.
enum class DomainState : std::uint8_t { Active, Maintenance, Transitioning };

// Observed host states as reported by the management API.
enum class HostState : std::uint8_t { Up, Maintenance, Transitioning };

// What to do when a per-entity request is rejected transiently.
enum class RetryPolicy : std::uint8_t {
    Propagate,  // rethrow to the caller
    Swallow,    // log and carry on; convergence polling catches up
    Requeue     // report rejection so the caller can try again later
};

// Snapshot transaction phases.
enum class TransactionPhase : std::uint8_t { Running, Quiescing, Captured, Restoring };

inline const char* toString(DomainState state) noexcept {
    switch (state) {
        case DomainState::Active: return "active";
        case DomainState::Maintenance: return "maintenance";
        case DomainState::Transitioning: return "transitioning";
    }
    return "unknown";
}

inline const char* toString(HostState state) noexcept {
    switch (state) {
        case HostState::Up: return "up";
        case HostState::Maintenance: return "maintenance";
        case HostState::Transitioning: return "transitioning";
    }
    return "unknown";
}

inline const char* toString(TransactionPhase phase) noexcept {
    switch (phase) {
        case TransactionPhase::Running: return "running";
        case TransactionPhase::Quiescing: return "quiescing";
        case TransactionPhase::Captured: return "captured";
        case TransactionPhase::Restoring: return "restoring";
    }
    return "unknown";
}

} // namespace testenv
