/*
 * testenv - Virtualized Test Environment Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "testenv/rollback.hpp"
#include "testenv/logger.hpp"
#include <utility>

namespace testenv {

namespace {
std::string summarize(const std::string& cause, const std::vector<UndoFailure>& failures) {
    std::string message = cause + " (rollback incomplete: " + std::to_string(failures.size()) + " undo step";
    message += failures.size() == 1 ? " failed" : "s failed";
    for (const auto& failure : failures) {
        message += "; " + (failure.label.empty() ? std::string("<unnamed>") : failure.label) + ": " + failure.error;
    }
    return message + ")";
}
}

RollbackStack::~RollbackStack() {
    if (entries_.empty()) {
        return;
    }
    LOG_WARN("Rollback stack left scope with " + std::to_string(entries_.size()) + " pending undo steps, unwinding");
    try {
        auto failures = unwind();
        if (!failures.empty()) {
            LOG_ERROR(std::to_string(failures.size()) + " undo steps failed during scope exit");
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Unwind on scope exit aborted: " + std::string(e.what()));
    }
}

void RollbackStack::push(UndoAction undo, std::string label) {
    if (!undo) {
        return;
    }
    LOG_TRACE("Registered undo: " + label);
    entries_.push_back(Entry{std::move(undo), std::move(label)});
}

void RollbackStack::splice(RollbackStack& other) {
    if (&other == this) {
        return;
    }
    entries_.reserve(entries_.size() + other.entries_.size());
    for (auto& entry : other.entries_) {
        entries_.push_back(std::move(entry));
    }
    other.entries_.clear();
}

std::vector<UndoFailure> RollbackStack::unwind() {
    std::vector<UndoFailure> failures;
    std::vector<Entry> entries;
    entries.swap(entries_);

    if (!entries.empty()) {
        LOG_INFO("Rolling back " + std::to_string(entries.size()) + " steps");
    }

    for (auto it = entries.rbegin(); it != entries.rend(); ++it) {
        LOG_DEBUG("Undo: " + it->label);
        try {
            it->action();
        } catch (const std::exception& e) {
            LOG_ERROR("Undo step '" + it->label + "' failed: " + e.what());
            failures.push_back(UndoFailure{it->label, e.what(), std::current_exception()});
        } catch (...) {
            LOG_ERROR("Undo step '" + it->label + "' failed with unknown error");
            failures.push_back(UndoFailure{it->label, "unknown error", std::current_exception()});
        }
    }
    return failures;
}

void RollbackStack::discard() noexcept {
    if (!entries_.empty()) {
        LOG_DEBUG("Discarding " + std::to_string(entries_.size()) + " undo steps");
    }
    entries_.clear();
}

RollbackIncomplete::RollbackIncomplete(std::exception_ptr cause, std::vector<UndoFailure> undoFailures)
    : Error(summarize(describe(cause), undoFailures)),
      cause_(std::move(cause)),
      causeMessage_(describe(cause_)),
      undoFailures_(std::move(undoFailures)) {
}

}
