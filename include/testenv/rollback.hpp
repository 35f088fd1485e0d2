/*
 * testenv - Virtualized Test Environment Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <exception>
#include <functional>
#include <string>
#include <vector>

#include "testenv/errors.hpp"

namespace testenv {

using UndoAction = std::function<void()>;

// A compensating action that itself failed while unwinding.
struct UndoFailure {
    std::string label;
    std::string error;
    std::exception_ptr exception;
};

// LIFO registry of compensating actions for a multi-step operation.
//
// Push an undo right after each forward step succeeds. On failure call
// unwind(), which runs every undo exactly once, last registered first, and
// keeps going past undos that throw. On success call discard(). If neither
// happens the destructor unwinds, so an early return or an exception never
// leaves partial work behind.
//
// A stack belongs to one operation and must not be shared between threads.
class RollbackStack final {
public:
    RollbackStack() = default;
    ~RollbackStack();

    RollbackStack(const RollbackStack&) = delete;
    RollbackStack& operator=(const RollbackStack&) = delete;
    RollbackStack(RollbackStack&&) = delete;
    RollbackStack& operator=(RollbackStack&&) = delete;

    void push(UndoAction undo, std::string label = {});

    // Moves all of other's undos on top of this stack, keeping their order.
    void splice(RollbackStack& other);

    std::vector<UndoFailure> unwind();
    void discard() noexcept;

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

private:
    struct Entry {
        UndoAction action;
        std::string label;
    };

    std::vector<Entry> entries_;
};

// The original failure of an operation whose rollback also failed.
class RollbackIncomplete : public Error {
public:
    RollbackIncomplete(std::exception_ptr cause, std::vector<UndoFailure> undoFailures);

    [[nodiscard]] const std::exception_ptr& cause() const noexcept { return cause_; }
    [[nodiscard]] const std::string& causeMessage() const noexcept { return causeMessage_; }
    [[nodiscard]] const std::vector<UndoFailure>& undoFailures() const noexcept { return undoFailures_; }

private:
    std::exception_ptr cause_;
    std::string causeMessage_;
    std::vector<UndoFailure> undoFailures_;
};

}
