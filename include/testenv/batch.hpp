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
#include <thread>
#include <utility>
#include <vector>

#include "testenv/errors.hpp"

namespace testenv {

// Zero-argument unit of work. Jobs own their captured inputs and share no
// mutable state with their siblings.
using Job = std::function<void()>;

struct JobOutcome {
    bool ok = true;
    std::string error;
    std::exception_ptr exception;
    explicit operator bool() const noexcept { return ok; }
};

// Outcomes are aligned with submission order.
struct BatchResult {
    bool ok = true;
    std::vector<JobOutcome> outcomes;
    explicit operator bool() const noexcept { return ok; }

    [[nodiscard]] std::size_t failureCount() const noexcept;
    // Throws JobFailure carrying every failed outcome.
    void throwIfFailed() const;
};

class JobFailure : public Error {
public:
    using IndexedOutcome = std::pair<std::size_t, JobOutcome>;

    JobFailure(std::vector<IndexedOutcome> failures, std::size_t batchSize);

    [[nodiscard]] const std::vector<IndexedOutcome>& failures() const noexcept { return failures_; }
    [[nodiscard]] std::size_t batchSize() const noexcept { return batchSize_; }

private:
    std::vector<IndexedOutcome> failures_;
    std::size_t batchSize_;
};

// Runs every job of a batch on its own thread.
//
// There is no pool and no back-pressure: a batch of N jobs spawns N threads,
// so callers are responsible for keeping batches small. A failing job never
// cancels its siblings; joinAll() waits for all of them and reports every
// failure.
class Batch final {
public:
    explicit Batch(std::vector<Job> jobs);
    ~Batch();

    Batch(const Batch&) = delete;
    Batch& operator=(const Batch&) = delete;
    Batch(Batch&&) = delete;
    Batch& operator=(Batch&&) = delete;

    void startAll();
    [[nodiscard]] BatchResult joinAll();

    [[nodiscard]] std::size_t size() const noexcept { return jobs_.size(); }
    [[nodiscard]] bool isStarted() const noexcept { return started_; }

private:
    void runJob(std::size_t index) noexcept;
    void joinThreads() noexcept;

    std::vector<Job> jobs_;
    std::vector<JobOutcome> outcomes_;
    std::vector<std::thread> threads_;
    bool started_ = false;
    bool joined_ = false;
};

// Starts every job, waits for all of them and returns their outcomes.
[[nodiscard]] BatchResult runBatch(std::vector<Job> jobs);

}
