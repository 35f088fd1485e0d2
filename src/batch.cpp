/*
 * testenv - Virtualized Test Environment Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "testenv/batch.hpp"
#include "testenv/logger.hpp"

namespace testenv {

namespace {
std::string summarize(const std::vector<JobFailure::IndexedOutcome>& failures, std::size_t batchSize) {
    std::string message = std::to_string(failures.size()) + " of " + std::to_string(batchSize) + " jobs failed";
    for (const auto& failure : failures) {
        message += "; [" + std::to_string(failure.first) + "] " + failure.second.error;
    }
    return message;
}
}

std::size_t BatchResult::failureCount() const noexcept {
    std::size_t count = 0;
    for (const auto& outcome : outcomes) {
        if (!outcome.ok) {
            ++count;
        }
    }
    return count;
}

void BatchResult::throwIfFailed() const {
    if (ok) {
        return;
    }
    std::vector<JobFailure::IndexedOutcome> failures;
    for (std::size_t i = 0; i < outcomes.size(); ++i) {
        if (!outcomes[i].ok) {
            failures.emplace_back(i, outcomes[i]);
        }
    }
    throw JobFailure(std::move(failures), outcomes.size());
}

JobFailure::JobFailure(std::vector<IndexedOutcome> failures, std::size_t batchSize)
    : Error(summarize(failures, batchSize)), failures_(std::move(failures)), batchSize_(batchSize) {
}

Batch::Batch(std::vector<Job> jobs) : jobs_(std::move(jobs)), outcomes_(jobs_.size()) {
}

Batch::~Batch() {
    joinThreads();
}

void Batch::startAll() {
    if (started_) {
        LOG_WARN("Batch already started");
        return;
    }
    started_ = true;

    LOG_DEBUG("Starting batch of " + std::to_string(jobs_.size()) + " jobs");
    threads_.reserve(jobs_.size());

    std::size_t index = 0;
    try {
        for (; index < jobs_.size(); ++index) {
            threads_.emplace_back(&Batch::runJob, this, index);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start job thread " + std::to_string(index) + ": " + e.what());
        for (; index < jobs_.size(); ++index) {
            outcomes_[index].ok = false;
            outcomes_[index].error = std::string("worker not started: ") + e.what();
            outcomes_[index].exception = std::current_exception();
        }
    }
}

BatchResult Batch::joinAll() {
    if (!started_) {
        startAll();
    }
    joinThreads();

    BatchResult result;
    result.outcomes = outcomes_;
    for (std::size_t i = 0; i < result.outcomes.size(); ++i) {
        if (!result.outcomes[i].ok) {
            result.ok = false;
            LOG_ERROR("Job " + std::to_string(i) + " failed: " + result.outcomes[i].error);
        }
    }

    if (result.ok) {
        LOG_DEBUG("Batch of " + std::to_string(jobs_.size()) + " jobs completed");
    } else {
        LOG_WARN(std::to_string(result.failureCount()) + " of " + std::to_string(jobs_.size()) + " jobs failed");
    }
    return result;
}

void Batch::runJob(std::size_t index) noexcept {
    setThreadName(jobThreadName(index));
    LOG_TRACE("Job started");

    JobOutcome& outcome = outcomes_[index];
    try {
        jobs_[index]();
    } catch (const std::exception& e) {
        outcome.ok = false;
        outcome.error = e.what();
        outcome.exception = std::current_exception();
    } catch (...) {
        outcome.ok = false;
        outcome.error = "unknown error";
        outcome.exception = std::current_exception();
    }

    LOG_TRACE(outcome.ok ? "Job finished" : "Job failed: " + outcome.error);
    clearThreadName();
}

void Batch::joinThreads() noexcept {
    if (joined_) {
        return;
    }
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();
    joined_ = started_;
}

BatchResult runBatch(std::vector<Job> jobs) {
    Batch batch(std::move(jobs));
    batch.startAll();
    return batch.joinAll();
}

}
