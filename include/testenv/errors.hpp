/*
 * testenv - Virtualized Test Environment Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <stdexcept>
#include <string>

namespace testenv {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A per-entity request refused by the management API. Usually transient.
class RequestError : public Error {
public:
    using Error::Error;
};

// Observed state did not reach the expected value within the polling bound.
class ConvergenceTimeout : public Error {
public:
    ConvergenceTimeout(const std::string& subject, std::chrono::milliseconds bound);

    [[nodiscard]] const std::string& subject() const noexcept { return subject_; }
    [[nodiscard]] std::chrono::milliseconds bound() const noexcept { return bound_; }

private:
    std::string subject_;
    std::chrono::milliseconds bound_;
};

// Failure to launch or complete an external command.
class CommandError : public Error {
public:
    using Error::Error;
};

// Message of an in-flight or captured exception, for logs and summaries.
[[nodiscard]] std::string describe(const std::exception_ptr& error);

}
