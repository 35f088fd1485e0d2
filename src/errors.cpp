/*
 * testenv - Virtualized Test Environment Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "testenv/errors.hpp"
#include <exception>

namespace testenv {

ConvergenceTimeout::ConvergenceTimeout(const std::string& subject, std::chrono::milliseconds bound)
    : Error("Timed out after " + std::to_string(bound.count()) + "ms waiting for " + subject),
      subject_(subject), bound_(bound) {
}

std::string describe(const std::exception_ptr& error) {
    if (!error) {
        return "no error";
    }
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown error";
    }
}

}
