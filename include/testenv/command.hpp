/*
 * testenv - Virtualized Test Environment Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace testenv {

struct CommandOptions {
    std::filesystem::path cwd;
    // Added to (or replacing entries of) the parent environment
    std::map<std::string, std::string> env;
    // Fed to the child's stdin; /dev/null when empty
    std::filesystem::path stdinFile;
};

struct CommandResult {
    int status = -1;
    std::string out;
    std::string err;
    [[nodiscard]] bool ok() const noexcept { return status == 0; }
    explicit operator bool() const noexcept { return ok(); }
};

class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    // Runs argv to completion. Throws CommandError only when the command
    // cannot be launched; a non-zero exit is reported through the result.
    virtual CommandResult run(const std::vector<std::string>& argv, const CommandOptions& options = {}) = 0;
};

// fork/exec based runner capturing stdout and stderr.
class ProcessRunner final : public CommandRunner {
public:
    CommandResult run(const std::vector<std::string>& argv, const CommandOptions& options = {}) override;
};

[[nodiscard]] std::string formatCommand(const std::vector<std::string>& argv);

}
