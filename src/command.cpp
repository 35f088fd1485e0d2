/*
 * testenv - Virtualized Test Environment Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "testenv/command.hpp"
#include "testenv/errors.hpp"
#include "testenv/logger.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace testenv {

namespace {

struct Pipe {
    int fds[2] = {-1, -1};
    ~Pipe() {
        closeRead();
        closeWrite();
    }
    void closeRead() noexcept {
        if (fds[0] >= 0) {
            ::close(fds[0]);
            fds[0] = -1;
        }
    }
    void closeWrite() noexcept {
        if (fds[1] >= 0) {
            ::close(fds[1]);
            fds[1] = -1;
        }
    }
};

// Owns a forked child until it has been waited for. A child still owned at
// scope exit is killed and reaped so no zombie outlives the call.
struct Child {
    pid_t pid = -1;
    ~Child() {
        if (pid <= 0) {
            return;
        }
        ::kill(pid, SIGKILL);
        while (::waitpid(pid, nullptr, 0) < 0 && errno == EINTR) {
        }
    }
    int wait() {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0) {
            if (errno != EINTR) {
                throw CommandError(std::string("waitpid failed: ") + std::strerror(errno));
            }
        }
        pid = -1;
        return status;
    }
};

std::vector<std::string> buildEnvironment(const std::map<std::string, std::string>& overrides) {
    std::vector<std::string> entries;
    for (char** env = environ; env && *env; ++env) {
        std::string entry(*env);
        auto eq = entry.find('=');
        std::string key = entry.substr(0, eq);
        if (overrides.count(key) == 0) {
            entries.push_back(entry);
        }
    }
    for (const auto& kv : overrides) {
        entries.push_back(kv.first + "=" + kv.second);
    }
    return entries;
}

void drain(Pipe& outPipe, Pipe& errPipe, std::string& out, std::string& err) {
    char buffer[4096];
    while (outPipe.fds[0] >= 0 || errPipe.fds[0] >= 0) {
        struct pollfd fds[2];
        nfds_t count = 0;
        if (outPipe.fds[0] >= 0) fds[count++] = {outPipe.fds[0], POLLIN, 0};
        if (errPipe.fds[0] >= 0) fds[count++] = {errPipe.fds[0], POLLIN, 0};

        if (::poll(fds, count, -1) < 0) {
            if (errno == EINTR) continue;
            throw CommandError(std::string("poll failed: ") + std::strerror(errno));
        }

        for (nfds_t i = 0; i < count; ++i) {
            if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) {
                continue;
            }
            bool isOut = fds[i].fd == outPipe.fds[0];
            ssize_t n = ::read(fds[i].fd, buffer, sizeof(buffer));
            if (n > 0) {
                (isOut ? out : err).append(buffer, static_cast<std::size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                (isOut ? outPipe : errPipe).closeRead();
            }
        }
    }
}

}

std::string formatCommand(const std::vector<std::string>& argv) {
    std::string line;
    for (const auto& arg : argv) {
        if (!line.empty()) line += ' ';
        line += arg;
    }
    return line;
}

CommandResult ProcessRunner::run(const std::vector<std::string>& argv, const CommandOptions& options) {
    if (argv.empty()) {
        throw CommandError("Empty command");
    }
    LOG_DEBUG("Running: " + formatCommand(argv));

    // Everything the child needs is prepared before fork
    std::vector<char*> args;
    for (const auto& arg : argv) args.push_back(const_cast<char*>(arg.c_str()));
    args.push_back(nullptr);

    auto envEntries = buildEnvironment(options.env);
    std::vector<char*> envp;
    for (auto& entry : envEntries) envp.push_back(const_cast<char*>(entry.c_str()));
    envp.push_back(nullptr);

    const std::string cwd = options.cwd.string();
    const std::string stdinPath = options.stdinFile.empty() ? "/dev/null" : options.stdinFile.string();

    Pipe outPipe;
    Pipe errPipe;
    if (::pipe2(outPipe.fds, O_CLOEXEC) != 0 || ::pipe2(errPipe.fds, O_CLOEXEC) != 0) {
        throw CommandError(std::string("pipe failed: ") + std::strerror(errno));
    }

    Child child;
    const pid_t pid = ::fork();
    if (pid < 0) {
        throw CommandError(std::string("fork failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        int in = ::open(stdinPath.c_str(), O_RDONLY);
        if (in < 0 || ::dup2(in, STDIN_FILENO) < 0 ||
            ::dup2(outPipe.fds[1], STDOUT_FILENO) < 0 ||
            ::dup2(errPipe.fds[1], STDERR_FILENO) < 0) {
            ::_exit(126);
        }
        if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) {
            ::_exit(126);
        }
        ::execvpe(args[0], args.data(), envp.data());
        ::_exit(127);
    }
    child.pid = pid;

    outPipe.closeWrite();
    errPipe.closeWrite();

    CommandResult result;
    drain(outPipe, errPipe, result.out, result.err);

    const int status = child.wait();

    if (WIFEXITED(status)) {
        result.status = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.status = 128 + WTERMSIG(status);
    }

    if (result.status == 127) {
        LOG_WARN("Command not found or not executable: " + argv[0]);
    }
    LOG_TRACE(argv[0] + " exited with " + std::to_string(result.status));
    return result;
}

}
