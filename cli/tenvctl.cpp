/*
 * testenv - Prefix control tool (tenvctl)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "testenv/command.hpp"
#include "testenv/errors.hpp"
#include "testenv/logger.hpp"
#include "testenv/preparation.hpp"
#include "testenv/prefix.hpp"
#include "testenv/ssh_machine.hpp"
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace testenv;

constexpr const char* VERSION = "0.1.0";

void printUsage(const char* progName) {
    std::cout << "testenv prefix control tool v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " prepare-repo <prefix> --engine <name:distro> [--host <name:distro> ...] [options]\n";
    std::cout << "       " << progName << " --help | --version\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  prefix                    Prefix directory (default: $TESTENV_PREFIX)\n\n";
    std::cout << "Options:\n";
    std::cout << "  --engine <name:distro>    Engine machine and its distribution\n";
    std::cout << "  --host <name:distro>      Host machine and its distribution (repeatable)\n";
    std::cout << "  --rpm-repo <dir>          Local mirror of upstream repositories\n";
    std::cout << "  --reposync-config <file>  yum config listing repositories to mirror\n";
    std::cout << "  --skip-sync               Use the mirror as is\n";
    std::cout << "  --vdsm-dir <dir>          Build vdsm from this checkout\n";
    std::cout << "  --engine-dir <dir>        Build ovirt-engine from this checkout\n";
    std::cout << "  --engine-build-gwt        Build the engine web UI too\n";
    std::cout << "  --jsonrpc-java-dir <dir>  Build vdsm-jsonrpc-java from this checkout\n";
    std::cout << "  -h, --help                Show this help message\n";
    std::cout << "  -v, --version             Show version\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  TESTENV_LOG_LEVEL         Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n";
    std::cout << "  TESTENV_PREFIX            Default prefix directory\n";
    std::cout << "  TESTENV_SHORT_TIMEOUT     Seconds to wait for quick transitions (default: 180)\n";
    std::cout << "  TESTENV_LONG_TIMEOUT      Seconds to wait for ssh (default: 600)\n";
    std::cout << "  TESTENV_POLL_INTERVAL_MS  Delay between reachability checks (default: 3000)\n";
}

std::optional<SshTarget> parseMachine(const std::string& spec) {
    auto colon = spec.find(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == spec.size()) {
        return std::nullopt;
    }
    SshTarget target;
    target.name = spec.substr(0, colon);
    target.distro = spec.substr(colon + 1);
    return target;
}

int prepareRepo(int argc, char* argv[]) {
    std::string prefixDir;
    PrepareOptions options;
    std::optional<SshTarget> engine;
    std::vector<SshTarget> hosts;

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        auto value = [&](const char* option) -> std::string {
            if (i + 1 >= argc) {
                throw Error(std::string(option) + " requires a value");
            }
            return argv[++i];
        };

        if (arg == "--engine") {
            engine = parseMachine(value("--engine"));
            if (!engine) {
                std::cerr << "Error: --engine expects <name:distro>\n";
                return 1;
            }
        } else if (arg == "--host") {
            auto host = parseMachine(value("--host"));
            if (!host) {
                std::cerr << "Error: --host expects <name:distro>\n";
                return 1;
            }
            hosts.push_back(*host);
        } else if (arg == "--rpm-repo") {
            options.rpmRepo = value("--rpm-repo");
        } else if (arg == "--reposync-config") {
            options.reposyncConfig = value("--reposync-config");
        } else if (arg == "--skip-sync") {
            options.skipSync = true;
        } else if (arg == "--vdsm-dir") {
            options.vdsmDir = value("--vdsm-dir");
        } else if (arg == "--engine-dir") {
            options.engineDir = value("--engine-dir");
        } else if (arg == "--engine-build-gwt") {
            options.engineBuildGwt = true;
        } else if (arg == "--jsonrpc-java-dir") {
            options.jsonrpcJavaDir = value("--jsonrpc-java-dir");
        } else if (!arg.empty() && arg[0] != '-' && prefixDir.empty()) {
            prefixDir = arg;
        } else {
            std::cerr << "Error: Unknown argument " << arg << "\n";
            return 1;
        }
    }

    if (prefixDir.empty()) {
        if (const char* env = std::getenv("TESTENV_PREFIX")) {
            prefixDir = env;
        }
    }
    if (prefixDir.empty()) {
        std::cerr << "Error: No prefix given and TESTENV_PREFIX is unset\n";
        return 1;
    }
    if (!engine) {
        std::cerr << "Error: --engine is required\n";
        return 1;
    }

    ProcessRunner runner;
    Settings settings = Settings::fromEnv();

    Environment env;
    env.engine = std::make_shared<SshMachine>(*engine, runner, settings);
    for (const auto& host : hosts) {
        env.hosts.push_back(std::make_shared<SshMachine>(host, runner, settings));
    }

    Prefix prefix(prefixDir, std::move(env), settings);
    prefix.load();

    CreaterepoMerger merger(runner);
    PreparationPipeline pipeline(prefix, runner, merger);
    pipeline.run(options);

    LOG_INFO("Repositories ready under " + prefix.paths().root().string());
    return 0;
}

int main(int argc, char* argv[]) {
    Logger::initFromEnv();

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "-v" || arg == "--version") {
            std::cout << VERSION << "\n";
            return 0;
        }
    }

    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    setThreadName("Main");
    std::string command = argv[1];

    try {
        if (command == "prepare-repo") {
            return prepareRepo(argc, argv);
        }
        std::cerr << "Error: Unknown command " << command << "\n";
        printUsage(argv[0]);
        return 1;
    } catch (const JobFailure& e) {
        for (const auto& failure : e.failures()) {
            LOG_ERROR("Job " + std::to_string(failure.first) + " failed: " + failure.second.error);
        }
        LOG_ERROR(command + " failed: " + std::to_string(e.failures().size()) + " of " +
                  std::to_string(e.batchSize()) + " jobs failed");
        return 1;
    } catch (const std::exception& e) {
        LOG_ERROR(command + " failed: " + e.what());
        return 1;
    }
}
