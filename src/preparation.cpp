/*
 * testenv - Virtualized Test Environment Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "testenv/preparation.hpp"
#include "testenv/errors.hpp"
#include "testenv/logger.hpp"
#include <algorithm>
#include <fstream>
#include <set>

#include <boost/interprocess/sync/file_lock.hpp>
#include <boost/interprocess/sync/scoped_lock.hpp>
#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/ptree.hpp>

namespace testenv {

namespace {

const char* kVdsm = "vdsm";
const char* kEngine = "ovirt-engine";
const char* kJsonrpcJava = "vdsm-jsonrpc-java";

std::string join(const std::vector<std::string>& items, const std::string& sep) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) out += sep;
        out += item;
    }
    return out;
}

bool endsWith(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

void appendUnique(std::vector<std::string>& items, const std::string& item) {
    if (std::find(items.begin(), items.end(), item) == items.end()) {
        items.push_back(item);
    }
}

}

std::vector<std::string> selectRepositories(const std::filesystem::path& yumConfig,
                                            const std::vector<std::string>& dists) {
    boost::property_tree::ptree config;
    try {
        boost::property_tree::ini_parser::read_ini(yumConfig.string(), config);
    } catch (const boost::property_tree::ini_parser_error& e) {
        throw Error("Cannot parse reposync config " + yumConfig.string() + ": " + e.what());
    }

    std::vector<std::string> repos;
    for (const auto& section : config) {
        const std::string& name = section.first;
        if (!section.second.data().empty()) {
            continue;  // top-level key, not a section
        }
        auto dash = name.rfind('-');
        std::string dist = dash == std::string::npos ? name : name.substr(dash + 1);
        if (std::find(dists.begin(), dists.end(), dist) != dists.end()) {
            repos.push_back(name);
        }
    }
    LOG_DEBUG("Repositories for " + join(dists, ", ") + ": " + join(repos, ", "));
    return repos;
}

void syncRpmRepository(CommandRunner& runner,
                       const std::filesystem::path& repoPath,
                       const std::filesystem::path& yumConfig,
                       const std::vector<std::string>& repos) {
    std::filesystem::create_directories(repoPath);

    auto lockPath = repoPath / ".lock";
    {
        std::ofstream touch(lockPath, std::ios::app);
        if (!touch) {
            throw Error("Cannot create lock file " + lockPath.string());
        }
    }

    boost::interprocess::file_lock lock(lockPath.c_str());
    boost::interprocess::scoped_lock<boost::interprocess::file_lock> guard(lock);
    LOG_INFO("Syncing " + std::to_string(repos.size()) + " repositories into " + repoPath.string());

    std::vector<std::string> argv = {
        "reposync",
        "--config=" + yumConfig.string(),
        "--download_path=" + repoPath.string(),
        "--newest-only",
        "--delete",
    };
    for (const auto& repo : repos) {
        argv.push_back("--repoid=" + repo);
    }

    auto result = runner.run(argv);
    if (!result) {
        // reposync exits non-zero on partial mirror errors; what matters is
        // whether every repository ended up populated
        LOG_WARN("reposync exited with " + std::to_string(result.status) + ", verifying download");
        if (!verifyReposync(repoPath, repos)) {
            LOG_ERROR("reposync output: \n" + result.out);
            LOG_ERROR("reposync errors: \n" + result.err);
            throw Error("reposync failed for " + repoPath.string() + ", see logs");
        }
    }
}

bool verifyReposync(const std::filesystem::path& repoPath, const std::vector<std::string>& repos) {
    for (const auto& repo : repos) {
        auto dir = repoPath / repo;
        std::error_code ec;
        if (!std::filesystem::is_directory(dir, ec)) {
            LOG_ERROR("Repository " + repo + " missing from " + repoPath.string());
            return false;
        }

        bool hasPackage = false;
        for (auto it = std::filesystem::recursive_directory_iterator(dir, ec);
             !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
            if (it->is_regular_file() && it->path().extension() == ".rpm") {
                hasPackage = true;
                break;
            }
        }
        if (!hasPackage) {
            LOG_ERROR("Repository " + repo + " has no packages");
            return false;
        }
    }
    return true;
}

void buildRpms(CommandRunner& runner, const BuildSpec& spec) {
    LOG_INFO("Building " + spec.name + "(" + spec.script + ") from " + spec.sourceDir.string() +
             ", for " + join(spec.dists, ", ") + ", storing results in " + spec.outputDir.string());

    std::vector<std::string> argv = {spec.script, spec.sourceDir.string(), spec.outputDir.string()};
    argv.insert(argv.end(), spec.dists.begin(), spec.dists.end());

    CommandOptions options;
    options.env = spec.env;
    auto result = runner.run(argv, options);

    if (!result) {
        LOG_ERROR(spec.script + " returned with error " + std::to_string(result.status));
        LOG_ERROR("Output was: \n" + result.out);
        LOG_ERROR("Errors were: \n" + result.err);
        throw Error(spec.script + " failed, see logs");
    }
}

std::string gitRevisionAt(CommandRunner& runner, const std::filesystem::path& path) {
    CommandOptions options;
    options.cwd = path;
    try {
        auto result = runner.run({"git", "rev-parse", "HEAD"}, options);
        if (result) {
            auto revision = result.out;
            revision.erase(revision.find_last_not_of(" \n\r\t") + 1);
            return revision;
        }
    } catch (const CommandError& e) {
        LOG_WARN("Cannot read git revision of " + path.string() + ": " + e.what());
    }
    return "unknown";
}

void CreaterepoMerger::merge(const std::filesystem::path& output, const std::vector<std::filesystem::path>& inputs) {
    LOG_INFO("Merging " + std::to_string(inputs.size()) + " package sources into " + output.string());
    std::filesystem::remove_all(output);
    std::filesystem::create_directories(output);

    std::set<std::string> seen;
    for (const auto& input : inputs) {
        if (!std::filesystem::exists(input)) {
            LOG_DEBUG("Skipping missing package source " + input.string());
            continue;
        }
        for (const auto& entry : std::filesystem::recursive_directory_iterator(input)) {
            if (!entry.is_regular_file() || entry.path().extension() != ".rpm") {
                continue;
            }
            auto filename = entry.path().filename().string();
            if (!seen.insert(filename).second) {
                continue;
            }

            std::error_code ec;
            std::filesystem::create_hard_link(entry.path(), output / filename, ec);
            if (ec) {
                std::filesystem::copy_file(entry.path(), output / filename);
            }
        }
    }

    auto result = runner_.run({"createrepo", output.string()});
    if (!result) {
        LOG_ERROR("createrepo errors: \n" + result.err);
        throw Error("createrepo failed for " + output.string());
    }
}

PreparationPipeline::PreparationPipeline(Prefix& prefix, CommandRunner& runner, RepoMerger& merger)
    : prefix_(prefix), runner_(runner), merger_(merger) {
}

std::vector<std::string> PreparationPipeline::engineDists() const {
    std::vector<std::string> dists;
    if (prefix_.environment().engine) {
        dists.push_back(prefix_.environment().engine->distro());
    }
    return dists;
}

std::vector<std::string> PreparationPipeline::hostDists() const {
    std::vector<std::string> dists;
    for (const auto& host : prefix_.environment().hosts) {
        appendUnique(dists, host->distro());
    }
    return dists;
}

void PreparationPipeline::run(const PrepareOptions& options) {
    const auto engine = engineDists();
    const auto hosts = hostDists();
    std::vector<std::string> all = engine;
    for (const auto& dist : hosts) {
        appendUnique(all, dist);
    }

    std::vector<std::string> repos;
    std::vector<Job> jobs;
    auto& runner = runner_;
    const auto& paths = prefix_.paths();

    if (!options.rpmRepo.empty() && !options.reposyncConfig.empty()) {
        repos = selectRepositories(options.reposyncConfig, all);
        if (!options.skipSync) {
            jobs.push_back([&runner, repoPath = options.rpmRepo, config = options.reposyncConfig, repos] {
                syncRpmRepository(runner, repoPath, config, repos);
            });
        }
    }

    if (!options.vdsmDir.empty() && !hosts.empty()) {
        BuildSpec spec{kVdsm, "build_vdsm_rpms.sh", options.vdsmDir, paths.buildDir(kVdsm), hosts, {}};
        jobs.push_back([&runner, spec] { buildRpms(runner, spec); });
    }

    if (!options.engineDir.empty() && !engine.empty()) {
        BuildSpec spec{kEngine, "build_engine_rpms.sh", options.engineDir, paths.buildDir(kEngine), engine,
                       {{"BUILD_GWT", options.engineBuildGwt ? "1" : "0"}}};
        jobs.push_back([&runner, spec] { buildRpms(runner, spec); });
    }

    if (!options.jsonrpcJavaDir.empty() && !engine.empty()) {
        BuildSpec spec{kJsonrpcJava, "build_vdsm-jsonrpc-java_rpms.sh", options.jsonrpcJavaDir,
                       paths.buildDir(kJsonrpcJava), engine, {}};
        jobs.push_back([&runner, spec] { buildRpms(runner, spec); });
    }

    Batch batch(std::move(jobs));
    batch.startAll();

    if (!options.engineDir.empty()) {
        prefix_.metadata()["ovirt-engine-revision"] = gitRevisionAt(runner_, options.engineDir);
    }
    if (!options.vdsmDir.empty()) {
        prefix_.metadata()["vdsm-revision"] = gitRevisionAt(runner_, options.vdsmDir);
    }

    batch.joinAll().throwIfFailed();

    createRpmRepository(all, options.rpmRepo, repos);
    prefix_.save();
}

void PreparationPipeline::createRpmRepository(const std::vector<std::string>& dists,
                                              const std::filesystem::path& reposPath,
                                              const std::vector<std::string>& repoNames) {
    const auto& paths = prefix_.paths();
    for (const auto& dist : dists) {
        std::vector<std::filesystem::path> rpmDirs;

        for (const char* build : {kVdsm, kEngine, kJsonrpcJava}) {
            if (std::filesystem::exists(paths.buildDir(build))) {
                rpmDirs.push_back(paths.buildDir(build) / dist);
            }
        }
        for (const auto& name : repoNames) {
            if (endsWith(name, dist)) {
                rpmDirs.push_back(reposPath / name);
            }
        }

        merger_.merge(paths.internalRepo(dist), rpmDirs);
    }
}

}
