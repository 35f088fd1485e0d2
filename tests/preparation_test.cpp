#include "fake_environment.h"
#include "test_utils.h"

#include <testenv/batch.hpp>
#include <testenv/errors.hpp>
#include <testenv/preparation.hpp>
#include <testenv/prefix.hpp>

#include <filesystem>
#include <iostream>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace {

using namespace testenv;
using namespace testenv::test;
namespace fs = std::filesystem;

constexpr std::string_view k_prefix = "preparation_test: ";

const char* k_yum_config =
    "[main]\n"
    "reposdir=/etc/reposync.repos.d\n"
    "keepcache=0\n"
    "\n"
    "[ovirt-master-el7]\n"
    "name=oVirt master\n"
    "baseurl=http://resources.example.org/ovirt/el7\n"
    "\n"
    "[glusterfs-el7]\n"
    "baseurl=http://resources.example.org/gluster/el7\n"
    "\n"
    "[centos-updates-el6]\n"
    "baseurl=http://resources.example.org/centos/6\n"
    "\n"
    "[fedora-base-fc24]\n"
    "baseurl=http://resources.example.org/fedora/24\n";

class Recording_merger : public RepoMerger {
public:
    struct Merge {
        fs::path output;
        std::vector<fs::path> inputs;
    };

    void merge(const fs::path& output, const std::vector<fs::path>& inputs) override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_merges.push_back(Merge{output, inputs});
    }

    std::vector<Merge> merges() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_merges;
    }

private:
    mutable std::mutex m_mutex;
    std::vector<Merge> m_merges;
};

// Engine on el7, hosts on el7 and fc24.
Environment mixed_environment(const std::shared_ptr<Event_log>& log)
{
    Environment env;
    env.engine = std::make_shared<Fake_machine>("engine", "el7", log);
    env.hosts.push_back(std::make_shared<Fake_machine>("host1", "el7", log));
    env.hosts.push_back(std::make_shared<Fake_machine>("host2", "fc24", log));
    env.hosts.push_back(std::make_shared<Fake_machine>("host3", "el7", log));
    return env;
}

CommandResult status(int code, std::string out = {})
{
    CommandResult result;
    result.status = code;
    result.out = std::move(out);
    return result;
}

// Build scripts drop one package per distribution into their output.
CommandResult fake_build(const std::vector<std::string>& argv)
{
    for (std::size_t i = 3; i < argv.size(); ++i) {
        write_file(fs::path(argv[2]) / argv[i] / (fs::path(argv[0]).stem().string() + ".rpm"), "rpm");
    }
    return status(0);
}

void test_select_repositories()
{
    auto root = unique_scratch_directory("prep_select");
    write_file(root / "reposync.conf", k_yum_config);

    auto repos = selectRepositories(root / "reposync.conf", {"el7", "fc24"});
    require_true(repos == std::vector<std::string>({"ovirt-master-el7", "glusterfs-el7", "fedora-base-fc24"}),
                 k_prefix, "sections ending in a requested distribution, in file order");

    require_true(selectRepositories(root / "reposync.conf", {"el8"}).empty(), k_prefix,
                 "no section matches an unknown distribution");

    write_file(root / "broken.conf", "[ovirt-el7\nbaseurl=x\n");
    (void)require_throws<Error>([&] { (void)selectRepositories(root / "broken.conf", {"el7"}); }, k_prefix,
                                "a malformed config should be rejected");
    (void)require_throws<Error>([&] { (void)selectRepositories(root / "missing.conf", {"el7"}); }, k_prefix,
                                "a missing config should be rejected");
}

void test_pipeline_builds_and_merges()
{
    auto root = unique_scratch_directory("prep_pipeline");
    write_file(root / "reposync.conf", k_yum_config);
    auto log = std::make_shared<Event_log>();
    Prefix prefix(root / "prefix", mixed_environment(log), fast_settings());

    Scripted_runner runner;
    runner.handler = [](const std::vector<std::string>& argv, const CommandOptions&) {
        if (argv[0] == "git") {
            return status(0, "deadbeef\n");
        }
        return fake_build(argv);
    };
    Recording_merger merger;
    PreparationPipeline pipeline(prefix, runner, merger);

    require_true(pipeline.engineDists() == std::vector<std::string>({"el7"}), k_prefix, "engine distributions");
    require_true(pipeline.hostDists() == std::vector<std::string>({"el7", "fc24"}), k_prefix,
                 "host distributions are distinct, in first-seen order");

    PrepareOptions options;
    options.rpmRepo = root / "repos";
    options.reposyncConfig = root / "reposync.conf";
    options.skipSync = true;
    options.vdsmDir = root / "src" / "vdsm";
    options.engineDir = root / "src" / "ovirt-engine";
    options.engineBuildGwt = true;
    options.jsonrpcJavaDir = root / "src" / "vdsm-jsonrpc-java";
    pipeline.run(options);

    const auto& paths = prefix.paths();
    require_true(runner.find("reposync") == nullptr, k_prefix, "skip-sync should not run reposync");

    auto vdsm = runner.find("build_vdsm_rpms.sh");
    require_true(vdsm != nullptr, k_prefix, "vdsm should be built");
    require_true(vdsm->argv == std::vector<std::string>({"build_vdsm_rpms.sh", options.vdsmDir.string(),
                                                         paths.buildDir("vdsm").string(), "el7", "fc24"}),
                 k_prefix, "vdsm builds for the host distributions");

    auto engine = runner.find("build_engine_rpms.sh");
    require_true(engine != nullptr, k_prefix, "engine should be built");
    require_true(engine->argv == std::vector<std::string>({"build_engine_rpms.sh", options.engineDir.string(),
                                                           paths.buildDir("ovirt-engine").string(), "el7"}),
                 k_prefix, "engine builds for the engine distribution");
    require_true(engine->options.env.at("BUILD_GWT") == "1", k_prefix, "GWT build flag should be passed");

    auto jsonrpc = runner.find("build_vdsm-jsonrpc-java_rpms.sh");
    require_true(jsonrpc != nullptr, k_prefix, "vdsm-jsonrpc-java should be built by its own script");
    require_true(jsonrpc->argv[1] == options.jsonrpcJavaDir.string() &&
                 jsonrpc->argv[2] == paths.buildDir("vdsm-jsonrpc-java").string(),
                 k_prefix, "vdsm-jsonrpc-java builds from its own sources into its own output");

    bool saw_engine_git = false;
    for (const auto& call : runner.calls()) {
        if (call.argv[0] == "git" && call.options.cwd == options.engineDir) {
            saw_engine_git = true;
        }
    }
    require_true(saw_engine_git, k_prefix, "engine revision should be read inside its checkout");
    require_true(prefix.metadata()["ovirt-engine-revision"] == "deadbeef", k_prefix, "engine revision recorded");
    require_true(prefix.metadata()["vdsm-revision"] == "deadbeef", k_prefix, "vdsm revision recorded");
    require_true(read_file(paths.metadataFile()).find("vdsm-revision=deadbeef") != std::string::npos, k_prefix,
                 "metadata should be saved");

    auto merges = merger.merges();
    require_true(merges.size() == 2, k_prefix, "one internal repository per distribution");
    require_true(merges[0].output == paths.internalRepo("el7"), k_prefix, "el7 repository first");
    require_true(merges[0].inputs == std::vector<fs::path>({paths.buildDir("vdsm") / "el7",
                                                            paths.buildDir("ovirt-engine") / "el7",
                                                            paths.buildDir("vdsm-jsonrpc-java") / "el7",
                                                            options.rpmRepo / "ovirt-master-el7",
                                                            options.rpmRepo / "glusterfs-el7"}),
                 k_prefix, "el7 merges every build output and its synced repositories");
    require_true(merges[1].output == paths.internalRepo("fc24"), k_prefix, "fc24 repository second");
    require_true(merges[1].inputs.back() == options.rpmRepo / "fedora-base-fc24", k_prefix,
                 "fc24 merges its own synced repository");
}

void test_pipeline_build_failure()
{
    auto root = unique_scratch_directory("prep_failure");
    auto log = std::make_shared<Event_log>();
    Prefix prefix(root / "prefix", mixed_environment(log), fast_settings());

    Scripted_runner runner;
    runner.handler = [](const std::vector<std::string>& argv, const CommandOptions&) {
        if (argv[0] == "build_engine_rpms.sh") {
            auto result = status(2);
            result.err = "maven exploded";
            return result;
        }
        if (argv[0] == "git") {
            return status(128);
        }
        return fake_build(argv);
    };
    Recording_merger merger;
    PreparationPipeline pipeline(prefix, runner, merger);

    PrepareOptions options;
    options.vdsmDir = root / "vdsm";
    options.engineDir = root / "ovirt-engine";

    try {
        pipeline.run(options);
        fail(k_prefix, "a failed build should fail the pipeline");
    }
    catch (const JobFailure& e) {
        require_true(e.failures().size() == 1, k_prefix, "only the engine build failed");
        require_true(e.failures()[0].second.error == "build_engine_rpms.sh failed, see logs", k_prefix,
                     "build failure message");
    }
    require_true(runner.find("build_vdsm_rpms.sh") != nullptr, k_prefix, "sibling builds should still run");
    require_true(merger.merges().empty(), k_prefix, "nothing should be merged after a failure");
    require_true(prefix.metadata()["ovirt-engine-revision"] == "unknown", k_prefix,
                 "unreadable revision should be recorded as unknown");
    require_true(!fs::exists(prefix.paths().metadataFile()), k_prefix, "metadata should not be saved");
}

void test_sync_repository()
{
    auto root = unique_scratch_directory("prep_sync");
    auto repo = root / "repos";
    std::vector<std::string> repos = {"ovirt-master-el7", "glusterfs-el7"};

    Scripted_runner runner;
    syncRpmRepository(runner, repo, root / "reposync.conf", repos);
    require_true(fs::exists(repo / ".lock"), k_prefix, "lock file should be created");
    auto call = runner.find("reposync");
    require_true(call != nullptr, k_prefix, "reposync should be invoked");
    require_true(call->argv == std::vector<std::string>({"reposync",
                                                         "--config=" + (root / "reposync.conf").string(),
                                                         "--download_path=" + repo.string(),
                                                         "--newest-only",
                                                         "--delete",
                                                         "--repoid=ovirt-master-el7",
                                                         "--repoid=glusterfs-el7"}),
                 k_prefix, "reposync arguments");

    // Partial failure with every repository populated is tolerated
    Scripted_runner partial;
    partial.handler = [&](const std::vector<std::string>&, const CommandOptions&) {
        write_file(repo / "ovirt-master-el7" / "Packages" / "vdsm-4.rpm", "rpm");
        write_file(repo / "glusterfs-el7" / "glusterfs-3.rpm", "rpm");
        return status(1);
    };
    syncRpmRepository(partial, repo, root / "reposync.conf", repos);

    Scripted_runner broken;
    broken.handler = [](const std::vector<std::string>&, const CommandOptions&) { return status(1); };
    auto message = require_throws<Error>(
        [&] { syncRpmRepository(broken, repo, root / "reposync.conf", {"ovirt-master-el7", "empty-el7"}); },
        k_prefix, "an incomplete mirror should fail the sync");
    require_true(message.find("reposync failed") != std::string::npos, k_prefix, "sync failure message");
}

void test_verify_reposync()
{
    auto root = unique_scratch_directory("prep_verify");
    write_file(root / "full-el7" / "a.rpm", "rpm");
    fs::create_directories(root / "empty-el7");
    write_file(root / "docs-el7" / "README", "text");

    require_true(verifyReposync(root, {"full-el7"}), k_prefix, "populated repository verifies");
    require_true(!verifyReposync(root, {"full-el7", "empty-el7"}), k_prefix, "empty repository fails");
    require_true(!verifyReposync(root, {"docs-el7"}), k_prefix, "repository without packages fails");
    require_true(!verifyReposync(root, {"absent-el7"}), k_prefix, "missing repository fails");
}

void test_git_revision()
{
    Scripted_runner runner;
    runner.handler = [](const std::vector<std::string>&, const CommandOptions&) -> CommandResult {
        throw CommandError("git not installed");
    };
    require_true(gitRevisionAt(runner, "/src/vdsm") == "unknown", k_prefix,
                 "launch failure should give an unknown revision");

    Scripted_runner ok;
    ok.handler = [](const std::vector<std::string>&, const CommandOptions&) { return status(0, "0123abcd\n"); };
    require_true(gitRevisionAt(ok, "/src/vdsm") == "0123abcd", k_prefix, "revision should be trimmed");
}

void test_createrepo_merger()
{
    auto root = unique_scratch_directory("prep_merge");
    write_file(root / "a" / "x.rpm", "from a");
    write_file(root / "a" / "sub" / "y.rpm", "y");
    write_file(root / "b" / "x.rpm", "from b");
    write_file(root / "b" / "README", "not a package");
    write_file(root / "out" / "stale.rpm", "old");

    Scripted_runner runner;
    CreaterepoMerger merger(runner);
    merger.merge(root / "out", {root / "a", root / "b", root / "missing"});

    require_true(!fs::exists(root / "out" / "stale.rpm"), k_prefix, "output should be recreated");
    require_true(read_file(root / "out" / "x.rpm") == "from a", k_prefix, "first package of a name wins");
    require_true(fs::exists(root / "out" / "y.rpm"), k_prefix, "nested packages are found");
    require_true(!fs::exists(root / "out" / "README"), k_prefix, "only packages are merged");
    auto call = runner.find("createrepo");
    require_true(call != nullptr && call->argv.size() == 2 && call->argv[1] == (root / "out").string(), k_prefix,
                 "createrepo should index the output");

    Scripted_runner failing;
    failing.handler = [](const std::vector<std::string>&, const CommandOptions&) { return status(1); };
    CreaterepoMerger broken(failing);
    (void)require_throws<Error>([&] { broken.merge(root / "out2", {root / "a"}); }, k_prefix,
                                "createrepo failure should be reported");
}

} // namespace

int main()
{
    quiet_logs();
    try {
        test_select_repositories();
        test_pipeline_builds_and_merges();
        test_pipeline_build_failure();
        test_sync_repository();
        test_verify_reposync();
        test_git_revision();
        test_createrepo_merger();
    }
    catch (const std::exception& ex) {
        std::cerr << "preparation_test failed: " << ex.what() << std::endl;
        return 1;
    }
    std::cout << "preparation_test passed" << std::endl;
    return 0;
}
