#include "fake_environment.h"
#include "test_utils.h"

#include <testenv/activation.hpp>
#include <testenv/errors.hpp>
#include <testenv/lifecycle.hpp>
#include <testenv/poll.hpp>

#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using namespace testenv;
using namespace testenv::test;

constexpr std::string_view k_prefix = "activation_test: ";

StorageDomain domain_named(ManagementApi& api, const std::string& dc, const std::string& name)
{
    for (const auto& domain : api.listStorageDomains(dc)) {
        if (domain.name == name) {
            return domain;
        }
    }
    throw std::runtime_error("no storage domain " + name);
}

void test_domain_groups_round_trip()
{
    Fake_environment fx;
    ActivationController controller(*fx.api, fast_settings());
    auto master = domain_named(*fx.api, "dc1", "master_sd");
    auto sd2 = domain_named(*fx.api, "dc1", "sd2");

    controller.deactivateStorageDomains({sd2});
    require_true(fx.api->domain_state("sd2") == DomainState::Maintenance, k_prefix,
                 "sd2 should reach maintenance");
    require_true(fx.api->domain_state("master_sd") == DomainState::Active, k_prefix,
                 "master should stay active while only sd2 is deactivated");

    controller.deactivateStorageDomains({master});
    require_true(fx.api->domain_state("master_sd") == DomainState::Maintenance, k_prefix,
                 "master should reach maintenance");

    controller.activateStorageDomains({master});
    require_true(fx.api->domain_state("master_sd") == DomainState::Active, k_prefix,
                 "master should be active again");
    controller.activateStorageDomains({sd2});
    require_true(fx.api->domain_state("sd2") == DomainState::Active, k_prefix,
                 "sd2 should be active again");

    require_true(fx.api->invariant_violations() == 0, k_prefix,
                 "a non-master domain must never be active while its master is not");
}

void test_all_domains_follow_master_ordering()
{
    Fake_environment fx;
    fx.api->add_domain("dc1", "sd3", false);
    fx.api->add_data_center("dc2");
    fx.api->add_domain("dc2", "dc2_master", true);
    fx.api->add_domain("dc2", "dc2_data", false);
    ActivationController controller(*fx.api, fast_settings());

    controller.deactivateAllStorageDomains();
    for (const auto* name : {"master_sd", "sd2", "sd3", "dc2_master", "dc2_data"}) {
        require_true(fx.api->domain_state(name) == DomainState::Maintenance, k_prefix,
                     std::string(name) + " should be in maintenance");
    }
    require_true(fx.log->index_of("deactivate sd2") < fx.log->index_of("deactivate master_sd"), k_prefix,
                 "non-masters should be deactivated before the master");
    require_true(fx.log->index_of("deactivate sd3") < fx.log->index_of("deactivate master_sd"), k_prefix,
                 "every non-master should be deactivated before the master");
    require_true(fx.log->index_of("deactivate dc2_data") < fx.log->index_of("deactivate dc2_master"), k_prefix,
                 "ordering holds in every data center");

    controller.activateAllStorageDomains();
    require_true(fx.api->domain_state("sd3") == DomainState::Active, k_prefix, "sd3 should be active");
    require_true(fx.log->index_of("activate master_sd") < fx.log->index_of("activate sd2"), k_prefix,
                 "master should be activated before non-masters");
    require_true(fx.log->index_of("activate dc2_master") < fx.log->index_of("activate dc2_data"), k_prefix,
                 "master first in every data center");
    require_true(fx.api->invariant_violations() == 0, k_prefix, "master invariant should hold throughout");
}

void test_host_deactivation_requeues_rejection()
{
    Fake_environment fx;
    fx.api->reject_host_deactivation("host2", 1);
    ActivationController controller(*fx.api, fast_settings());

    controller.deactivateAllHosts();
    require_true(fx.api->host_state("host1") == HostState::Maintenance, k_prefix, "host1 should be in maintenance");
    require_true(fx.api->host_state("host2") == HostState::Maintenance, k_prefix,
                 "rejected host should still converge to maintenance");
    require_true(fx.api->host_deactivation_attempts("host2") == 2, k_prefix,
                 "rejected host should be retried once");
    require_true(fx.api->host_deactivation_attempts("host1") == 1, k_prefix,
                 "accepted host should be asked once");
}

void test_host_activation_ignores_rejection()
{
    Fake_environment fx;
    fx.api->add_host("host3", HostState::Maintenance);
    // host1 is already up, so the engine refuses to activate it
    fx.api->reject_host_activation("host1", 1);
    ActivationController controller(*fx.api, fast_settings());

    controller.activateAllHosts();
    require_true(fx.api->host_state("host1") == HostState::Up, k_prefix, "host1 stays up");
    require_true(fx.api->host_state("host3") == HostState::Up, k_prefix,
                 "hosts after a rejected one should still be activated");
    require_true(fx.log->count("activate host3") == 1, k_prefix, "host3 should be activated once");
}

void test_domain_rejection_propagates()
{
    Fake_environment fx;
    fx.api->reject_domain_requests("sd2", 1);
    ActivationController controller(*fx.api, fast_settings());
    auto sd2 = domain_named(*fx.api, "dc1", "sd2");

    auto message = require_throws<RequestError>(
        [&] { controller.deactivateStorageDomains({sd2}); },
        k_prefix, "storage domain rejections must propagate");
    require_true(message.find("sd2") != std::string::npos, k_prefix, "rejection should name the domain");
    require_true(fx.api->domain_state("sd2") == DomainState::Active, k_prefix,
                 "rejected domain should not have moved");
}

void test_stuck_domain_times_out()
{
    Fake_environment fx;
    fx.api->stick_domain("sd2");
    auto settings = fast_settings();
    settings.longTimeout = std::chrono::milliseconds(50);
    ActivationController controller(*fx.api, settings);
    auto sd2 = domain_named(*fx.api, "dc1", "sd2");

    try {
        controller.deactivateStorageDomains({sd2});
        fail(k_prefix, "a domain that never converges should time out");
    }
    catch (const ConvergenceTimeout& e) {
        require_true(e.subject().find("sd2") != std::string::npos, k_prefix, "timeout should name the domain");
        require_true(e.bound() == std::chrono::milliseconds(50), k_prefix, "timeout should report the long bound");
        require_true(std::string(e.what()).find("50ms") != std::string::npos, k_prefix,
                     "timeout message should carry the bound");
    }
}

void test_retry_policy_in_isolation()
{
    auto rejected = [] { throw RequestError("busy"); };
    auto broken = [] { throw std::logic_error("bug"); };
    int calls = 0;
    auto accepted = [&] { ++calls; };

    require_true(applyRetryPolicy(RetryPolicy::Swallow, accepted, "ok"), k_prefix,
                 "accepted call should report success");
    require_true(applyRetryPolicy(RetryPolicy::Propagate, accepted, "ok"), k_prefix,
                 "accepted call should report success under propagate");
    require_true(calls == 2, k_prefix, "call should be issued once per policy application");

    require_true(!applyRetryPolicy(RetryPolicy::Swallow, rejected, "swallow"), k_prefix,
                 "swallow should report a rejection as not done");
    require_true(!applyRetryPolicy(RetryPolicy::Requeue, rejected, "requeue"), k_prefix,
                 "requeue should report a rejection as not done");
    (void)require_throws<RequestError>([&] { applyRetryPolicy(RetryPolicy::Propagate, rejected, "propagate"); },
                                       k_prefix, "propagate should rethrow rejections");
    (void)require_throws<std::logic_error>([&] { applyRetryPolicy(RetryPolicy::Swallow, broken, "swallow"); },
                                           k_prefix, "only rejections may be swallowed");

    RetryPolicies defaults;
    require_true(defaults.domainRequests == RetryPolicy::Propagate &&
                 defaults.hostActivation == RetryPolicy::Swallow &&
                 defaults.hostDeactivation == RetryPolicy::Requeue,
                 k_prefix, "default policies per operation");
}

void test_poll_until()
{
    int attempts = 0;
    pollUntil([&] { return ++attempts == 3; }, std::chrono::milliseconds(1000), std::chrono::milliseconds(1),
              "third attempt");
    require_true(attempts == 3, k_prefix, "poll should stop at the first success");

    attempts = 0;
    pollUntil(
        [&] {
            if (++attempts < 3) {
                throw RequestError("not ready");
            }
            return true;
        },
        std::chrono::milliseconds(1000), std::chrono::milliseconds(1), "rejections then success");
    require_true(attempts == 3, k_prefix, "rejections should count as not converged");

    (void)require_throws<std::logic_error>(
        [] {
            pollUntil([]() -> bool { throw std::logic_error("bug"); }, std::chrono::milliseconds(1000),
                      std::chrono::milliseconds(1), "broken");
        },
        k_prefix, "other errors should propagate immediately");

    auto message = require_throws<ConvergenceTimeout>(
        [] {
            pollUntil([] { return false; }, std::chrono::milliseconds(20), std::chrono::milliseconds(1),
                      "never");
        },
        k_prefix, "a predicate that never holds should time out");
    require_true(message.find("never") != std::string::npos, k_prefix, "timeout should name what was awaited");
}

void test_activate_environment()
{
    Fake_environment fx;
    auto settings = fast_settings();
    deactivateEnvironment(fx.env, settings);
    require_true(fx.log->index_of("deactivate master_sd") < fx.log->index_of("deactivate host1"), k_prefix,
                 "storage should be deactivated before hosts");
    require_true(fx.api->host_state("host1") == HostState::Maintenance, k_prefix,
                 "hosts should end in maintenance");

    fx.api->fail_connects(2);
    activateEnvironment(fx.env, settings);
    require_true(fx.api->connect_count() == 1, k_prefix, "api should be connected after retrying");
    require_true(fx.log->index_of("ssh engine") < fx.log->index_of("connect api"), k_prefix,
                 "ssh should be awaited before connecting");
    require_true(fx.log->index_of("ssh host2") < fx.log->index_of("connect api"), k_prefix,
                 "every machine should be reachable before connecting");
    require_true(fx.log->index_of("activate host1") < fx.log->index_of("activate master_sd"), k_prefix,
                 "hosts should be activated before storage");
    require_true(fx.api->domain_state("sd2") == DomainState::Active, k_prefix, "storage should be active again");
    require_true(fx.api->host_state("host2") == HostState::Up, k_prefix, "hosts should be up again");
    require_true(fx.api->invariant_violations() == 0, k_prefix, "master invariant should hold");

    Environment bare;
    (void)require_throws<Error>([&] { activateEnvironment(bare, settings); }, k_prefix,
                                "an environment without api cannot be activated");
}

} // namespace

int main()
{
    quiet_logs();
    try {
        test_domain_groups_round_trip();
        test_all_domains_follow_master_ordering();
        test_host_deactivation_requeues_rejection();
        test_host_activation_ignores_rejection();
        test_domain_rejection_propagates();
        test_stuck_domain_times_out();
        test_retry_policy_in_isolation();
        test_poll_until();
        test_activate_environment();
    }
    catch (const std::exception& ex) {
        std::cerr << "activation_test failed: " << ex.what() << std::endl;
        return 1;
    }
    std::cout << "activation_test passed" << std::endl;
    return 0;
}
