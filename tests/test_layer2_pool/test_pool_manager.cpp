/**
 * @file test_pool_manager.cpp
 * @brief PoolManager lifecycle, routing facade and failure reconciliation.
 */
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "helpers/fake_worker.h"
#include "gtest/gtest.h"

using namespace workerpool::pool;
using workerpool::test::FakeWorkerFactory;
using namespace std::chrono_literals;

namespace
{

class PoolManagerTest : public ::testing::Test
{
  protected:
    static PoolConfig quiet_config(std::size_t initial)
    {
        PoolConfig cfg;
        cfg.coordinator.min_instances = 1;
        cfg.coordinator.max_instances = 4;
        cfg.coordinator.initial_count = initial;
        cfg.coordinator.auto_scale = false;
        cfg.balancer.max_retries = 1;
        cfg.balancer.retry_delay = 1ms;
        // Background cycles stay out of the way; tests drive run_cycle().
        cfg.monitor.health_check_interval = std::chrono::hours(1);
        cfg.monitor.instance_timeout = 200ms;
        cfg.monitor.retire_after_failures = 0;
        cfg.log_level = workerpool::utils::Logger::Level::L_WARNING;
        return cfg;
    }

    void build(std::size_t initial = 2)
    {
        manager = std::make_unique<PoolManager>(quiet_config(initial), factory.make());
    }

    void TearDown() override
    {
        factory.release_all_hangs();
        manager.reset();
        workerpool::utils::Logger::instance().set_level(workerpool::utils::Logger::Level::L_INFO);
    }

    FakeWorkerFactory factory;
    std::unique_ptr<PoolManager> manager;
};

} // namespace

TEST_F(PoolManagerTest, StartAdmitsInitialInstances)
{
    build(2);
    EXPECT_FALSE(manager->is_running());
    manager->start();
    EXPECT_TRUE(manager->is_running());
    EXPECT_EQ(manager->coordinator().counts().healthy, 2u);

    manager->start();
    EXPECT_EQ(factory.built.load(), 2);
    EXPECT_EQ(manager->get_instance_list().size(), 2u);
}

TEST_F(PoolManagerTest, BootstrapFailurePropagates)
{
    build(1);
    factory.next_init_ok = false;
    EXPECT_THROW(manager->start(), PoolBootstrapError);
    EXPECT_FALSE(manager->is_running());
}

TEST_F(PoolManagerTest, RouteAndComplete)
{
    build(2);
    manager->start();

    const auto routed = manager->route("r1", {{"content", "hello"}});
    ASSERT_TRUE(routed.is_ok());
    const std::string id = routed.content();
    EXPECT_TRUE(manager->coordinator().is_healthy(id));
    EXPECT_EQ(manager->coordinator().active_requests(id), 1u);

    EXPECT_TRUE(manager->complete("r1", true, 64));
    EXPECT_FALSE(manager->complete("r1", true));

    const auto stats = manager->get_routing_stats();
    EXPECT_EQ(stats.total_requests, 1u);
    EXPECT_EQ(stats.successful_routes, 1u);
    EXPECT_EQ(stats.active_requests, 0u);
    EXPECT_EQ(manager->get_instance_performance(id).at(id).success_count, 1u);

    const auto distribution = manager->get_load_distribution();
    ASSERT_EQ(distribution.size(), 2u);
    for (const auto &share : distribution)
    {
        EXPECT_EQ(share.active_requests, 0u) << share.instance_id;
        EXPECT_EQ(share.total_requests, share.instance_id == id ? 1u : 0u) << share.instance_id;
    }
}

TEST_F(PoolManagerTest, FailedInstanceFailsItsActiveRequests)
{
    build(2);
    manager->start();

    const auto first = manager->route("r1", nlohmann::json::object());
    const auto second = manager->route("r2", nlohmann::json::object());
    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(second.is_ok());
    ASSERT_NE(first.content(), second.content());

    const std::string doomed = first.content();
    factory.behavior(doomed)->probe_ok = false;
    manager->monitor().run_cycle();

    EXPECT_TRUE(manager->coordinator().is_unhealthy(doomed));
    EXPECT_EQ(manager->coordinator().active_requests(doomed), 0u);
    EXPECT_FALSE(manager->complete("r1", true));
    EXPECT_EQ(manager->get_instance_performance(doomed).at(doomed).error_count, 1u);

    EXPECT_TRUE(manager->complete("r2", true));

    // New work only goes to the surviving instance.
    const auto third = manager->route("r3", nlohmann::json::object());
    ASSERT_TRUE(third.is_ok());
    EXPECT_EQ(third.content(), second.content());
}

TEST_F(PoolManagerTest, AlertCallbacks)
{
    build(2);
    manager->start();

    std::mutex mu;
    std::vector<Alert> received;
    const auto sub = manager->add_alert_callback(
        [&](const Alert &a)
        {
            std::lock_guard<std::mutex> lock(mu);
            received.push_back(a);
        });

    const auto ids = factory.ids();
    factory.behavior(ids[0])->probe_ok = false;
    manager->monitor().run_cycle();
    {
        std::lock_guard<std::mutex> lock(mu);
        ASSERT_FALSE(received.empty());
        EXPECT_EQ(received.front().type, AlertType::InstanceFailed);
        EXPECT_EQ(received.front().data.at("instance_id"), ids[0]);
    }

    EXPECT_TRUE(manager->remove_alert_callback(sub));
    EXPECT_FALSE(manager->remove_alert_callback(sub));
    // The manager's own failure handler holds the first subscription.
    EXPECT_FALSE(manager->remove_alert_callback(1));
}

TEST_F(PoolManagerTest, StatusReport)
{
    build(2);
    manager->start();

    const auto status = manager->get_status();
    EXPECT_EQ(status.at("running"), true);
    EXPECT_EQ(status.at("pool").at("healthy_instances"), 2);
    EXPECT_EQ(status.at("routing").at("current_strategy"), "least_busy");
    EXPECT_EQ(status.at("health").at("monitoring_active"), true);
    EXPECT_EQ(manager->health_status().at("total_instances"), 2);
}

TEST_F(PoolManagerTest, StopFailsActiveRequestsAndReleasesInstances)
{
    build(2);
    manager->start();
    ASSERT_TRUE(manager->route("r1", nlohmann::json::object()).is_ok());

    manager->stop();
    EXPECT_FALSE(manager->is_running());
    EXPECT_FALSE(manager->monitor().is_running());
    EXPECT_FALSE(manager->complete("r1", true));
    EXPECT_EQ(manager->coordinator().counts().total, 0u);
    for (const auto &id : factory.ids())
    {
        EXPECT_EQ(factory.behavior(id)->releases.load(), 1);
    }

    manager->stop();
    EXPECT_FALSE(manager->is_running());
}

TEST_F(PoolManagerTest, StopWaitsForTimedOutCheckBeforeCleanup)
{
    build(2);
    manager->start();
    const auto ids = factory.ids();
    auto hung = factory.behavior(ids[0]);
    hung->hang();
    manager->monitor().run_cycle();
    ASSERT_EQ(manager->monitor().pending_probes(), 1u);

    std::thread releaser(
        [hung]
        {
            std::this_thread::sleep_for(50ms);
            hung->release_hang();
        });
    manager->stop();
    releaser.join();

    EXPECT_EQ(manager->monitor().pending_probes(), 0u);
    for (const auto &id : ids)
    {
        EXPECT_EQ(factory.behavior(id)->releases.load(), 1) << id;
        EXPECT_EQ(factory.behavior(id)->released_while_probing.load(), 0) << id;
    }
}
