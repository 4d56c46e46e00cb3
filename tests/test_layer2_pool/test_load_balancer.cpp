/**
 * @file test_load_balancer.cpp
 * @brief LoadBalancer routing, retries, completion statistics and failover.
 *
 * Every test injects a manual clock and a recording sleep hook, so retry
 * delays are observed rather than waited out.
 */
#include <algorithm>
#include <functional>
#include <map>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "helpers/fake_worker.h"
#include "gtest/gtest.h"

using namespace workerpool::pool;
using workerpool::test::FakeWorkerFactory;
using workerpool::test::ManualClock;
using namespace std::chrono_literals;

namespace
{

class LoadBalancerTest : public ::testing::Test
{
  protected:
    void build(std::size_t instances, LoadBalancer::Config lb = {})
    {
        CoordinatorConfig cfg;
        cfg.min_instances = 1;
        cfg.max_instances = 8;
        cfg.initial_count = instances;
        cfg.clock = clock.fn();
        cfg.instance_defaults.clock = clock.fn();
        coordinator = std::make_unique<InstanceCoordinator>(cfg, factory.make());
        if (instances > 0)
        {
            coordinator->bootstrap();
            for (const auto &inst : coordinator->instances())
            {
                coordinator->mark_healthy(inst->id());
                ids.push_back(inst->id());
            }
        }

        lb.clock = clock.fn();
        lb.sleep = [this](std::chrono::milliseconds d)
        {
            sleeps.push_back(d);
            if (on_sleep)
                on_sleep();
        };
        balancer = std::make_unique<LoadBalancer>(*coordinator, lb);
    }

    ManualClock clock;
    FakeWorkerFactory factory;
    std::unique_ptr<InstanceCoordinator> coordinator;
    std::unique_ptr<LoadBalancer> balancer;
    std::vector<std::string> ids;
    std::vector<std::chrono::milliseconds> sleeps;
    std::function<void()> on_sleep;

    void TearDown() override
    {
        balancer.reset();
        coordinator.reset();
    }
};

const nlohmann::json kPayload = {{"content", "hello"}};

} // namespace

TEST_F(LoadBalancerTest, RunningMeanOfResponseTimes)
{
    build(1);
    const std::vector<std::pair<std::chrono::seconds, double>> steps = {
        {2s, 2.0}, {4s, 3.0}, {6s, 4.0}};
    int n = 0;
    for (const auto &[elapsed, expected] : steps)
    {
        const std::string rid = "r" + std::to_string(n++);
        auto routed = balancer->route(rid, kPayload);
        ASSERT_TRUE(routed.is_ok());
        EXPECT_EQ(routed.content(), ids[0]);
        clock.advance(elapsed);
        ASSERT_TRUE(balancer->complete(rid, true, 10));
        EXPECT_DOUBLE_EQ(*balancer->average_response_time(ids[0]), expected);
    }

    const auto perf = balancer->instance_performance(ids[0]);
    ASSERT_EQ(perf.size(), 1u);
    const auto &rec = perf.at(ids[0]);
    EXPECT_EQ(rec.requests, 3u);
    EXPECT_EQ(rec.success_count, 3u);
    EXPECT_DOUBLE_EQ(rec.total_response_time, 12.0);
    EXPECT_TRUE(rec.last_request_time.has_value());
}

TEST_F(LoadBalancerTest, NoHealthyInstanceAfterLinearBackoff)
{
    build(0);
    auto routed = balancer->route("r1", kPayload);
    ASSERT_TRUE(routed.is_error());
    EXPECT_EQ(routed.error(), RouteError::NoHealthyInstance);
    EXPECT_EQ(routed.error_code(), 4);
    EXPECT_EQ(sleeps, (std::vector<std::chrono::milliseconds>{1000ms, 2000ms, 3000ms}));

    const auto stats = balancer->routing_stats();
    EXPECT_EQ(stats.total_requests, 1u);
    EXPECT_EQ(stats.failed_routes, 1u);
    EXPECT_EQ(stats.active_requests, 0u);
    EXPECT_STREQ(to_string(RouteError::NoHealthyInstance), "no healthy instance available");
}

TEST_F(LoadBalancerTest, IneligibleCandidateExhaustsRetries)
{
    LoadBalancer::Config lb;
    lb.max_retries = 2;
    lb.retry_delay = 250ms;
    build(1, lb);
    // Still in the healthy set, but no longer able to take work.
    coordinator->find_instance(ids[0])->cleanup();

    auto routed = balancer->route("r1", kPayload);
    ASSERT_TRUE(routed.is_error());
    EXPECT_EQ(routed.error(), RouteError::RetriesExhausted);
    EXPECT_EQ(sleeps, (std::vector<std::chrono::milliseconds>{250ms, 250ms}));

    const auto stats = balancer->routing_stats();
    EXPECT_EQ(stats.retries, 3u);
    EXPECT_EQ(stats.failed_routes, 1u);
    EXPECT_EQ(coordinator->counts().active_requests, 0u);
}

TEST_F(LoadBalancerTest, RetryPicksUpMembershipChangeBetweenAttempts)
{
    build(2);
    coordinator->find_instance(ids[0])->cleanup();
    // The monitor notices the dead instance while the router is backing off.
    on_sleep = [this] { coordinator->mark_unhealthy(ids[0]); };

    auto routed = balancer->route("r1", kPayload);
    ASSERT_TRUE(routed.is_ok());
    EXPECT_EQ(routed.content(), ids[1]);
    EXPECT_EQ(balancer->routing_stats().retries, 1u);
    EXPECT_EQ(sleeps.size(), 1u);
}

TEST_F(LoadBalancerTest, DuplicateActiveRequestIsRejected)
{
    build(1);
    ASSERT_TRUE(balancer->route("r1", kPayload).is_ok());
    auto dup = balancer->route("r1", kPayload);
    ASSERT_TRUE(dup.is_error());
    EXPECT_EQ(dup.error(), RouteError::DuplicateRequest);
    EXPECT_EQ(coordinator->active_requests(ids[0]), 1u);

    // Once completed the id can be reused.
    ASSERT_TRUE(balancer->complete("r1", true));
    EXPECT_TRUE(balancer->route("r1", kPayload).is_ok());
}

TEST_F(LoadBalancerTest, CompleteUnknownRequestReturnsFalse)
{
    build(1);
    EXPECT_FALSE(balancer->complete("never-routed", true));
    EXPECT_TRUE(balancer->request_history().empty());
}

TEST_F(LoadBalancerTest, LeastBusySpreadsOutstandingRequests)
{
    build(2);
    for (int i = 0; i < 4; ++i)
    {
        ASSERT_TRUE(balancer->route("r" + std::to_string(i), kPayload).is_ok());
    }
    EXPECT_EQ(coordinator->active_requests(ids[0]), 2u);
    EXPECT_EQ(coordinator->active_requests(ids[1]), 2u);
    EXPECT_EQ(balancer->active_requests().size(), 4u);
}

TEST_F(LoadBalancerTest, PerRequestStrategyOverride)
{
    build(3);
    std::string order;
    for (int i = 0; i < 3; ++i)
    {
        auto r = balancer->route("r" + std::to_string(i), kPayload, StrategyKind::RoundRobin);
        ASSERT_TRUE(r.is_ok());
        order += r.content() == ids[0] ? "A" : r.content() == ids[1] ? "B" : "C";
    }
    EXPECT_EQ(order, "ABC");
    const auto stats = balancer->routing_stats();
    EXPECT_EQ(stats.strategy_usage.at("round_robin"), 3u);
    EXPECT_EQ(stats.current_strategy, StrategyKind::LeastBusy);
}

TEST_F(LoadBalancerTest, InstanceFailureFailsItsActiveRequests)
{
    build(2);
    ASSERT_TRUE(balancer->route("r1", kPayload).is_ok());
    ASSERT_TRUE(balancer->route("r2", kPayload).is_ok());
    ASSERT_TRUE(balancer->route("r3", kPayload).is_ok());
    const auto on_first = coordinator->active_requests(ids[0]);

    EXPECT_EQ(balancer->handle_instance_failure(ids[0]), on_first);
    EXPECT_EQ(coordinator->active_requests(ids[0]), 0u);
    EXPECT_EQ(balancer->instance_performance(ids[0]).at(ids[0]).error_count, on_first);
    EXPECT_EQ(balancer->handle_instance_failure(ids[0]), 0u);

    EXPECT_EQ(balancer->cleanup(), 3u - on_first);
    EXPECT_TRUE(balancer->active_requests().empty());
    EXPECT_EQ(coordinator->counts().active_requests, 0u);
}

TEST_F(LoadBalancerTest, ConcurrentRoutingAndFailover)
{
    LoadBalancer::Config lb;
    lb.max_retries = 0; // no sleep hook calls from the router threads
    build(2, lb);

    constexpr int kThreads = 4;
    constexpr int kPerThread = 200;
    std::vector<std::thread> routers;
    for (int t = 0; t < kThreads; ++t)
    {
        routers.emplace_back(
            [this, t]
            {
                for (int i = 0; i < kPerThread; ++i)
                {
                    const auto id = "t" + std::to_string(t) + "-" + std::to_string(i);
                    if (balancer->route(id, kPayload).is_ok())
                    {
                        balancer->complete(id, true);
                    }
                }
            });
    }
    std::thread flipper(
        [this]
        {
            for (int i = 0; i < kPerThread; ++i)
            {
                coordinator->mark_unhealthy(ids[0]);
                balancer->handle_instance_failure(ids[0]);
                coordinator->mark_healthy(ids[0]);
            }
        });
    for (auto &r : routers)
        r.join();
    flipper.join();

    const auto stats = balancer->routing_stats();
    EXPECT_EQ(stats.total_requests, static_cast<std::uint64_t>(kThreads * kPerThread));
    EXPECT_EQ(stats.successful_routes + stats.failed_routes, stats.total_requests);
    EXPECT_TRUE(balancer->active_requests().empty());
    EXPECT_EQ(coordinator->counts().active_requests, 0u);
}

TEST_F(LoadBalancerTest, StrategyByName)
{
    build(1);
    balancer->set_strategy("response_time");
    EXPECT_EQ(balancer->strategy(), StrategyKind::ResponseTime);
    EXPECT_THROW(balancer->set_strategy("fastest"), std::invalid_argument);
    EXPECT_EQ(balancer->strategy(), StrategyKind::ResponseTime);

    const auto names = LoadBalancer::available_strategies();
    EXPECT_EQ(names.size(), 5u);
    EXPECT_NE(std::find(names.begin(), names.end(), "weighted_round_robin"), names.end());
}

TEST_F(LoadBalancerTest, LoadDistributionAndHistory)
{
    LoadBalancer::Config lb;
    lb.history_limit = 3;
    build(2, lb);

    for (int i = 0; i < 5; ++i)
    {
        const std::string rid = "r" + std::to_string(i);
        auto r = balancer->route(rid, kPayload, StrategyKind::RoundRobin);
        ASSERT_TRUE(r.is_ok());
        clock.advance(1s);
        ASSERT_TRUE(balancer->complete(rid, i != 4));
    }

    const auto history = balancer->request_history();
    ASSERT_EQ(history.size(), 3u);
    EXPECT_EQ(history.back().request_id, "r4");
    EXPECT_FALSE(history.back().success);
    EXPECT_EQ(balancer->request_history(1).size(), 1u);

    const auto dist = balancer->load_distribution();
    ASSERT_EQ(dist.size(), 2u);
    EXPECT_EQ(dist[0].instance_id, ids[0]);
    EXPECT_EQ(dist[0].total_requests, 3u);
    EXPECT_EQ(dist[0].error_count, 1u);
    EXPECT_NEAR(dist[0].success_rate, 2.0 / 3.0, 1e-9);
    EXPECT_EQ(dist[1].total_requests, 2u);
    EXPECT_DOUBLE_EQ(dist[1].success_rate, 1.0);

    balancer->reset_stats();
    EXPECT_TRUE(balancer->request_history().empty());
    EXPECT_TRUE(balancer->instance_performance().empty());
    EXPECT_EQ(balancer->routing_stats().total_requests, 0u);
}

TEST_F(LoadBalancerTest, RoutingStatsSerialize)
{
    build(1);
    ASSERT_TRUE(balancer->route("r1", kPayload).is_ok());
    const nlohmann::json j = balancer->routing_stats();
    EXPECT_EQ(j.at("total_requests"), 1);
    EXPECT_EQ(j.at("successful_routes"), 1);
    EXPECT_EQ(j.at("active_requests"), 1);
    EXPECT_EQ(j.at("current_strategy"), "least_busy");
    EXPECT_EQ(j.at("max_retries"), 3);
}
