/**
 * @file test_worker_instance.cpp
 * @brief Lifecycle tests for WorkerInstance through the FakeWorker double:
 *        initialization outcomes, probes, session expiry and cleanup.
 */
#include <chrono>
#include <memory>
#include <stdexcept>

#include "helpers/fake_worker.h"
#include "gtest/gtest.h"

using namespace workerpool;
using namespace workerpool::pool;
using workerpool::test::FakeBehavior;
using workerpool::test::FakeWorker;
using workerpool::test::ManualClock;
using namespace std::chrono_literals;

namespace
{

class WorkerInstanceTest : public ::testing::Test
{
  protected:
    std::shared_ptr<FakeWorker> make(InstanceConfig cfg = {})
    {
        cfg.clock = clock.fn();
        return std::make_shared<FakeWorker>("INST-TEST-00000001", cfg, behavior);
    }

    ManualClock clock;
    std::shared_ptr<FakeBehavior> behavior = std::make_shared<FakeBehavior>();
};

} // namespace

TEST_F(WorkerInstanceTest, StartsInitializingAndBecomesReady)
{
    auto w = make();
    EXPECT_EQ(w->status(), InstanceStatus::Initializing);
    EXPECT_FALSE(w->health_check());

    EXPECT_TRUE(w->initialize());
    EXPECT_EQ(w->status(), InstanceStatus::Ready);
    EXPECT_TRUE(w->health_check());
    EXPECT_EQ(behavior->probes.load(), 1);
}

TEST_F(WorkerInstanceTest, FailedSetupFallsBackToDegraded)
{
    behavior->init_ok = false;
    behavior->degraded_ok = true;
    auto w = make();
    EXPECT_TRUE(w->initialize());
    EXPECT_EQ(w->status(), InstanceStatus::ReadyDegraded);
    EXPECT_TRUE(is_serviceable(w->status()));
    EXPECT_TRUE(w->send("hello"));
}

TEST_F(WorkerInstanceTest, FailedSetupWithoutDegradedModeIsFailed)
{
    behavior->init_ok = false;
    auto w = make();
    EXPECT_FALSE(w->initialize());
    EXPECT_EQ(w->status(), InstanceStatus::Failed);
    EXPECT_FALSE(w->send("hello"));
    EXPECT_FALSE(w->health_check());
    // Only cleanup releases resources.
    EXPECT_EQ(behavior->releases.load(), 0);
}

TEST_F(WorkerInstanceTest, ProbeExceptionPropagates)
{
    auto w = make();
    ASSERT_TRUE(w->initialize());
    behavior->probe_throws = true;
    EXPECT_THROW(w->health_check(), std::runtime_error);
    EXPECT_EQ(w->status(), InstanceStatus::Ready);
}

TEST_F(WorkerInstanceTest, RequestCountExpiryRegeneratesSession)
{
    InstanceConfig cfg;
    cfg.max_requests_per_session = 3;
    auto w = make(cfg);
    ASSERT_TRUE(w->initialize());

    for (int i = 0; i < 3; ++i)
    {
        ASSERT_TRUE(w->send("work"));
    }
    EXPECT_EQ(w->request_count(), 3u);
    EXPECT_TRUE(w->session_expired());

    EXPECT_TRUE(w->health_check());
    EXPECT_EQ(behavior->regenerations.load(), 1);
    EXPECT_EQ(w->request_count(), 0u);
    EXPECT_EQ(w->status(), InstanceStatus::Ready);
    EXPECT_FALSE(w->session_expired());
}

TEST_F(WorkerInstanceTest, LifetimeExpiryUsesInjectedClock)
{
    InstanceConfig cfg;
    cfg.session_lifetime = 60s;
    auto w = make(cfg);
    ASSERT_TRUE(w->initialize());
    EXPECT_FALSE(w->session_expired());

    clock.advance(61s);
    EXPECT_TRUE(w->session_expired());
    EXPECT_TRUE(w->status_snapshot().session_expired);
    EXPECT_TRUE(w->health_check());
    EXPECT_EQ(behavior->regenerations.load(), 1);
    EXPECT_FALSE(w->session_expired());
}

TEST_F(WorkerInstanceTest, FailedRegenerationReportsUnhealthyButStaysReady)
{
    InstanceConfig cfg;
    cfg.max_requests_per_session = 1;
    auto w = make(cfg);
    ASSERT_TRUE(w->initialize());
    ASSERT_TRUE(w->send("work"));

    behavior->regenerate_ok = false;
    EXPECT_FALSE(w->health_check());
    EXPECT_EQ(w->status(), InstanceStatus::Ready);
    EXPECT_EQ(w->request_count(), 1u);
}

TEST_F(WorkerInstanceTest, DegradedInstanceSkipsExpiry)
{
    behavior->init_ok = false;
    behavior->degraded_ok = true;
    InstanceConfig cfg;
    cfg.max_requests_per_session = 1;
    auto w = make(cfg);
    ASSERT_TRUE(w->initialize());
    ASSERT_TRUE(w->send("work"));

    EXPECT_TRUE(w->health_check());
    EXPECT_EQ(behavior->regenerations.load(), 0);
    EXPECT_EQ(w->status(), InstanceStatus::ReadyDegraded);
}

TEST_F(WorkerInstanceTest, CleanupIsIdempotent)
{
    auto w = make();
    ASSERT_TRUE(w->initialize());
    w->cleanup();
    w->cleanup();
    EXPECT_EQ(w->status(), InstanceStatus::Removed);
    EXPECT_EQ(behavior->releases.load(), 1);
    EXPECT_FALSE(w->send("late"));
    EXPECT_FALSE(w->health_check());
}

TEST_F(WorkerInstanceTest, SnapshotReportsAges)
{
    auto w = make();
    ASSERT_TRUE(w->initialize());
    clock.advance(10s);
    ASSERT_TRUE(w->send("work"));
    clock.advance(5s);

    const auto snap = w->status_snapshot();
    EXPECT_EQ(snap.instance_id, "INST-TEST-00000001");
    EXPECT_EQ(snap.status, InstanceStatus::Ready);
    EXPECT_DOUBLE_EQ(snap.created_at_age, 15.0);
    EXPECT_DOUBLE_EQ(snap.last_activity_age, 5.0);
    EXPECT_EQ(snap.request_count, 1u);

    const nlohmann::json j = snap;
    EXPECT_EQ(j.at("status"), "ready");
    EXPECT_EQ(j.at("request_count"), 1);
    EXPECT_DOUBLE_EQ(j.at("created_at_age").get<double>(), 15.0);
    EXPECT_DOUBLE_EQ(j.at("last_activity_age").get<double>(), 5.0);
}
