/**
 * @file test_instance_registry.cpp
 * @brief InstanceRegistry: capacity bound, failed creation cleanup and
 *        creation-order bookkeeping.
 */
#include <atomic>
#include <regex>
#include <stdexcept>
#include <thread>
#include <vector>

#include "helpers/fake_worker.h"
#include "gtest/gtest.h"

using namespace workerpool::pool;
using workerpool::test::FakeWorkerFactory;

TEST(InstanceRegistryTest, RejectsEmptyFactory)
{
    EXPECT_THROW(InstanceRegistry(InstanceFactory{}, InstanceConfig{}, 3), std::invalid_argument);
}

TEST(InstanceRegistryTest, CreateStopsAtMaxInstances)
{
    FakeWorkerFactory factory;
    InstanceRegistry registry(factory.make(), InstanceConfig{}, 2);

    EXPECT_TRUE(registry.create().has_value());
    EXPECT_TRUE(registry.create().has_value());
    EXPECT_FALSE(registry.create().has_value());
    EXPECT_EQ(registry.size(), 2u);
    EXPECT_EQ(factory.built.load(), 2);
}

TEST(InstanceRegistryTest, ConcurrentCreatesNeverOvershoot)
{
    FakeWorkerFactory factory;
    InstanceRegistry registry(factory.make(), InstanceConfig{}, 3);

    std::atomic<int> created{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i)
    {
        threads.emplace_back(
            [&]
            {
                if (registry.create())
                    ++created;
            });
    }
    for (auto &t : threads)
        t.join();

    EXPECT_EQ(created.load(), 3);
    EXPECT_EQ(registry.size(), 3u);
    EXPECT_EQ(registry.pending(), 0u);
}

TEST(InstanceRegistryTest, FailedInitializeReleasesSlotAndCleansUp)
{
    FakeWorkerFactory factory;
    InstanceRegistry registry(factory.make(), InstanceConfig{}, 1);

    factory.next_init_ok = false;
    EXPECT_FALSE(registry.create().has_value());
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_EQ(registry.pending(), 0u);

    const auto ids = factory.ids();
    ASSERT_EQ(ids.size(), 1u);
    EXPECT_EQ(factory.behavior(ids[0])->releases.load(), 1);

    // The slot is free again.
    EXPECT_TRUE(registry.create().has_value());
}

TEST(InstanceRegistryTest, ThrowingFactoryIsAFailedCreate)
{
    InstanceRegistry registry(
        [](const std::string &, const InstanceConfig &) -> std::shared_ptr<WorkerInstance>
        { throw std::runtime_error("no browser"); },
        InstanceConfig{}, 2);
    EXPECT_FALSE(registry.create().has_value());
    EXPECT_EQ(registry.pending(), 0u);
}

TEST(InstanceRegistryTest, IdsAndSequenceFollowCreationOrder)
{
    FakeWorkerFactory factory;
    InstanceConfig defaults;
    defaults.label = "browser";
    InstanceRegistry registry(factory.make(), defaults, 5);

    const auto a = registry.create();
    const auto b = registry.create();
    const auto c = registry.create();
    ASSERT_TRUE(a && b && c);
    EXPECT_TRUE(std::regex_match(*a, std::regex("^INST-BROWSER-[0-9A-F]{8}$")));

    EXPECT_LT(*registry.sequence_of(*a), *registry.sequence_of(*b));
    EXPECT_LT(*registry.sequence_of(*b), *registry.sequence_of(*c));

    ASSERT_TRUE(registry.destroy(*b));
    EXPECT_FALSE(registry.destroy(*b));
    const auto snap = registry.snapshot();
    ASSERT_EQ(snap.size(), 2u);
    EXPECT_EQ(snap[0].instance->id(), *a);
    EXPECT_EQ(snap[1].instance->id(), *c);
    EXPECT_EQ(factory.behavior(*b)->releases.load(), 1);
}

TEST(InstanceRegistryTest, ClearCleansEveryInstance)
{
    FakeWorkerFactory factory;
    InstanceRegistry registry(factory.make(), InstanceConfig{}, 4);
    ASSERT_TRUE(registry.create());
    ASSERT_TRUE(registry.create());

    EXPECT_EQ(registry.clear().size(), 2u);
    EXPECT_EQ(registry.size(), 0u);
    for (const auto &id : factory.ids())
    {
        EXPECT_EQ(factory.behavior(id)->releases.load(), 1) << id;
    }
}
