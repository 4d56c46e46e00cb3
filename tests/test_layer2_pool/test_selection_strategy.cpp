/**
 * @file test_selection_strategy.cpp
 * @brief Selection strategies over fixed candidate lists.
 */
#include <map>
#include <string>

#include "wkp_pool.hpp"
#include "gtest/gtest.h"

using namespace workerpool::pool;

namespace
{

Candidates three(std::size_t a, std::size_t b, std::size_t c)
{
    return {Candidate{"A", 1, a, std::nullopt}, Candidate{"B", 2, b, std::nullopt},
            Candidate{"C", 3, c, std::nullopt}};
}

} // namespace

TEST(SelectionStrategyTest, NamesRoundTrip)
{
    for (auto kind : kAllStrategies)
    {
        const auto parsed = strategy_from_string(to_string(kind));
        ASSERT_TRUE(parsed.has_value()) << to_string(kind);
        EXPECT_EQ(*parsed, kind);
        EXPECT_EQ(kind_of(make_strategy(kind)), kind);
    }
    EXPECT_EQ(strategy_from_string("least_busy"), StrategyKind::LeastBusy);
    EXPECT_FALSE(strategy_from_string("fastest").has_value());
}

TEST(SelectionStrategyTest, EmptyCandidatesSelectNothing)
{
    for (auto kind : kAllStrategies)
    {
        auto s = make_strategy(kind, 7);
        EXPECT_FALSE(select_from(s, {}).has_value()) << to_string(kind);
    }
}

TEST(SelectionStrategyTest, RoundRobinVisitsEachThreeTimesInOrder)
{
    const auto candidates = three(0, 0, 0);
    auto s = make_strategy(StrategyKind::RoundRobin);
    std::string order;
    for (int i = 0; i < 9; ++i)
    {
        order += *select_from(s, candidates);
    }
    EXPECT_EQ(order, "ABCABCABC");
}

TEST(SelectionStrategyTest, LeastBusyPicksMinimum)
{
    auto s = make_strategy(StrategyKind::LeastBusy);
    EXPECT_EQ(select_from(s, three(4, 1, 2)), "B");
    EXPECT_EQ(select_from(s, three(3, 3, 0)), "C");
}

TEST(SelectionStrategyTest, LeastBusyTieGoesToEarliestCreated)
{
    auto s = make_strategy(StrategyKind::LeastBusy);
    EXPECT_EQ(select_from(s, three(2, 1, 1)), "B");

    // Order in the list does not matter, only the creation sequence.
    Candidates shuffled = {Candidate{"late", 9, 0, std::nullopt},
                           Candidate{"early", 4, 0, std::nullopt}};
    EXPECT_EQ(select_from(s, shuffled), "early");
}

TEST(SelectionStrategyTest, ResponseTimeRanksUnseenLast)
{
    auto s = make_strategy(StrategyKind::ResponseTime);
    Candidates c = three(0, 0, 0);
    c[0].avg_response_time = 3.0;
    c[2].avg_response_time = 1.5;
    EXPECT_EQ(select_from(s, c), "C");

    Candidates none = three(0, 0, 0);
    EXPECT_EQ(select_from(s, none), "A");
}

TEST(SelectionStrategyTest, RandomOnlyPicksCandidates)
{
    auto s = make_strategy(StrategyKind::Random, 42);
    const auto c = three(0, 0, 0);
    std::map<std::string, int> hits;
    for (int i = 0; i < 300; ++i)
    {
        ++hits[*select_from(s, c)];
    }
    EXPECT_EQ(hits.size(), 3u);
    EXPECT_EQ(hits["A"] + hits["B"] + hits["C"], 300);
}

TEST(SelectionStrategyTest, WeightedFavoursFasterInstances)
{
    auto s = make_strategy(StrategyKind::WeightedRoundRobin, 1234);
    Candidates c = {Candidate{"fast", 1, 0, 0.1}, Candidate{"slow", 2, 0, 10.0}};
    std::map<std::string, int> hits;
    for (int i = 0; i < 2000; ++i)
    {
        ++hits[*select_from(s, c)];
    }
    // Weights 10 and 0.1: "slow" should be picked about 1% of the time.
    EXPECT_GT(hits["fast"], 1800);
    EXPECT_LT(hits["slow"], 200);
}

TEST(SelectionStrategyTest, WeightedTreatsUnseenAsOneSecond)
{
    auto s = make_strategy(StrategyKind::WeightedRoundRobin, 99);
    Candidates c = {Candidate{"unseen", 1, 0, std::nullopt}, Candidate{"known", 2, 0, 1.0}};
    std::map<std::string, int> hits;
    for (int i = 0; i < 4000; ++i)
    {
        ++hits[*select_from(s, c)];
    }
    EXPECT_GT(hits["unseen"], 1600);
    EXPECT_GT(hits["known"], 1600);
}
