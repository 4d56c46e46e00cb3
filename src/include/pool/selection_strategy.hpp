#pragma once
/**
 * @file selection_strategy.hpp
 * @brief Instance selection strategies for the load balancer.
 *
 * The strategy set is closed: one type per strategy, held in the
 * SelectionStrategy variant and dispatched with std::visit, so adding a
 * strategy is a compile error everywhere a switch is not exhaustive.
 *
 * Every strategy is a selection over a candidate list that the coordinator
 * builds from its healthy set, ordered by creation sequence. Strategies never
 * see or touch coordinator state directly.
 */

#include <array>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "workerpool_export.h"

namespace workerpool::pool
{

enum class StrategyKind
{
    RoundRobin,
    LeastBusy,
    ResponseTime,
    Random,
    WeightedRoundRobin,
};

inline constexpr std::array<StrategyKind, 5> kAllStrategies = {
    StrategyKind::RoundRobin, StrategyKind::LeastBusy, StrategyKind::ResponseTime,
    StrategyKind::Random, StrategyKind::WeightedRoundRobin};

WORKERPOOL_EXPORT const char *to_string(StrategyKind kind) noexcept;
WORKERPOOL_EXPORT std::optional<StrategyKind> strategy_from_string(std::string_view name) noexcept;

/// One healthy instance as seen by a strategy.
struct Candidate
{
    std::string instance_id;
    uint64_t sequence{0};
    std::size_t active_requests{0};
    std::optional<double> avg_response_time; ///< Seconds; empty until the first completion.
};

using Candidates = std::vector<Candidate>;

/// Cyclic over the candidate list; the counter persists across calls.
class WORKERPOOL_EXPORT RoundRobinStrategy
{
  public:
    std::optional<std::string> select(const Candidates &candidates);

  private:
    std::size_t m_counter{0};
};

/// Fewest active requests; ties go to the earliest-created instance.
class WORKERPOOL_EXPORT LeastBusyStrategy
{
  public:
    std::optional<std::string> select(const Candidates &candidates);
};

/// Lowest average response time. Instances without data rank last.
class WORKERPOOL_EXPORT ResponseTimeStrategy
{
  public:
    std::optional<std::string> select(const Candidates &candidates);
};

class WORKERPOOL_EXPORT RandomStrategy
{
  public:
    RandomStrategy();
    explicit RandomStrategy(uint32_t seed);
    std::optional<std::string> select(const Candidates &candidates);

  private:
    std::mt19937 m_engine;
};

/**
 * @brief Random pick weighted by 1 / max(avg_response_time, epsilon).
 *
 * Instances without data are weighted as if their average were 1 second.
 */
class WORKERPOOL_EXPORT WeightedRoundRobinStrategy
{
  public:
    static constexpr double kEpsilon = 0.1;
    static constexpr double kDefaultAverage = 1.0;

    WeightedRoundRobinStrategy();
    explicit WeightedRoundRobinStrategy(uint32_t seed);
    std::optional<std::string> select(const Candidates &candidates);

  private:
    std::mt19937 m_engine;
};

using SelectionStrategy = std::variant<RoundRobinStrategy, LeastBusyStrategy, ResponseTimeStrategy,
                                       RandomStrategy, WeightedRoundRobinStrategy>;

WORKERPOOL_EXPORT SelectionStrategy make_strategy(StrategyKind kind);
WORKERPOOL_EXPORT SelectionStrategy make_strategy(StrategyKind kind, uint32_t seed);
WORKERPOOL_EXPORT StrategyKind kind_of(const SelectionStrategy &strategy) noexcept;
WORKERPOOL_EXPORT std::optional<std::string> select_from(SelectionStrategy &strategy,
                                                         const Candidates &candidates);

} // namespace workerpool::pool
