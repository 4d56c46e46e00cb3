#include "pool/selection_strategy.hpp"

#include <algorithm>
#include <limits>
#include <type_traits>

namespace workerpool::pool
{

const char *to_string(StrategyKind kind) noexcept
{
    switch (kind)
    {
    case StrategyKind::RoundRobin:
        return "round_robin";
    case StrategyKind::LeastBusy:
        return "least_busy";
    case StrategyKind::ResponseTime:
        return "response_time";
    case StrategyKind::Random:
        return "random";
    case StrategyKind::WeightedRoundRobin:
        return "weighted_round_robin";
    }
    return "unknown";
}

std::optional<StrategyKind> strategy_from_string(std::string_view name) noexcept
{
    for (auto kind : kAllStrategies)
    {
        if (name == to_string(kind))
        {
            return kind;
        }
    }
    return std::nullopt;
}

namespace
{

// Candidates arrive in creation order, but do not rely on it for tie-breaks.
bool earlier(const Candidate &a, const Candidate &b)
{
    return a.sequence < b.sequence;
}

uint32_t fresh_seed()
{
    std::random_device rd;
    return rd();
}

} // namespace

std::optional<std::string> RoundRobinStrategy::select(const Candidates &candidates)
{
    if (candidates.empty())
    {
        return std::nullopt;
    }
    const auto &picked = candidates[m_counter % candidates.size()];
    ++m_counter;
    return picked.instance_id;
}

std::optional<std::string> LeastBusyStrategy::select(const Candidates &candidates)
{
    auto it = std::min_element(candidates.begin(), candidates.end(),
                               [](const Candidate &a, const Candidate &b)
                               {
                                   if (a.active_requests != b.active_requests)
                                       return a.active_requests < b.active_requests;
                                   return earlier(a, b);
                               });
    if (it == candidates.end())
    {
        return std::nullopt;
    }
    return it->instance_id;
}

std::optional<std::string> ResponseTimeStrategy::select(const Candidates &candidates)
{
    static constexpr double kUnseen = std::numeric_limits<double>::infinity();
    auto it = std::min_element(candidates.begin(), candidates.end(),
                               [](const Candidate &a, const Candidate &b)
                               {
                                   const double av = a.avg_response_time.value_or(kUnseen);
                                   const double bv = b.avg_response_time.value_or(kUnseen);
                                   if (av != bv)
                                       return av < bv;
                                   return earlier(a, b);
                               });
    if (it == candidates.end())
    {
        return std::nullopt;
    }
    return it->instance_id;
}

RandomStrategy::RandomStrategy() : m_engine(fresh_seed()) {}

RandomStrategy::RandomStrategy(uint32_t seed) : m_engine(seed) {}

std::optional<std::string> RandomStrategy::select(const Candidates &candidates)
{
    if (candidates.empty())
    {
        return std::nullopt;
    }
    std::uniform_int_distribution<std::size_t> dist(0, candidates.size() - 1);
    return candidates[dist(m_engine)].instance_id;
}

WeightedRoundRobinStrategy::WeightedRoundRobinStrategy() : m_engine(fresh_seed()) {}

WeightedRoundRobinStrategy::WeightedRoundRobinStrategy(uint32_t seed) : m_engine(seed) {}

std::optional<std::string> WeightedRoundRobinStrategy::select(const Candidates &candidates)
{
    if (candidates.empty())
    {
        return std::nullopt;
    }
    std::vector<double> weights;
    weights.reserve(candidates.size());
    for (const auto &c : candidates)
    {
        weights.push_back(1.0 / std::max(c.avg_response_time.value_or(kDefaultAverage), kEpsilon));
    }
    // discrete_distribution normalizes the weights.
    std::discrete_distribution<std::size_t> dist(weights.begin(), weights.end());
    return candidates[dist(m_engine)].instance_id;
}

SelectionStrategy make_strategy(StrategyKind kind)
{
    switch (kind)
    {
    case StrategyKind::RoundRobin:
        return RoundRobinStrategy{};
    case StrategyKind::LeastBusy:
        return LeastBusyStrategy{};
    case StrategyKind::ResponseTime:
        return ResponseTimeStrategy{};
    case StrategyKind::Random:
        return RandomStrategy{};
    case StrategyKind::WeightedRoundRobin:
        return WeightedRoundRobinStrategy{};
    }
    return LeastBusyStrategy{};
}

SelectionStrategy make_strategy(StrategyKind kind, uint32_t seed)
{
    switch (kind)
    {
    case StrategyKind::Random:
        return RandomStrategy{seed};
    case StrategyKind::WeightedRoundRobin:
        return WeightedRoundRobinStrategy{seed};
    default:
        return make_strategy(kind);
    }
}

StrategyKind kind_of(const SelectionStrategy &strategy) noexcept
{
    return std::visit(
        [](const auto &s)
        {
            using T = std::decay_t<decltype(s)>;
            if constexpr (std::is_same_v<T, RoundRobinStrategy>)
                return StrategyKind::RoundRobin;
            else if constexpr (std::is_same_v<T, LeastBusyStrategy>)
                return StrategyKind::LeastBusy;
            else if constexpr (std::is_same_v<T, ResponseTimeStrategy>)
                return StrategyKind::ResponseTime;
            else if constexpr (std::is_same_v<T, RandomStrategy>)
                return StrategyKind::Random;
            else
                return StrategyKind::WeightedRoundRobin;
        },
        strategy);
}

std::optional<std::string> select_from(SelectionStrategy &strategy, const Candidates &candidates)
{
    return std::visit([&candidates](auto &s) { return s.select(candidates); }, strategy);
}

} // namespace workerpool::pool
