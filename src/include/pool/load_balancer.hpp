#pragma once
/**
 * @file load_balancer.hpp
 * @brief Routes requests to healthy instances and tracks per-instance
 *        performance.
 *
 * The balancer owns the active-request records, performance records and
 * request history. Instance membership is read from the coordinator on every
 * attempt, never cached: the Health Monitor may change it between two
 * attempts of the same route() call.
 *
 * Lock order: strategy lock, then the balancer's own lock, then the
 * coordinator's lock, then the registry's. route() holds the balancer lock
 * across InstanceCoordinator::try_assign(); the coordinator never calls back
 * into the balancer.
 */

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "pool/clock.hpp"
#include "pool/instance_coordinator.hpp"
#include "pool/selection_strategy.hpp"
#include "utils/result.hpp"
#include "workerpool_export.h"

namespace workerpool::pool
{

enum class RouteError
{
    NoHealthyInstance, ///< No candidate on any attempt.
    RetriesExhausted,  ///< Candidates existed but none passed validation.
    DuplicateRequest,  ///< request_id is already active.
};

/// Excuse message suitable for the caller's error response.
WORKERPOOL_EXPORT const char *to_string(RouteError err) noexcept;

using RouteResult = utils::Result<std::string, RouteError>;

struct ActiveRequest
{
    std::string request_id;
    std::string instance_id;
    Clock::time_point start_time;
    std::size_t payload_size{0};
};

struct PerformanceRecord
{
    std::size_t requests{0};
    double total_response_time{0.0};
    double avg_response_time{0.0};
    std::size_t success_count{0};
    std::size_t error_count{0};
    std::optional<std::chrono::system_clock::time_point> last_request_time;
};

struct RequestHistoryEntry
{
    std::string request_id;
    std::string instance_id;
    double response_time{0.0};
    bool success{false};
    std::size_t response_size{0};
    std::chrono::system_clock::time_point timestamp;
};

struct RoutingStats
{
    std::uint64_t total_requests{0};
    std::uint64_t successful_routes{0};
    std::uint64_t failed_routes{0};
    std::uint64_t retries{0};
    std::map<std::string, std::uint64_t> strategy_usage;
    std::size_t active_requests{0};
    StrategyKind current_strategy{StrategyKind::LeastBusy};
    int max_retries{0};
};

struct LoadShare
{
    std::string instance_id;
    std::size_t active_requests{0};
    std::size_t total_requests{0};
    double avg_response_time{0.0};
    double success_rate{0.0};
    std::size_t error_count{0};
};

WORKERPOOL_EXPORT void to_json(nlohmann::json &j, const PerformanceRecord &r);
WORKERPOOL_EXPORT void to_json(nlohmann::json &j, const RequestHistoryEntry &e);
WORKERPOOL_EXPORT void to_json(nlohmann::json &j, const RoutingStats &s);
WORKERPOOL_EXPORT void to_json(nlohmann::json &j, const LoadShare &s);

class WORKERPOOL_EXPORT LoadBalancer
{
  public:
    struct Config
    {
        StrategyKind default_strategy{StrategyKind::LeastBusy};
        int max_retries{3};
        /// Base wait between attempts. An empty selection waits
        /// retry_delay * (attempt + 1); a failed validation waits retry_delay.
        std::chrono::milliseconds retry_delay{1000};
        std::size_t history_limit{1000};
        /// Seed for the random strategies; empty draws from random_device.
        std::optional<uint32_t> random_seed;
        ClockFn clock;
        /// Replaces std::this_thread::sleep_for between attempts.
        std::function<void(std::chrono::milliseconds)> sleep;
    };

    LoadBalancer(InstanceCoordinator &coordinator, Config cfg);
    ~LoadBalancer();

    LoadBalancer(const LoadBalancer &) = delete;
    LoadBalancer &operator=(const LoadBalancer &) = delete;

    /**
     * @brief Pick an instance for @p request_id and record it as active.
     *
     * Up to max_retries + 1 attempts. Each attempt selects with @p strategy
     * (or the current default), then asks the coordinator to bind the request
     * to that instance, which rechecks membership and readiness.
     */
    RouteResult route(const std::string &request_id, const nlohmann::json &payload,
                      std::optional<StrategyKind> strategy = std::nullopt);

    /**
     * @brief Finish an active request and fold its timing into the instance's
     *        performance record.
     * @return false if @p request_id is not active.
     */
    bool complete(const std::string &request_id, bool success, std::size_t response_size = 0);

    /// Fail every active request bound to @p instance_id. Returns the count.
    std::size_t handle_instance_failure(const std::string &instance_id);

    void set_strategy(StrategyKind kind);
    /// @throws std::invalid_argument for an unknown name.
    void set_strategy(const std::string &name);
    [[nodiscard]] StrategyKind strategy() const;
    [[nodiscard]] static std::vector<std::string> available_strategies();

    [[nodiscard]] RoutingStats routing_stats() const;
    /// All records, or only @p instance_id's when given (empty if unknown).
    [[nodiscard]] std::map<std::string, PerformanceRecord>
    instance_performance(const std::optional<std::string> &instance_id = std::nullopt) const;
    /// One entry per healthy instance, in creation order.
    [[nodiscard]] std::vector<LoadShare> load_distribution() const;
    /// Most recent entries last; at most @p limit of them.
    [[nodiscard]] std::vector<RequestHistoryEntry> request_history(std::size_t limit = 100) const;
    [[nodiscard]] std::vector<ActiveRequest> active_requests() const;
    [[nodiscard]] std::optional<double> average_response_time(const std::string &instance_id) const;

    void reset_stats();

    /// Fail every active request. Returns the count.
    std::size_t cleanup();

  private:
    std::optional<std::string> select_candidate(StrategyKind kind);
    void wait(std::chrono::milliseconds delay) const;
    void record_completion(const ActiveRequest &req, double elapsed, bool success,
                           std::size_t response_size);

    InstanceCoordinator &m_coordinator;
    const Config m_cfg;

    mutable std::mutex m_strategy_mu;
    std::array<SelectionStrategy, kAllStrategies.size()> m_strategies;
    StrategyKind m_current;

    mutable std::mutex m_mu;
    std::unordered_map<std::string, ActiveRequest> m_active;
    std::unordered_map<std::string, PerformanceRecord> m_performance;
    std::deque<RequestHistoryEntry> m_history;
    RoutingStats m_stats;
};

} // namespace workerpool::pool
