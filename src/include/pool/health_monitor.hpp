#pragma once
/**
 * @file health_monitor.hpp
 * @brief Periodic health probing of every pool instance.
 *
 * Each cycle:
 *  1. Fans out one probe per registered instance, each on its own thread and
 *     bounded by instance_timeout. A probe that has not resolved by then is a
 *     failure; its thread is left to finish and the instance is not probed
 *     again until it does (every cycle in between counts as a failure).
 *  2. Applies results in the order they resolve: mark_healthy/mark_unhealthy
 *     on the coordinator, history, and instance_recovered / instance_failed
 *     alerts on the corresponding membership edges only.
 *  3. Computes failure rate, average response time and probe error rate and
 *     raises threshold alerts; no_healthy_instances when nothing is healthy.
 *  4. Retires instances that kept failing, then asks the coordinator for
 *     enough replacements to reach min_instances.
 *  5. Lets the coordinator evaluate autoscaling and purges old history.
 *
 * The background loop never dies from a cycle error: it logs, pauses and
 * starts the next cycle.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "pool/alert_channel.hpp"
#include "pool/clock.hpp"
#include "pool/instance_coordinator.hpp"
#include "workerpool_export.h"

namespace workerpool::pool
{

class HealthMonitorImpl;

struct AlertThresholds
{
    double response_time{10.0};        ///< Seconds.
    double error_rate{0.1};            ///< Fraction of probes that raised an error.
    double instance_failure_rate{0.2}; ///< |unhealthy| / total.
};

struct HealthCheckResult
{
    std::string instance_id;
    std::chrono::system_clock::time_point timestamp;
    Clock::time_point checked_at;
    bool healthy{false};
    double response_time{0.0};
    std::string error; ///< Empty unless the probe threw or timed out.
};

struct SystemHealthSample
{
    std::chrono::system_clock::time_point timestamp;
    Clock::time_point checked_at;
    std::size_t total_instances{0};
    std::size_t healthy_instances{0};
    std::size_t unhealthy_instances{0};
    double failure_rate{0.0};
    double avg_response_time{0.0};
    double error_rate{0.0};
};

struct HealthStats
{
    std::uint64_t cycles{0};
    std::uint64_t total_health_checks{0};
    std::uint64_t failed_health_checks{0};
    std::uint64_t instances_recovered{0};
    std::uint64_t instances_failed{0};
    std::uint64_t instances_retired{0};
    std::uint64_t instances_replaced{0};
    std::uint64_t loop_errors{0};
};

WORKERPOOL_EXPORT void to_json(nlohmann::json &j, const HealthCheckResult &r);
WORKERPOOL_EXPORT void to_json(nlohmann::json &j, const SystemHealthSample &s);
WORKERPOOL_EXPORT void to_json(nlohmann::json &j, const HealthStats &s);

class WORKERPOOL_EXPORT HealthMonitor
{
  public:
    struct Config
    {
        std::chrono::milliseconds health_check_interval{10000};
        std::chrono::milliseconds instance_timeout{30000};
        AlertThresholds thresholds;
        std::chrono::hours history_retention{24};
        std::size_t history_limit{100}; ///< Per instance.
        std::size_t system_history_limit{1000};
        /// Successful checks per instance averaged for response time.
        std::size_t response_time_window{10};
        /// Unhealthy instances are retired after this many consecutive
        /// failed probes. 0 disables retirement.
        std::size_t retire_after_failures{3};
        /// First pause after a failed cycle; doubles up to 6x on repeats.
        std::chrono::milliseconds restart_pause{5000};
        ClockFn clock;
    };

    HealthMonitor(InstanceCoordinator &coordinator, AlertChannel &alerts, Config cfg);
    ~HealthMonitor();

    HealthMonitor(const HealthMonitor &) = delete;
    HealthMonitor &operator=(const HealthMonitor &) = delete;

    /// Start the background loop; the first cycle runs immediately.
    void start();
    /// Stop and join the loop. Outstanding probe threads are not waited for.
    void stop();
    [[nodiscard]] bool is_running() const noexcept;

    /// Run one full cycle on the calling thread.
    void run_cycle();

    /**
     * @brief Wait up to @p timeout for probes that outlived their cycle.
     *
     * Call after stop() and before cleaning up instances, so no instance is
     * released while its probe is still executing.
     *
     * @return Number of probes still running when the wait ended.
     */
    std::size_t drain_outstanding(std::chrono::milliseconds timeout);

    /// Timed-out probes not yet collected by a later cycle or a drain.
    [[nodiscard]] std::size_t pending_probes() const;

    [[nodiscard]] HealthStats stats() const;
    [[nodiscard]] nlohmann::json get_health_status() const;
    [[nodiscard]] std::vector<HealthCheckResult>
    get_instance_health_history(const std::string &instance_id, std::size_t limit = 50) const;
    [[nodiscard]] std::vector<SystemHealthSample>
    get_system_health_history(std::size_t limit = 100) const;
    [[nodiscard]] nlohmann::json get_metrics_summary() const;

  private:
#if defined(_MSC_VER)
#pragma warning(suppress : 4251)
#endif
    std::unique_ptr<HealthMonitorImpl> pImpl;
};

} // namespace workerpool::pool
