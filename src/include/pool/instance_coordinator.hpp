#pragma once
/**
 * @file instance_coordinator.hpp
 * @brief Owner of the pool: registry, healthy/unhealthy membership, request
 *        assignments and autoscaling policy.
 *
 * The coordinator is the only writer of membership and assignment state. The
 * Health Monitor and Load Balancer request changes through its methods; every
 * method applies its change as one step under the coordinator lock, and
 * anything that may block (instance initialize, cleanup, strategy selection)
 * runs with the lock released.
 *
 * Membership invariant: a registered instance is in exactly one of
 * healthy/unhealthy, except between creation and its first probe result, and
 * while it is being removed.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <nlohmann/json.hpp>

#include "pool/clock.hpp"
#include "pool/instance_registry.hpp"
#include "pool/selection_strategy.hpp"
#include "workerpool_export.h"

namespace workerpool::pool
{

/// Thrown by bootstrap() when no instance could be created.
class WORKERPOOL_EXPORT PoolBootstrapError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

struct CoordinatorConfig
{
    std::size_t min_instances{1};
    std::size_t max_instances{5};
    std::size_t initial_count{1};
    bool auto_scale{true};
    double scale_up_threshold{0.8};
    double scale_down_threshold{0.3};
    std::chrono::seconds scale_cooldown{60};
    InstanceConfig instance_defaults;
    ClockFn clock;
};

/// Outcome of a membership update.
enum class Transition
{
    Admitted,  ///< First successful probe of a new instance.
    Recovered, ///< unhealthy -> healthy
    Failed,    ///< healthy -> unhealthy
    Excluded,  ///< New instance failed its first probe.
    Unchanged, ///< Already in the requested set.
    Unknown,   ///< Not registered, or being removed.
};

enum class AssignResult
{
    Assigned,
    Duplicate,   ///< request_id is already active.
    NotEligible, ///< Instance no longer healthy or not ready.
};

enum class ScaleAction
{
    None,
    Disabled,
    Cooldown,
    ScaledUp,
    ScaledDown,
    ScaleUpFailed,
    ScaleDownDeferred, ///< Target still has active requests.
};

WORKERPOOL_EXPORT const char *to_string(Transition t) noexcept;
WORKERPOOL_EXPORT const char *to_string(ScaleAction a) noexcept;

struct PoolCounts
{
    std::size_t total{0};
    std::size_t healthy{0};
    std::size_t unhealthy{0};
    std::size_t unadmitted{0}; ///< Registered, no probe result yet.
    std::size_t pending{0};    ///< Creations in progress.
    std::size_t active_requests{0};
};

struct ScalingResult
{
    ScaleAction action{ScaleAction::None};
    double load_factor{0.0};
    std::optional<std::string> instance_id;
};

struct InstanceMetric
{
    std::size_t active_requests{0};
    bool healthy{false};
};

struct PoolStatus
{
    PoolCounts counts;
    double current_load{0.0};
    std::size_t min_instances{0};
    std::size_t max_instances{0};
    bool auto_scale{false};
    std::optional<double> seconds_since_scale_action;
    std::unordered_map<std::string, InstanceMetric> instance_metrics;
};

struct InstanceInfo
{
    InstanceSnapshot snapshot;
    std::size_t active_requests{0};
    bool is_healthy{false};
};

WORKERPOOL_EXPORT void to_json(nlohmann::json &j, const PoolStatus &s);
WORKERPOOL_EXPORT void to_json(nlohmann::json &j, const InstanceInfo &info);

/// Looks up an instance's average response time, empty if it has none.
using AverageLookup = std::function<std::optional<double>(const std::string &instance_id)>;

class WORKERPOOL_EXPORT InstanceCoordinator
{
  public:
    InstanceCoordinator(CoordinatorConfig config, InstanceFactory factory);
    ~InstanceCoordinator();

    InstanceCoordinator(const InstanceCoordinator &) = delete;
    InstanceCoordinator &operator=(const InstanceCoordinator &) = delete;

    /**
     * @brief Create initial_count instances.
     * @throws PoolBootstrapError if none could be created.
     * @return Number of instances created.
     */
    std::size_t bootstrap();

    /// New instances join neither set until their first probe result.
    std::optional<std::string> create();
    std::optional<std::string> create(const InstanceConfig &config);

    /**
     * @brief Remove one instance.
     *
     * Refused for a healthy instance when |healthy| <= min_instances, and
     * for any instance that still has active requests.
     */
    bool remove(const std::string &instance_id);

    Transition mark_healthy(const std::string &instance_id);
    Transition mark_unhealthy(const std::string &instance_id);

    /// Run @p strategy over the healthy set in creation order.
    std::optional<std::string> select(SelectionStrategy &strategy,
                                      const AverageLookup &averages = {}) const;

    /// Healthy candidates in creation order, without response-time data.
    [[nodiscard]] Candidates healthy_candidates() const;

    /**
     * @brief Bind @p request_id to @p instance_id if the instance is still
     *        healthy and ready at this moment.
     */
    AssignResult try_assign(const std::string &request_id, const std::string &instance_id);

    /// Drop an assignment; returns the instance it was bound to.
    std::optional<std::string> release(const std::string &request_id);

    [[nodiscard]] std::vector<std::string> requests_on(const std::string &instance_id) const;
    [[nodiscard]] std::size_t active_requests(const std::string &instance_id) const;

    ScalingResult evaluate_scaling();

    /// Clean up every instance and forget all membership and assignments.
    void cleanup();

    [[nodiscard]] PoolCounts counts() const;
    [[nodiscard]] double load_factor() const;
    [[nodiscard]] PoolStatus status() const;
    [[nodiscard]] std::vector<InstanceInfo> instance_list() const;

    [[nodiscard]] bool is_healthy(const std::string &instance_id) const;
    [[nodiscard]] bool is_unhealthy(const std::string &instance_id) const;
    [[nodiscard]] std::vector<std::string> healthy_ids() const;
    [[nodiscard]] std::vector<std::string> unhealthy_ids() const;
    [[nodiscard]] std::size_t consecutive_failures(const std::string &instance_id) const;

    /// Registered instances in creation order, excluding those being removed.
    [[nodiscard]] std::vector<std::shared_ptr<WorkerInstance>> instances() const;
    [[nodiscard]] std::shared_ptr<WorkerInstance> find_instance(const std::string &id) const;

    [[nodiscard]] const CoordinatorConfig &config() const noexcept { return m_config; }

  private:
    bool is_known_locked(const std::string &instance_id) const;
    std::size_t active_locked(const std::string &instance_id) const;
    double load_factor_locked() const;
    PoolCounts counts_locked() const;

    const CoordinatorConfig m_config;
    InstanceRegistry m_registry;

    mutable std::mutex m_mu;
    std::unordered_set<std::string> m_healthy;
    std::unordered_set<std::string> m_unhealthy;
    std::unordered_set<std::string> m_removing;
    std::unordered_map<std::string, std::string> m_assignments; // request -> instance
    std::unordered_map<std::string, std::size_t> m_active_per_instance;
    std::unordered_map<std::string, std::size_t> m_consecutive_failures;
    std::optional<Clock::time_point> m_last_scale_action;
    bool m_scaling_in_progress{false};
};

} // namespace workerpool::pool
