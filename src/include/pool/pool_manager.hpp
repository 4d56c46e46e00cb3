#pragma once
/**
 * @file pool_manager.hpp
 * @brief Facade that owns a complete worker pool.
 *
 * PoolManager wires together the coordinator, load balancer, health monitor
 * and alert channel, and exposes the interface a request-handling layer uses:
 * route/complete, status and statistics, and alert subscription.
 *
 * An instance_failed alert fails every request still routed to that instance
 * (LoadBalancer::handle_instance_failure), so in-flight work on a dead worker
 * is reconciled rather than left dangling.
 *
 * All methods are thread-safe.
 */

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "pool/alert_channel.hpp"
#include "pool/health_monitor.hpp"
#include "pool/instance_coordinator.hpp"
#include "pool/load_balancer.hpp"
#include "pool/pool_config.hpp"
#include "workerpool_export.h"

namespace workerpool::pool
{

class PoolManagerImpl;

class WORKERPOOL_EXPORT PoolManager
{
  public:
    PoolManager(PoolConfig config, InstanceFactory factory);
    ~PoolManager();

    PoolManager(const PoolManager &) = delete;
    PoolManager &operator=(const PoolManager &) = delete;

    /**
     * @brief Bootstrap the pool and start health monitoring.
     *
     * Creates initial_count instances, runs one health cycle on the calling
     * thread so they are admitted before start() returns, then starts the
     * background monitor. No-op if already running.
     *
     * @throws PoolBootstrapError if no instance could be created.
     */
    void start();

    /**
     * @brief Stop monitoring, fail every active request and clean up all
     *        instances. Idempotent; also called by the destructor.
     *
     * Probes that outlived their cycle get up to instance_timeout to return
     * before instances are cleaned up.
     */
    void stop();

    [[nodiscard]] bool is_running() const;

    RouteResult route(const std::string &request_id, const nlohmann::json &payload,
                      std::optional<StrategyKind> strategy = std::nullopt);
    bool complete(const std::string &request_id, bool success, std::size_t response_size = 0);

    /// {"running", "pool", "routing", "health"}.
    [[nodiscard]] nlohmann::json get_status() const;
    [[nodiscard]] std::vector<InstanceInfo> get_instance_list() const;
    [[nodiscard]] RoutingStats get_routing_stats() const;
    [[nodiscard]] std::map<std::string, PerformanceRecord>
    get_instance_performance(const std::optional<std::string> &instance_id = std::nullopt) const;
    [[nodiscard]] std::vector<LoadShare> get_load_distribution() const;
    [[nodiscard]] nlohmann::json health_status() const;

    SubscriptionId add_alert_callback(AlertCallback callback);
    bool remove_alert_callback(SubscriptionId id);

    [[nodiscard]] const PoolConfig &config() const noexcept;
    [[nodiscard]] InstanceCoordinator &coordinator() noexcept;
    [[nodiscard]] LoadBalancer &balancer() noexcept;
    [[nodiscard]] HealthMonitor &monitor() noexcept;
    [[nodiscard]] AlertChannel &alerts() noexcept;

  private:
#if defined(_MSC_VER)
#pragma warning(suppress : 4251)
#endif
    std::unique_ptr<PoolManagerImpl> pImpl;
};

} // namespace workerpool::pool
