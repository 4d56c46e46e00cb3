#include "pool/pool_manager.hpp"

#include <mutex>

#include "utils/logger.hpp"

namespace workerpool::pool
{

// ============================================================================
// PoolManagerImpl
// ============================================================================

class PoolManagerImpl
{
  public:
    PoolManagerImpl(PoolConfig cfg, InstanceFactory factory)
        : config(std::move(cfg)), coordinator(config.coordinator, std::move(factory)),
          balancer(coordinator, config.balancer), monitor(coordinator, alerts, config.monitor)
    {
        failure_subscription = alerts.subscribe(
            [this](const Alert &alert)
            {
                if (alert.type != AlertType::InstanceFailed)
                    return;
                const auto id = alert.data.value("instance_id", std::string{});
                const auto failed = balancer.handle_instance_failure(id);
                if (failed > 0)
                {
                    LOGGER_WARN("PoolManager: failed {} active request(s) on {}", failed, id);
                }
            });
    }

    void apply_logging() const
    {
        auto &logger = utils::Logger::instance();
        logger.set_level(config.log_level);
        if (!config.log_file.empty())
        {
            logger.set_logfile(config.log_file);
        }
    }

    // Destroyed in reverse: the monitor stops before the balancer and
    // coordinator it drives.
    const PoolConfig config;
    AlertChannel alerts;
    InstanceCoordinator coordinator;
    LoadBalancer balancer;
    HealthMonitor monitor;

    SubscriptionId failure_subscription{0};

    mutable std::mutex state_mu;
    bool running{false};
};

// ============================================================================
// PoolManager
// ============================================================================

PoolManager::PoolManager(PoolConfig config, InstanceFactory factory)
    : pImpl(std::make_unique<PoolManagerImpl>(std::move(config), std::move(factory)))
{
}

PoolManager::~PoolManager()
{
    stop();
}

void PoolManager::start()
{
    std::lock_guard<std::mutex> lock(pImpl->state_mu);
    if (pImpl->running)
    {
        return;
    }
    pImpl->apply_logging();

    const auto &c = pImpl->config.coordinator;
    LOGGER_INFO("PoolManager: starting (min {}, max {}, initial {}, strategy {})",
                c.min_instances, c.max_instances, c.initial_count,
                to_string(pImpl->config.balancer.default_strategy));

    const auto created = pImpl->coordinator.bootstrap();
    try
    {
        pImpl->monitor.run_cycle();
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("PoolManager: first health cycle failed: {}", e.what());
        pImpl->coordinator.cleanup();
        throw;
    }
    pImpl->monitor.start();
    pImpl->running = true;

    const auto counts = pImpl->coordinator.counts();
    LOGGER_INFO("PoolManager: started with {} instance(s), {} healthy", created, counts.healthy);
}

void PoolManager::stop()
{
    std::lock_guard<std::mutex> lock(pImpl->state_mu);
    if (!pImpl->running)
    {
        return;
    }
    pImpl->monitor.stop();
    const auto still_running =
        pImpl->monitor.drain_outstanding(pImpl->config.monitor.instance_timeout);
    if (still_running > 0)
    {
        LOGGER_WARN("PoolManager: {} health probe(s) still running at shutdown", still_running);
    }
    const auto failed = pImpl->balancer.cleanup();
    pImpl->coordinator.cleanup();
    pImpl->running = false;
    LOGGER_INFO("PoolManager: stopped ({} active request(s) failed)", failed);
}

bool PoolManager::is_running() const
{
    std::lock_guard<std::mutex> lock(pImpl->state_mu);
    return pImpl->running;
}

RouteResult PoolManager::route(const std::string &request_id, const nlohmann::json &payload,
                               std::optional<StrategyKind> strategy)
{
    return pImpl->balancer.route(request_id, payload, strategy);
}

bool PoolManager::complete(const std::string &request_id, bool success, std::size_t response_size)
{
    return pImpl->balancer.complete(request_id, success, response_size);
}

nlohmann::json PoolManager::get_status() const
{
    nlohmann::json j;
    j["running"] = is_running();
    j["pool"] = pImpl->coordinator.status();
    j["routing"] = pImpl->balancer.routing_stats();
    j["health"] = pImpl->monitor.get_health_status();
    return j;
}

std::vector<InstanceInfo> PoolManager::get_instance_list() const
{
    return pImpl->coordinator.instance_list();
}

RoutingStats PoolManager::get_routing_stats() const
{
    return pImpl->balancer.routing_stats();
}

std::map<std::string, PerformanceRecord>
PoolManager::get_instance_performance(const std::optional<std::string> &instance_id) const
{
    return pImpl->balancer.instance_performance(instance_id);
}

std::vector<LoadShare> PoolManager::get_load_distribution() const
{
    return pImpl->balancer.load_distribution();
}

nlohmann::json PoolManager::health_status() const
{
    return pImpl->monitor.get_health_status();
}

SubscriptionId PoolManager::add_alert_callback(AlertCallback callback)
{
    return pImpl->alerts.subscribe(std::move(callback));
}

bool PoolManager::remove_alert_callback(SubscriptionId id)
{
    if (id == pImpl->failure_subscription)
    {
        return false;
    }
    return pImpl->alerts.unsubscribe(id);
}

const PoolConfig &PoolManager::config() const noexcept
{
    return pImpl->config;
}

InstanceCoordinator &PoolManager::coordinator() noexcept
{
    return pImpl->coordinator;
}

LoadBalancer &PoolManager::balancer() noexcept
{
    return pImpl->balancer;
}

HealthMonitor &PoolManager::monitor() noexcept
{
    return pImpl->monitor;
}

AlertChannel &PoolManager::alerts() noexcept
{
    return pImpl->alerts;
}

} // namespace workerpool::pool
