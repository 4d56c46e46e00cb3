#pragma once
/**
 * @file pool_config.hpp
 * @brief Pool configuration, loaded from JSON.
 *
 * ## JSON format
 *
 * @code{.json}
 * {
 *   "instances": {
 *     "min_instances": 1, "max_instances": 5, "initial_count": 1,
 *     "auto_scale": true,
 *     "scale_up_threshold": 0.8, "scale_down_threshold": 0.3,
 *     "scale_cooldown_seconds": 60
 *   },
 *   "load_balancing": "least_busy",
 *   "max_retries": 3,
 *   "retry_delay_seconds": 1.0,
 *   "monitoring": {
 *     "health_check_interval": 10,
 *     "instance_timeout": 30,
 *     "retire_after_failures": 3,
 *     "alert_thresholds": {
 *       "response_time": 10.0, "error_rate": 0.1, "instance_failure_rate": 0.2
 *     }
 *   },
 *   "instance_defaults": {
 *     "max_requests_per_session": 100, "session_lifetime": 3600, "options": {}
 *   },
 *   "logging": { "level": "info", "file": "" }
 * }
 * @endcode
 *
 * Every key is optional. Intervals are in seconds and may be fractional.
 */

#include <string>

#include <nlohmann/json.hpp>

#include "pool/health_monitor.hpp"
#include "pool/instance_coordinator.hpp"
#include "pool/load_balancer.hpp"
#include "utils/logger.hpp"
#include "workerpool_export.h"

namespace workerpool::pool
{

struct WORKERPOOL_EXPORT PoolConfig
{
    CoordinatorConfig coordinator;
    LoadBalancer::Config balancer;
    HealthMonitor::Config monitor;

    utils::Logger::Level log_level{utils::Logger::Level::L_INFO};
    std::string log_file; ///< Empty keeps the console sink.

    /// @throws std::runtime_error on an invalid value.
    static PoolConfig from_json(const nlohmann::json &j);

    /// @throws std::runtime_error if the file cannot be read or parsed, or on an invalid value.
    static PoolConfig from_json_file(const std::string &path);

    /// Re-check cross-field constraints on a config built in code.
    void validate() const;
};

} // namespace workerpool::pool
