/**
 * @file pool_config.cpp
 * @brief PoolConfig JSON parsing and validation.
 */
#include "pool/pool_config.hpp"

#include <cmath>
#include <cstdint>
#include <fstream>
#include <stdexcept>

namespace workerpool::pool
{

// ============================================================================
// Parsing helpers (anonymous namespace)
// ============================================================================

namespace
{

[[noreturn]] void fail(const std::string &what)
{
    throw std::runtime_error("Pool config: " + what);
}

std::size_t read_count(const nlohmann::json &j, const char *key, std::size_t fallback)
{
    const auto v = j.value(key, static_cast<std::int64_t>(fallback));
    if (v < 0)
        fail(std::string("'") + key + "' must be >= 0, got " + std::to_string(v));
    return static_cast<std::size_t>(v);
}

/// Intervals must be positive; delays marked @p allow_zero may also be 0.
template <typename Duration>
Duration read_seconds(const nlohmann::json &j, const char *key, Duration fallback,
                      bool allow_zero = false)
{
    const double fallback_s = std::chrono::duration<double>(fallback).count();
    const double s = j.value(key, fallback_s);
    if (!std::isfinite(s) || s < 0.0 || (s == 0.0 && !allow_zero))
        fail(std::string("'") + key + "' must be a " + (allow_zero ? "non-negative" : "positive") +
             " number of seconds");
    return std::chrono::duration_cast<Duration>(std::chrono::duration<double>(s));
}

double read_fraction(const nlohmann::json &j, const char *key, double fallback)
{
    const double v = j.value(key, fallback);
    if (!(v >= 0.0 && v <= 1.0))
        fail(std::string("'") + key + "' must be within [0, 1]");
    return v;
}

void parse_instances(const nlohmann::json &j, CoordinatorConfig &c)
{
    c.min_instances = read_count(j, "min_instances", c.min_instances);
    c.max_instances = read_count(j, "max_instances", c.max_instances);
    c.initial_count = read_count(j, "initial_count", c.initial_count);
    c.auto_scale = j.value("auto_scale", c.auto_scale);
    c.scale_up_threshold = read_fraction(j, "scale_up_threshold", c.scale_up_threshold);
    c.scale_down_threshold = read_fraction(j, "scale_down_threshold", c.scale_down_threshold);
    c.scale_cooldown = read_seconds(j, "scale_cooldown_seconds", c.scale_cooldown, true);
}

void parse_instance_defaults(const nlohmann::json &j, InstanceConfig &ic)
{
    ic.max_requests_per_session =
        read_count(j, "max_requests_per_session", ic.max_requests_per_session);
    if (ic.max_requests_per_session == 0)
        fail("'max_requests_per_session' must be >= 1");
    ic.session_lifetime = read_seconds(j, "session_lifetime", ic.session_lifetime);
    ic.label = j.value("label", ic.label);
    if (j.contains("options"))
    {
        if (!j["options"].is_object())
            fail("'instance_defaults.options' must be an object");
        ic.options = j["options"];
    }
}

void parse_monitoring(const nlohmann::json &j, HealthMonitor::Config &m)
{
    m.health_check_interval = read_seconds(j, "health_check_interval", m.health_check_interval);
    m.instance_timeout = read_seconds(j, "instance_timeout", m.instance_timeout);
    m.retire_after_failures = read_count(j, "retire_after_failures", m.retire_after_failures);

    if (j.contains("alert_thresholds") && j["alert_thresholds"].is_object())
    {
        const auto &t = j["alert_thresholds"];
        const double rt = t.value("response_time", m.thresholds.response_time);
        if (!std::isfinite(rt) || rt <= 0.0)
            fail("'alert_thresholds.response_time' must be positive");
        m.thresholds.response_time = rt;
        m.thresholds.error_rate = read_fraction(t, "error_rate", m.thresholds.error_rate);
        m.thresholds.instance_failure_rate =
            read_fraction(t, "instance_failure_rate", m.thresholds.instance_failure_rate);
    }
}

void parse_logging(const nlohmann::json &j, PoolConfig &cfg)
{
    const std::string level = j.value("level", std::string{"info"});
    const auto parsed = utils::level_from_string(level);
    if (!parsed)
        fail("invalid 'logging.level' = '" + level +
             "' (must be trace, debug, info, warning, error or system)");
    cfg.log_level = *parsed;
    cfg.log_file = j.value("file", std::string{});
}

} // anonymous namespace

// ============================================================================
// PoolConfig
// ============================================================================

PoolConfig PoolConfig::from_json(const nlohmann::json &j)
{
    if (!j.is_object())
        fail("top level must be a JSON object");

    PoolConfig cfg;
    try
    {
        if (j.contains("instances") && j["instances"].is_object())
            parse_instances(j["instances"], cfg.coordinator);

        if (j.contains("instance_defaults") && j["instance_defaults"].is_object())
            parse_instance_defaults(j["instance_defaults"], cfg.coordinator.instance_defaults);

        const std::string strategy = j.value("load_balancing", std::string{"least_busy"});
        const auto kind = strategy_from_string(strategy);
        if (!kind)
            fail("invalid 'load_balancing' = '" + strategy + "'");
        cfg.balancer.default_strategy = *kind;

        const auto retries = j.value("max_retries", std::int64_t{cfg.balancer.max_retries});
        if (retries < 0)
            fail("'max_retries' must be >= 0");
        cfg.balancer.max_retries = static_cast<int>(retries);
        cfg.balancer.retry_delay =
            read_seconds(j, "retry_delay_seconds", cfg.balancer.retry_delay, true);

        if (j.contains("monitoring") && j["monitoring"].is_object())
            parse_monitoring(j["monitoring"], cfg.monitor);

        if (j.contains("logging") && j["logging"].is_object())
            parse_logging(j["logging"], cfg);
    }
    catch (const nlohmann::json::exception &e)
    {
        fail(std::string("wrong value type: ") + e.what());
    }

    cfg.validate();
    return cfg;
}

PoolConfig PoolConfig::from_json_file(const std::string &path)
{
    std::ifstream f(path);
    if (!f.is_open())
        fail("cannot open file: " + path);

    nlohmann::json j;
    try
    {
        j = nlohmann::json::parse(f);
    }
    catch (const nlohmann::json::parse_error &e)
    {
        fail("JSON parse error in '" + path + "': " + e.what());
    }
    return from_json(j);
}

void PoolConfig::validate() const
{
    const auto &c = coordinator;
    if (c.max_instances < 1)
        fail("'max_instances' must be >= 1");
    if (c.min_instances > c.max_instances)
        fail("'min_instances' (" + std::to_string(c.min_instances) + ") exceeds 'max_instances' (" +
             std::to_string(c.max_instances) + ")");
    if (c.initial_count > c.max_instances)
        fail("'initial_count' (" + std::to_string(c.initial_count) +
             ") exceeds 'max_instances' (" + std::to_string(c.max_instances) + ")");
    if (c.scale_down_threshold >= c.scale_up_threshold)
        fail("'scale_down_threshold' must be below 'scale_up_threshold'");
    if (balancer.history_limit == 0)
        fail("balancer history limit must be >= 1");
}

} // namespace workerpool::pool
