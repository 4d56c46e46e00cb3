#include "pool/load_balancer.hpp"

#include <algorithm>
#include <stdexcept>
#include <thread>

#include "utils/backoff_strategy.hpp"
#include "utils/logger.hpp"

namespace workerpool::pool
{

const char *to_string(RouteError err) noexcept
{
    switch (err)
    {
    case RouteError::NoHealthyInstance:
        return "no healthy instance available";
    case RouteError::RetriesExhausted:
        return "all instances busy or failing, retries exhausted";
    case RouteError::DuplicateRequest:
        return "request id is already being processed";
    }
    return "routing failed";
}

namespace
{

double wall_seconds(std::chrono::system_clock::time_point tp)
{
    return std::chrono::duration<double>(tp.time_since_epoch()).count();
}

std::size_t strategy_index(StrategyKind kind)
{
    return static_cast<std::size_t>(kind);
}

} // namespace

void to_json(nlohmann::json &j, const PerformanceRecord &r)
{
    j = nlohmann::json{{"total_requests", r.requests},
                       {"total_response_time", r.total_response_time},
                       {"avg_response_time", r.avg_response_time},
                       {"success_count", r.success_count},
                       {"error_count", r.error_count}};
    if (r.last_request_time)
        j["last_request_time"] = wall_seconds(*r.last_request_time);
    else
        j["last_request_time"] = nullptr;
}

void to_json(nlohmann::json &j, const RequestHistoryEntry &e)
{
    j = nlohmann::json{{"request_id", e.request_id},       {"instance_id", e.instance_id},
                       {"response_time", e.response_time}, {"success", e.success},
                       {"response_size", e.response_size}, {"timestamp", wall_seconds(e.timestamp)}};
}

void to_json(nlohmann::json &j, const RoutingStats &s)
{
    j = nlohmann::json{{"total_requests", s.total_requests},
                       {"successful_routes", s.successful_routes},
                       {"failed_routes", s.failed_routes},
                       {"retries", s.retries},
                       {"strategy_usage", s.strategy_usage},
                       {"active_requests", s.active_requests},
                       {"current_strategy", to_string(s.current_strategy)},
                       {"max_retries", s.max_retries}};
}

void to_json(nlohmann::json &j, const LoadShare &s)
{
    j = nlohmann::json{{"instance_id", s.instance_id},
                       {"active_requests", s.active_requests},
                       {"total_requests", s.total_requests},
                       {"avg_response_time", s.avg_response_time},
                       {"success_rate", s.success_rate},
                       {"error_count", s.error_count}};
}

// ============================================================================
// Construction
// ============================================================================

LoadBalancer::LoadBalancer(InstanceCoordinator &coordinator, Config cfg)
    : m_coordinator(coordinator), m_cfg(std::move(cfg)), m_current(m_cfg.default_strategy)
{
    if (m_cfg.max_retries < 0)
    {
        throw std::invalid_argument("LoadBalancer: max_retries must be >= 0");
    }
    for (auto kind : kAllStrategies)
    {
        m_strategies[strategy_index(kind)] =
            m_cfg.random_seed ? make_strategy(kind, *m_cfg.random_seed) : make_strategy(kind);
    }
    LOGGER_INFO("LoadBalancer: strategy '{}', max_retries {}, retry_delay {}ms",
                to_string(m_current), m_cfg.max_retries, m_cfg.retry_delay.count());
}

LoadBalancer::~LoadBalancer() = default;

// ============================================================================
// Routing
// ============================================================================

std::optional<std::string> LoadBalancer::select_candidate(StrategyKind kind)
{
    std::lock_guard<std::mutex> lock(m_strategy_mu);
    return m_coordinator.select(m_strategies[strategy_index(kind)],
                                [this](const std::string &id) { return average_response_time(id); });
}

void LoadBalancer::wait(std::chrono::milliseconds delay) const
{
    if (delay <= std::chrono::milliseconds::zero())
        return;
    if (m_cfg.sleep)
        m_cfg.sleep(delay);
    else
        std::this_thread::sleep_for(delay);
}

RouteResult LoadBalancer::route(const std::string &request_id, const nlohmann::json &payload,
                                std::optional<StrategyKind> strategy)
{
    const StrategyKind kind = strategy.value_or(this->strategy());
    const std::size_t payload_size = payload.dump().size();

    {
        std::lock_guard<std::mutex> lock(m_mu);
        ++m_stats.total_requests;
        ++m_stats.strategy_usage[to_string(kind)];
        if (m_active.count(request_id) != 0)
        {
            ++m_stats.failed_routes;
            LOGGER_WARN("Routing {} rejected: already active", request_id);
            return RouteResult::error(RouteError::DuplicateRequest);
        }
        // Reserve the id; instance_id stays empty until an assignment succeeds.
        m_active.emplace(request_id, ActiveRequest{request_id, {}, {}, payload_size});
    }

    const utils::LinearBackoff empty_backoff(m_cfg.retry_delay);
    const utils::ConstantBackoff invalid_backoff(m_cfg.retry_delay);
    bool saw_candidate = false;

    for (int attempt = 0; attempt <= m_cfg.max_retries; ++attempt)
    {
        const bool last = attempt == m_cfg.max_retries;
        const auto candidate = select_candidate(kind);
        if (!candidate)
        {
            LOGGER_DEBUG("Routing {}: no candidate on attempt {}", request_id, attempt + 1);
            if (!last)
                wait(empty_backoff.delay(attempt));
            continue;
        }
        saw_candidate = true;

        AssignResult assigned = AssignResult::NotEligible;
        {
            std::lock_guard<std::mutex> lock(m_mu);
            assigned = m_coordinator.try_assign(request_id, *candidate);
            if (assigned == AssignResult::Assigned)
            {
                auto &rec = m_active[request_id];
                rec.instance_id = *candidate;
                rec.start_time = now_from(m_cfg.clock);
                ++m_stats.successful_routes;
            }
            else if (assigned == AssignResult::NotEligible)
            {
                ++m_stats.retries;
            }
            else
            {
                m_active.erase(request_id);
                ++m_stats.failed_routes;
            }
        }

        if (assigned == AssignResult::Assigned)
        {
            LOGGER_DEBUG("Routed {} to {} via {} (attempt {})", request_id, *candidate,
                         to_string(kind), attempt + 1);
            return RouteResult::ok(*candidate);
        }
        if (assigned == AssignResult::Duplicate)
        {
            return RouteResult::error(RouteError::DuplicateRequest, attempt + 1);
        }
        LOGGER_DEBUG("Routing {}: {} failed validation on attempt {}", request_id, *candidate,
                     attempt + 1);
        if (!last)
            wait(invalid_backoff.delay(attempt));
    }

    const auto err = saw_candidate ? RouteError::RetriesExhausted : RouteError::NoHealthyInstance;
    {
        std::lock_guard<std::mutex> lock(m_mu);
        m_active.erase(request_id);
        ++m_stats.failed_routes;
    }
    LOGGER_WARN("Routing {} failed after {} attempt(s): {}", request_id, m_cfg.max_retries + 1,
                to_string(err));
    return RouteResult::error(err, m_cfg.max_retries + 1);
}

// ============================================================================
// Completion and failover
// ============================================================================

bool LoadBalancer::complete(const std::string &request_id, bool success, std::size_t response_size)
{
    ActiveRequest req;
    {
        std::lock_guard<std::mutex> lock(m_mu);
        auto it = m_active.find(request_id);
        if (it == m_active.end() || it->second.instance_id.empty())
        {
            LOGGER_WARN("complete() for unknown request {}", request_id);
            return false;
        }
        req = std::move(it->second);
        m_active.erase(it);
    }
    m_coordinator.release(request_id);

    const double elapsed = seconds_between(req.start_time, now_from(m_cfg.clock));
    std::lock_guard<std::mutex> lock(m_mu);
    record_completion(req, elapsed, success, response_size);
    return true;
}

void LoadBalancer::record_completion(const ActiveRequest &req, double elapsed, bool success,
                                     std::size_t response_size)
{
    auto &perf = m_performance[req.instance_id];
    const auto n = static_cast<double>(++perf.requests);
    perf.total_response_time += elapsed;
    perf.avg_response_time = perf.avg_response_time * (n - 1.0) / n + elapsed / n;
    if (success)
        ++perf.success_count;
    else
        ++perf.error_count;
    const auto wall_now = std::chrono::system_clock::now();
    perf.last_request_time = wall_now;

    m_history.push_back(
        RequestHistoryEntry{req.request_id, req.instance_id, elapsed, success, response_size, wall_now});
    while (m_history.size() > m_cfg.history_limit)
    {
        m_history.pop_front();
    }
}

std::size_t LoadBalancer::handle_instance_failure(const std::string &instance_id)
{
    std::vector<std::string> orphaned;
    {
        std::lock_guard<std::mutex> lock(m_mu);
        for (const auto &[id, req] : m_active)
        {
            if (req.instance_id == instance_id)
            {
                orphaned.push_back(id);
            }
        }
    }
    std::size_t failed = 0;
    for (const auto &id : orphaned)
    {
        if (complete(id, false))
        {
            ++failed;
        }
    }
    if (failed > 0)
    {
        LOGGER_WARN("LoadBalancer: failed over {} request(s) from {}", failed, instance_id);
    }
    return failed;
}

std::size_t LoadBalancer::cleanup()
{
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(m_mu);
        for (const auto &[id, req] : m_active)
        {
            if (!req.instance_id.empty())
            {
                ids.push_back(id);
            }
        }
    }
    std::size_t failed = 0;
    for (const auto &id : ids)
    {
        if (complete(id, false))
        {
            ++failed;
        }
    }
    if (failed > 0)
    {
        LOGGER_INFO("LoadBalancer: cleanup failed {} active request(s)", failed);
    }
    return failed;
}

// ============================================================================
// Strategy control and reporting
// ============================================================================

void LoadBalancer::set_strategy(StrategyKind kind)
{
    std::lock_guard<std::mutex> lock(m_strategy_mu);
    if (kind != m_current)
    {
        LOGGER_INFO("LoadBalancer: strategy {} -> {}", to_string(m_current), to_string(kind));
    }
    m_current = kind;
}

void LoadBalancer::set_strategy(const std::string &name)
{
    const auto kind = strategy_from_string(name);
    if (!kind)
    {
        throw std::invalid_argument("Unknown load balancing strategy: '" + name + "'");
    }
    set_strategy(*kind);
}

StrategyKind LoadBalancer::strategy() const
{
    std::lock_guard<std::mutex> lock(m_strategy_mu);
    return m_current;
}

std::vector<std::string> LoadBalancer::available_strategies()
{
    std::vector<std::string> out;
    for (auto kind : kAllStrategies)
    {
        out.emplace_back(to_string(kind));
    }
    return out;
}

RoutingStats LoadBalancer::routing_stats() const
{
    const auto current = strategy();
    std::lock_guard<std::mutex> lock(m_mu);
    RoutingStats s = m_stats;
    s.active_requests = 0;
    for (const auto &[id, req] : m_active)
    {
        if (!req.instance_id.empty())
            ++s.active_requests;
    }
    s.current_strategy = current;
    s.max_retries = m_cfg.max_retries;
    return s;
}

std::map<std::string, PerformanceRecord>
LoadBalancer::instance_performance(const std::optional<std::string> &instance_id) const
{
    std::map<std::string, PerformanceRecord> out;
    std::lock_guard<std::mutex> lock(m_mu);
    if (instance_id)
    {
        auto it = m_performance.find(*instance_id);
        if (it != m_performance.end())
        {
            out.emplace(it->first, it->second);
        }
        return out;
    }
    out.insert(m_performance.begin(), m_performance.end());
    return out;
}

std::vector<LoadShare> LoadBalancer::load_distribution() const
{
    const auto candidates = m_coordinator.healthy_candidates();
    std::vector<LoadShare> out;
    out.reserve(candidates.size());
    std::lock_guard<std::mutex> lock(m_mu);
    for (const auto &c : candidates)
    {
        LoadShare share;
        share.instance_id = c.instance_id;
        share.active_requests = c.active_requests;
        auto it = m_performance.find(c.instance_id);
        if (it != m_performance.end())
        {
            const auto &p = it->second;
            share.total_requests = p.requests;
            share.avg_response_time = p.avg_response_time;
            share.error_count = p.error_count;
            share.success_rate =
                p.requests > 0 ? static_cast<double>(p.success_count) / static_cast<double>(p.requests)
                               : 0.0;
        }
        out.push_back(std::move(share));
    }
    return out;
}

std::vector<RequestHistoryEntry> LoadBalancer::request_history(std::size_t limit) const
{
    std::lock_guard<std::mutex> lock(m_mu);
    const std::size_t n = std::min(limit, m_history.size());
    return std::vector<RequestHistoryEntry>(m_history.end() - static_cast<std::ptrdiff_t>(n),
                                            m_history.end());
}

std::vector<ActiveRequest> LoadBalancer::active_requests() const
{
    std::vector<ActiveRequest> out;
    std::lock_guard<std::mutex> lock(m_mu);
    for (const auto &[id, req] : m_active)
    {
        if (!req.instance_id.empty())
            out.push_back(req);
    }
    return out;
}

std::optional<double> LoadBalancer::average_response_time(const std::string &instance_id) const
{
    std::lock_guard<std::mutex> lock(m_mu);
    auto it = m_performance.find(instance_id);
    if (it == m_performance.end() || it->second.requests == 0)
    {
        return std::nullopt;
    }
    return it->second.avg_response_time;
}

void LoadBalancer::reset_stats()
{
    std::lock_guard<std::mutex> lock(m_mu);
    m_stats = RoutingStats{};
    m_performance.clear();
    m_history.clear();
    LOGGER_INFO("LoadBalancer: statistics reset");
}

} // namespace workerpool::pool
