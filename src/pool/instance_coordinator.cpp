#include "pool/instance_coordinator.hpp"

#include <algorithm>

#include <fmt/format.h>

#include "utils/logger.hpp"

namespace workerpool::pool
{

const char *to_string(Transition t) noexcept
{
    switch (t)
    {
    case Transition::Admitted:
        return "admitted";
    case Transition::Recovered:
        return "recovered";
    case Transition::Failed:
        return "failed";
    case Transition::Excluded:
        return "excluded";
    case Transition::Unchanged:
        return "unchanged";
    case Transition::Unknown:
        return "unknown";
    }
    return "unknown";
}

const char *to_string(ScaleAction a) noexcept
{
    switch (a)
    {
    case ScaleAction::None:
        return "none";
    case ScaleAction::Disabled:
        return "disabled";
    case ScaleAction::Cooldown:
        return "cooldown";
    case ScaleAction::ScaledUp:
        return "scaled_up";
    case ScaleAction::ScaledDown:
        return "scaled_down";
    case ScaleAction::ScaleUpFailed:
        return "scale_up_failed";
    case ScaleAction::ScaleDownDeferred:
        return "scale_down_deferred";
    }
    return "unknown";
}

void to_json(nlohmann::json &j, const PoolStatus &s)
{
    nlohmann::json metrics = nlohmann::json::object();
    for (const auto &[id, m] : s.instance_metrics)
    {
        metrics[id] = {{"active_requests", m.active_requests}, {"healthy", m.healthy}};
    }
    j = nlohmann::json{{"total_instances", s.counts.total},
                       {"healthy_instances", s.counts.healthy},
                       {"unhealthy_instances", s.counts.unhealthy},
                       {"unadmitted_instances", s.counts.unadmitted},
                       {"pending_instances", s.counts.pending},
                       {"active_requests", s.counts.active_requests},
                       {"current_load", s.current_load},
                       {"min_instances", s.min_instances},
                       {"max_instances", s.max_instances},
                       {"auto_scale", s.auto_scale},
                       {"instance_metrics", std::move(metrics)}};
    if (s.seconds_since_scale_action)
    {
        j["last_scale_action"] = *s.seconds_since_scale_action;
    }
    else
    {
        j["last_scale_action"] = nullptr;
    }
}

void to_json(nlohmann::json &j, const InstanceInfo &info)
{
    j = info.snapshot;
    j["active_requests"] = info.active_requests;
    j["is_healthy"] = info.is_healthy;
}

// ============================================================================
// Construction / bootstrap
// ============================================================================

InstanceCoordinator::InstanceCoordinator(CoordinatorConfig config, InstanceFactory factory)
    : m_config(std::move(config)),
      m_registry(std::move(factory), m_config.instance_defaults, m_config.max_instances)
{
}

InstanceCoordinator::~InstanceCoordinator()
{
    cleanup();
}

std::size_t InstanceCoordinator::bootstrap()
{
    const std::size_t target = std::min(m_config.initial_count, m_config.max_instances);
    std::size_t created = 0;
    for (std::size_t i = 0; i < target; ++i)
    {
        if (create())
        {
            ++created;
        }
    }
    if (created == 0)
    {
        LOGGER_ERROR("Coordinator: bootstrap created 0 of {} instances", target);
        throw PoolBootstrapError(
            fmt::format("Pool bootstrap failed: 0 of {} instances could be created", target));
    }
    LOGGER_INFO("Coordinator: bootstrap created {} of {} instances", created, target);
    return created;
}

// ============================================================================
// Membership
// ============================================================================

std::optional<std::string> InstanceCoordinator::create()
{
    return create(m_config.instance_defaults);
}

std::optional<std::string> InstanceCoordinator::create(const InstanceConfig &config)
{
    auto id = m_registry.create(config);
    if (!id)
    {
        LOGGER_WARN("Coordinator: instance creation failed");
    }
    return id;
}

bool InstanceCoordinator::remove(const std::string &instance_id)
{
    {
        std::lock_guard<std::mutex> lock(m_mu);
        if (!is_known_locked(instance_id))
        {
            return false;
        }
        if (m_healthy.count(instance_id) != 0 && m_healthy.size() <= m_config.min_instances)
        {
            LOGGER_WARN("Coordinator: refusing to remove {}: {} healthy, minimum is {}",
                        instance_id, m_healthy.size(), m_config.min_instances);
            return false;
        }
        if (const auto active = active_locked(instance_id); active > 0)
        {
            LOGGER_WARN("Coordinator: refusing to remove {}: {} active request(s)", instance_id,
                        active);
            return false;
        }
        m_healthy.erase(instance_id);
        m_unhealthy.erase(instance_id);
        m_consecutive_failures.erase(instance_id);
        m_removing.insert(instance_id);
    }

    m_registry.destroy(instance_id);

    std::lock_guard<std::mutex> lock(m_mu);
    m_removing.erase(instance_id);
    LOGGER_INFO("Coordinator: removed instance {}", instance_id);
    return true;
}

Transition InstanceCoordinator::mark_healthy(const std::string &instance_id)
{
    std::lock_guard<std::mutex> lock(m_mu);
    if (!is_known_locked(instance_id))
    {
        return Transition::Unknown;
    }
    m_consecutive_failures[instance_id] = 0;
    if (m_healthy.count(instance_id) != 0)
    {
        return Transition::Unchanged;
    }
    m_healthy.insert(instance_id);
    return m_unhealthy.erase(instance_id) != 0 ? Transition::Recovered : Transition::Admitted;
}

Transition InstanceCoordinator::mark_unhealthy(const std::string &instance_id)
{
    std::lock_guard<std::mutex> lock(m_mu);
    if (!is_known_locked(instance_id))
    {
        return Transition::Unknown;
    }
    ++m_consecutive_failures[instance_id];
    if (m_unhealthy.count(instance_id) != 0)
    {
        return Transition::Unchanged;
    }
    m_unhealthy.insert(instance_id);
    return m_healthy.erase(instance_id) != 0 ? Transition::Failed : Transition::Excluded;
}

// ============================================================================
// Selection and assignment
// ============================================================================

Candidates InstanceCoordinator::healthy_candidates() const
{
    Candidates out;
    std::lock_guard<std::mutex> lock(m_mu);
    for (const auto &entry : m_registry.snapshot())
    {
        const auto &id = entry.instance->id();
        if (m_healthy.count(id) != 0 && m_removing.count(id) == 0)
        {
            out.push_back(Candidate{id, entry.sequence, active_locked(id), std::nullopt});
        }
    }
    return out;
}

std::optional<std::string> InstanceCoordinator::select(SelectionStrategy &strategy,
                                                       const AverageLookup &averages) const
{
    auto candidates = healthy_candidates();
    if (averages)
    {
        for (auto &c : candidates)
        {
            c.avg_response_time = averages(c.instance_id);
        }
    }
    return select_from(strategy, candidates);
}

AssignResult InstanceCoordinator::try_assign(const std::string &request_id,
                                             const std::string &instance_id)
{
    std::lock_guard<std::mutex> lock(m_mu);
    if (m_assignments.count(request_id) != 0)
    {
        return AssignResult::Duplicate;
    }
    if (m_healthy.count(instance_id) == 0 || m_removing.count(instance_id) != 0)
    {
        return AssignResult::NotEligible;
    }
    const auto instance = m_registry.find(instance_id);
    if (!instance || !is_serviceable(instance->status()))
    {
        return AssignResult::NotEligible;
    }
    m_assignments.emplace(request_id, instance_id);
    ++m_active_per_instance[instance_id];
    return AssignResult::Assigned;
}

std::optional<std::string> InstanceCoordinator::release(const std::string &request_id)
{
    std::lock_guard<std::mutex> lock(m_mu);
    auto it = m_assignments.find(request_id);
    if (it == m_assignments.end())
    {
        return std::nullopt;
    }
    std::string instance_id = std::move(it->second);
    m_assignments.erase(it);
    auto active = m_active_per_instance.find(instance_id);
    if (active != m_active_per_instance.end() && --active->second == 0)
    {
        m_active_per_instance.erase(active);
    }
    return instance_id;
}

std::vector<std::string> InstanceCoordinator::requests_on(const std::string &instance_id) const
{
    std::vector<std::string> out;
    std::lock_guard<std::mutex> lock(m_mu);
    for (const auto &[request, instance] : m_assignments)
    {
        if (instance == instance_id)
        {
            out.push_back(request);
        }
    }
    return out;
}

std::size_t InstanceCoordinator::active_requests(const std::string &instance_id) const
{
    std::lock_guard<std::mutex> lock(m_mu);
    return active_locked(instance_id);
}

// ============================================================================
// Autoscaling
// ============================================================================

ScalingResult InstanceCoordinator::evaluate_scaling()
{
    ScalingResult result;
    bool scale_up = false;
    std::string target;
    {
        std::lock_guard<std::mutex> lock(m_mu);
        result.load_factor = load_factor_locked();
        if (!m_config.auto_scale)
        {
            result.action = ScaleAction::Disabled;
            return result;
        }
        if (m_scaling_in_progress)
        {
            return result;
        }

        const std::size_t healthy = m_healthy.size();
        const bool room = m_registry.size() + m_registry.pending() < m_config.max_instances;
        const bool want_up = result.load_factor > m_config.scale_up_threshold &&
                             healthy < m_config.max_instances && room;
        const bool want_down = result.load_factor < m_config.scale_down_threshold &&
                               healthy > m_config.min_instances;
        if (!want_up && !want_down)
        {
            return result;
        }

        const auto now = now_from(m_config.clock);
        if (m_last_scale_action && now - *m_last_scale_action < m_config.scale_cooldown)
        {
            result.action = ScaleAction::Cooldown;
            return result;
        }

        if (want_up)
        {
            scale_up = true;
        }
        else
        {
            // Least-loaded healthy instance, earliest-created on ties.
            std::size_t best_active = 0;
            for (const auto &entry : m_registry.snapshot())
            {
                const auto &id = entry.instance->id();
                if (m_healthy.count(id) == 0)
                    continue;
                const auto active = active_locked(id);
                if (target.empty() || active < best_active)
                {
                    target = id;
                    best_active = active;
                }
            }
            result.instance_id = target;
            if (best_active > 0)
            {
                LOGGER_INFO("Coordinator: scale-down of {} deferred, {} active request(s)", target,
                            best_active);
                result.action = ScaleAction::ScaleDownDeferred;
                return result;
            }
        }
        m_scaling_in_progress = true;
    }

    bool applied = false;
    if (scale_up)
    {
        LOGGER_INFO("Coordinator: load {:.2f} above {:.2f}, scaling up", result.load_factor,
                    m_config.scale_up_threshold);
        result.instance_id = create();
        applied = result.instance_id.has_value();
        result.action = applied ? ScaleAction::ScaledUp : ScaleAction::ScaleUpFailed;
    }
    else
    {
        LOGGER_INFO("Coordinator: load {:.2f} below {:.2f}, scaling down {}", result.load_factor,
                    m_config.scale_down_threshold, target);
        applied = remove(target);
        result.action = applied ? ScaleAction::ScaledDown : ScaleAction::ScaleDownDeferred;
    }

    std::lock_guard<std::mutex> lock(m_mu);
    m_scaling_in_progress = false;
    if (applied)
    {
        m_last_scale_action = now_from(m_config.clock);
    }
    return result;
}

// ============================================================================
// Teardown and reporting
// ============================================================================

void InstanceCoordinator::cleanup()
{
    {
        std::lock_guard<std::mutex> lock(m_mu);
        m_healthy.clear();
        m_unhealthy.clear();
        m_assignments.clear();
        m_active_per_instance.clear();
        m_consecutive_failures.clear();
    }
    const auto removed = m_registry.clear();
    if (!removed.empty())
    {
        LOGGER_INFO("Coordinator: cleaned up {} instance(s)", removed.size());
    }
}

bool InstanceCoordinator::is_known_locked(const std::string &instance_id) const
{
    return m_removing.count(instance_id) == 0 && m_registry.contains(instance_id);
}

std::size_t InstanceCoordinator::active_locked(const std::string &instance_id) const
{
    auto it = m_active_per_instance.find(instance_id);
    return it == m_active_per_instance.end() ? 0 : it->second;
}

double InstanceCoordinator::load_factor_locked() const
{
    const double healthy = static_cast<double>(std::max<std::size_t>(m_healthy.size(), 1));
    const double load = static_cast<double>(m_assignments.size()) / healthy;
    return std::clamp(load, 0.0, 1.0);
}

PoolCounts InstanceCoordinator::counts_locked() const
{
    PoolCounts c;
    for (const auto &entry : m_registry.snapshot())
    {
        const auto &id = entry.instance->id();
        if (m_removing.count(id) != 0)
            continue;
        ++c.total;
        if (m_healthy.count(id) != 0)
            ++c.healthy;
        else if (m_unhealthy.count(id) != 0)
            ++c.unhealthy;
        else
            ++c.unadmitted;
    }
    c.pending = m_registry.pending();
    c.active_requests = m_assignments.size();
    return c;
}

PoolCounts InstanceCoordinator::counts() const
{
    std::lock_guard<std::mutex> lock(m_mu);
    return counts_locked();
}

double InstanceCoordinator::load_factor() const
{
    std::lock_guard<std::mutex> lock(m_mu);
    return load_factor_locked();
}

PoolStatus InstanceCoordinator::status() const
{
    PoolStatus s;
    std::lock_guard<std::mutex> lock(m_mu);
    s.counts = counts_locked();
    s.current_load = load_factor_locked();
    s.min_instances = m_config.min_instances;
    s.max_instances = m_config.max_instances;
    s.auto_scale = m_config.auto_scale;
    if (m_last_scale_action)
    {
        s.seconds_since_scale_action =
            seconds_between(*m_last_scale_action, now_from(m_config.clock));
    }
    for (const auto &entry : m_registry.snapshot())
    {
        const auto &id = entry.instance->id();
        if (m_removing.count(id) == 0)
        {
            s.instance_metrics[id] = InstanceMetric{active_locked(id), m_healthy.count(id) != 0};
        }
    }
    return s;
}

std::vector<InstanceInfo> InstanceCoordinator::instance_list() const
{
    std::vector<InstanceInfo> out;
    for (const auto &instance : instances())
    {
        out.push_back(InstanceInfo{instance->status_snapshot(), 0, false});
    }
    std::lock_guard<std::mutex> lock(m_mu);
    for (auto &info : out)
    {
        info.active_requests = active_locked(info.snapshot.instance_id);
        info.is_healthy = m_healthy.count(info.snapshot.instance_id) != 0;
    }
    return out;
}

bool InstanceCoordinator::is_healthy(const std::string &instance_id) const
{
    std::lock_guard<std::mutex> lock(m_mu);
    return m_healthy.count(instance_id) != 0;
}

bool InstanceCoordinator::is_unhealthy(const std::string &instance_id) const
{
    std::lock_guard<std::mutex> lock(m_mu);
    return m_unhealthy.count(instance_id) != 0;
}

std::vector<std::string> InstanceCoordinator::healthy_ids() const
{
    std::vector<std::string> out;
    for (const auto &c : healthy_candidates())
    {
        out.push_back(c.instance_id);
    }
    return out;
}

std::vector<std::string> InstanceCoordinator::unhealthy_ids() const
{
    std::vector<std::string> out;
    std::lock_guard<std::mutex> lock(m_mu);
    for (const auto &entry : m_registry.snapshot())
    {
        if (m_unhealthy.count(entry.instance->id()) != 0)
        {
            out.push_back(entry.instance->id());
        }
    }
    return out;
}

std::size_t InstanceCoordinator::consecutive_failures(const std::string &instance_id) const
{
    std::lock_guard<std::mutex> lock(m_mu);
    auto it = m_consecutive_failures.find(instance_id);
    return it == m_consecutive_failures.end() ? 0 : it->second;
}

std::vector<std::shared_ptr<WorkerInstance>> InstanceCoordinator::instances() const
{
    std::vector<std::shared_ptr<WorkerInstance>> out;
    std::lock_guard<std::mutex> lock(m_mu);
    for (auto &entry : m_registry.snapshot())
    {
        if (m_removing.count(entry.instance->id()) == 0)
        {
            out.push_back(std::move(entry.instance));
        }
    }
    return out;
}

std::shared_ptr<WorkerInstance> InstanceCoordinator::find_instance(const std::string &id) const
{
    return m_registry.find(id);
}

} // namespace workerpool::pool
