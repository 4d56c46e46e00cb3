#include "pool/health_monitor.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <future>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>
#include <unordered_set>

#include "utils/backoff_strategy.hpp"
#include "utils/logger.hpp"

namespace workerpool::pool
{

namespace
{

double wall_seconds(std::chrono::system_clock::time_point tp)
{
    return std::chrono::duration<double>(tp.time_since_epoch()).count();
}

struct ProbeOutcome
{
    bool healthy{false};
    double response_time{0.0};
    std::string error;
};

ProbeOutcome run_probe(const std::shared_ptr<WorkerInstance> &instance)
{
    const auto start = Clock::now();
    ProbeOutcome out;
    try
    {
        out.healthy = instance->health_check();
    }
    catch (const std::exception &e)
    {
        out.healthy = false;
        out.error = e.what();
    }
    out.response_time = seconds_between(start, Clock::now());
    return out;
}

template <typename T> std::vector<T> tail(const std::deque<T> &items, std::size_t limit)
{
    const std::size_t n = std::min(limit, items.size());
    return std::vector<T>(items.end() - static_cast<std::ptrdiff_t>(n), items.end());
}

} // namespace

void to_json(nlohmann::json &j, const HealthCheckResult &r)
{
    j = nlohmann::json{{"instance_id", r.instance_id},
                       {"timestamp", wall_seconds(r.timestamp)},
                       {"healthy", r.healthy},
                       {"response_time", r.response_time}};
    if (r.error.empty())
        j["error"] = nullptr;
    else
        j["error"] = r.error;
}

void to_json(nlohmann::json &j, const SystemHealthSample &s)
{
    j = nlohmann::json{{"timestamp", wall_seconds(s.timestamp)},
                       {"total_instances", s.total_instances},
                       {"healthy_instances", s.healthy_instances},
                       {"unhealthy_instances", s.unhealthy_instances},
                       {"failure_rate", s.failure_rate},
                       {"avg_response_time", s.avg_response_time},
                       {"error_rate", s.error_rate}};
}

void to_json(nlohmann::json &j, const HealthStats &s)
{
    j = nlohmann::json{{"cycles", s.cycles},
                       {"total_health_checks", s.total_health_checks},
                       {"failed_health_checks", s.failed_health_checks},
                       {"instances_recovered", s.instances_recovered},
                       {"instances_failed", s.instances_failed},
                       {"instances_retired", s.instances_retired},
                       {"instances_replaced", s.instances_replaced},
                       {"loop_errors", s.loop_errors}};
}

// ============================================================================
// HealthMonitorImpl
// ============================================================================

class HealthMonitorImpl
{
  public:
    HealthMonitorImpl(InstanceCoordinator &coordinator, AlertChannel &alerts,
                      HealthMonitor::Config cfg)
        : m_coordinator(coordinator), m_alerts(alerts), m_cfg(std::move(cfg))
    {
    }

    void run_loop();
    void run_cycle();

    void apply(const std::string &instance_id, const ProbeOutcome &outcome);
    void analyze(std::size_t probes, std::size_t errors,
                 const std::vector<std::shared_ptr<WorkerInstance>> &instances);
    void forget_departed(const std::vector<std::shared_ptr<WorkerInstance>> &instances);
    bool probe_pending(const std::string &instance_id) const;
    void retire_and_replace();
    void purge_history();

    InstanceCoordinator &m_coordinator;
    AlertChannel &m_alerts;
    const HealthMonitor::Config m_cfg;

    // Background loop.
    std::thread m_worker;
    std::mutex m_loop_mu;
    std::condition_variable m_loop_cv;
    bool m_stop_requested{false};
    std::atomic<bool> m_running{false};

    // Serializes cycles; guards m_outstanding (timed-out probes still running).
    mutable std::mutex m_cycle_mu;
    std::unordered_map<std::string, std::future<ProbeOutcome>> m_outstanding;

    mutable std::mutex m_data_mu;
    std::unordered_map<std::string, std::deque<HealthCheckResult>> m_history;
    std::deque<SystemHealthSample> m_system_history;
    HealthStats m_stats;
    std::optional<std::chrono::system_clock::time_point> m_last_check;
};

void HealthMonitorImpl::run_loop()
{
    const utils::ExponentialBackoff restart(m_cfg.restart_pause, m_cfg.restart_pause * 6);
    int consecutive_errors = 0;

    while (true)
    {
        auto pause = m_cfg.health_check_interval;
        try
        {
            run_cycle();
            consecutive_errors = 0;
        }
        catch (const std::exception &e)
        {
            pause = restart.delay(consecutive_errors++);
            LOGGER_ERROR("HealthMonitor: cycle failed: {}; restarting in {}ms", e.what(),
                         pause.count());
            std::lock_guard<std::mutex> lock(m_data_mu);
            ++m_stats.loop_errors;
        }

        std::unique_lock<std::mutex> lock(m_loop_mu);
        if (m_loop_cv.wait_for(lock, pause, [this] { return m_stop_requested; }))
        {
            break;
        }
    }
}

void HealthMonitorImpl::run_cycle()
{
    std::lock_guard<std::mutex> cycle_lock(m_cycle_mu);

    const auto instances = m_coordinator.instances();
    forget_departed(instances);
    const auto deadline = Clock::now() + m_cfg.instance_timeout;

    struct InFlight
    {
        std::string instance_id;
        std::future<ProbeOutcome> result;
    };
    std::vector<InFlight> inflight;
    std::vector<std::pair<std::string, ProbeOutcome>> immediate;

    // --- Fan out ---
    for (const auto &instance : instances)
    {
        const auto &id = instance->id();
        auto prev = m_outstanding.find(id);
        if (prev != m_outstanding.end())
        {
            if (prev->second.wait_for(std::chrono::seconds(0)) != std::future_status::ready)
            {
                immediate.emplace_back(id, ProbeOutcome{false, 0.0, "previous probe still pending"});
                continue;
            }
            m_outstanding.erase(prev);
        }

        std::packaged_task<ProbeOutcome()> task([instance] { return run_probe(instance); });
        auto result = task.get_future();
        try
        {
            std::thread(std::move(task)).detach();
        }
        catch (const std::system_error &e)
        {
            immediate.emplace_back(id, ProbeOutcome{false, 0.0, e.what()});
            continue;
        }
        inflight.push_back(InFlight{id, std::move(result)});
    }

    std::size_t probes = immediate.size() + inflight.size();
    std::size_t errors = 0;
    auto apply_counted = [&](const std::string &id, const ProbeOutcome &outcome)
    {
        if (!outcome.error.empty())
            ++errors;
        apply(id, outcome);
    };

    for (const auto &[id, outcome] : immediate)
    {
        apply_counted(id, outcome);
    }

    // --- Fan in, in resolution order ---
    while (!inflight.empty())
    {
        bool progressed = false;
        for (auto it = inflight.begin(); it != inflight.end();)
        {
            if (it->result.wait_for(std::chrono::seconds(0)) != std::future_status::ready)
            {
                ++it;
                continue;
            }
            ProbeOutcome outcome;
            try
            {
                outcome = it->result.get();
            }
            catch (const std::exception &e)
            {
                outcome = ProbeOutcome{false, 0.0, e.what()};
            }
            catch (...)
            {
                outcome = ProbeOutcome{false, 0.0, "non-standard exception"};
            }
            apply_counted(it->instance_id, outcome);
            it = inflight.erase(it);
            progressed = true;
        }
        if (inflight.empty())
        {
            break;
        }

        const auto now = Clock::now();
        if (now >= deadline)
        {
            const double waited = std::chrono::duration<double>(m_cfg.instance_timeout).count();
            for (auto &pending : inflight)
            {
                LOGGER_WARN("HealthMonitor: probe of {} timed out after {:.3f}s",
                            pending.instance_id, waited);
                apply_counted(pending.instance_id, ProbeOutcome{false, waited, "timeout"});
                m_outstanding.emplace(pending.instance_id, std::move(pending.result));
            }
            inflight.clear();
            break;
        }
        if (!progressed)
        {
            const auto step = std::min<Clock::duration>(std::chrono::milliseconds(2), deadline - now);
            inflight.front().result.wait_for(step);
        }
    }

    {
        std::lock_guard<std::mutex> lock(m_data_mu);
        ++m_stats.cycles;
        m_last_check = std::chrono::system_clock::now();
    }

    analyze(probes, errors, instances);
    retire_and_replace();

    const auto scaling = m_coordinator.evaluate_scaling();
    if (scaling.action == ScaleAction::ScaledUp || scaling.action == ScaleAction::ScaledDown)
    {
        LOGGER_INFO("HealthMonitor: autoscaling {} (load {:.2f})", to_string(scaling.action),
                    scaling.load_factor);
    }

    purge_history();
}

void HealthMonitorImpl::apply(const std::string &instance_id, const ProbeOutcome &outcome)
{
    HealthCheckResult record{instance_id,           std::chrono::system_clock::now(),
                             now_from(m_cfg.clock), outcome.healthy,
                             outcome.response_time, outcome.error};
    {
        std::lock_guard<std::mutex> lock(m_data_mu);
        auto &history = m_history[instance_id];
        history.push_back(record);
        while (history.size() > m_cfg.history_limit)
        {
            history.pop_front();
        }
        ++m_stats.total_health_checks;
        if (!outcome.healthy)
        {
            ++m_stats.failed_health_checks;
        }
    }

    if (outcome.healthy)
    {
        const auto t = m_coordinator.mark_healthy(instance_id);
        if (t == Transition::Recovered)
        {
            {
                std::lock_guard<std::mutex> lock(m_data_mu);
                ++m_stats.instances_recovered;
            }
            LOGGER_INFO("HealthMonitor: instance {} recovered", instance_id);
            m_alerts.publish(AlertType::InstanceRecovered,
                             {{"instance_id", instance_id},
                              {"response_time", outcome.response_time}});
        }
        else if (t == Transition::Admitted)
        {
            LOGGER_INFO("HealthMonitor: instance {} admitted as healthy", instance_id);
        }
        return;
    }

    const auto t = m_coordinator.mark_unhealthy(instance_id);
    if (t == Transition::Failed)
    {
        {
            std::lock_guard<std::mutex> lock(m_data_mu);
            ++m_stats.instances_failed;
        }
        LOGGER_WARN("HealthMonitor: instance {} failed health check{}{}", instance_id,
                    outcome.error.empty() ? "" : ": ", outcome.error);
        m_alerts.publish(AlertType::InstanceFailed,
                         {{"instance_id", instance_id}, {"error", outcome.error}});
    }
    else if (t == Transition::Excluded)
    {
        LOGGER_WARN("HealthMonitor: new instance {} failed its first health check", instance_id);
    }
}

void HealthMonitorImpl::analyze(std::size_t probes, std::size_t errors,
                                const std::vector<std::shared_ptr<WorkerInstance>> &instances)
{
    const auto counts = m_coordinator.counts();
    if (counts.total == 0)
    {
        return;
    }

    SystemHealthSample sample;
    sample.timestamp = std::chrono::system_clock::now();
    sample.checked_at = now_from(m_cfg.clock);
    sample.total_instances = counts.total;
    sample.healthy_instances = counts.healthy;
    sample.unhealthy_instances = counts.unhealthy;
    sample.failure_rate =
        static_cast<double>(counts.unhealthy) / static_cast<double>(counts.total);
    sample.error_rate = probes > 0 ? static_cast<double>(errors) / static_cast<double>(probes) : 0.0;

    {
        std::lock_guard<std::mutex> lock(m_data_mu);
        double sum = 0.0;
        std::size_t n = 0;
        for (const auto &instance : instances)
        {
            auto it = m_history.find(instance->id());
            if (it == m_history.end())
                continue;
            std::size_t taken = 0;
            for (auto r = it->second.rbegin();
                 r != it->second.rend() && taken < m_cfg.response_time_window; ++r)
            {
                if (r->healthy)
                {
                    sum += r->response_time;
                    ++n;
                    ++taken;
                }
            }
        }
        sample.avg_response_time = n > 0 ? sum / static_cast<double>(n) : 0.0;

        m_system_history.push_back(sample);
        while (m_system_history.size() > m_cfg.system_history_limit)
        {
            m_system_history.pop_front();
        }
    }

    const auto &th = m_cfg.thresholds;
    if (counts.healthy == 0)
    {
        m_alerts.publish(AlertType::NoHealthyInstances,
                         {{"total_instances", counts.total},
                          {"unhealthy_instances", counts.unhealthy}});
    }
    if (sample.failure_rate > th.instance_failure_rate)
    {
        m_alerts.publish(AlertType::HighFailureRate,
                         {{"failure_rate", sample.failure_rate},
                          {"threshold", th.instance_failure_rate},
                          {"unhealthy_instances", counts.unhealthy},
                          {"total_instances", counts.total}});
    }
    if (sample.avg_response_time > th.response_time)
    {
        m_alerts.publish(AlertType::HighResponseTime,
                         {{"avg_response_time", sample.avg_response_time},
                          {"threshold", th.response_time}});
    }
    if (sample.error_rate > th.error_rate)
    {
        m_alerts.publish(AlertType::HighErrorRate,
                         {{"error_rate", sample.error_rate},
                          {"threshold", th.error_rate},
                          {"probes", probes}});
    }
}

void HealthMonitorImpl::forget_departed(
    const std::vector<std::shared_ptr<WorkerInstance>> &instances)
{
    std::unordered_set<std::string> registered;
    for (const auto &instance : instances)
    {
        registered.insert(instance->id());
    }
    for (auto it = m_outstanding.begin(); it != m_outstanding.end();)
    {
        const bool gone = registered.count(it->first) == 0;
        if (gone && it->second.wait_for(std::chrono::seconds(0)) == std::future_status::ready)
        {
            it = m_outstanding.erase(it);
        }
        else
        {
            ++it;
        }
    }
}

bool HealthMonitorImpl::probe_pending(const std::string &instance_id) const
{
    auto it = m_outstanding.find(instance_id);
    return it != m_outstanding.end() &&
           it->second.wait_for(std::chrono::seconds(0)) != std::future_status::ready;
}

void HealthMonitorImpl::retire_and_replace()
{
    if (m_cfg.retire_after_failures > 0)
    {
        for (const auto &id : m_coordinator.unhealthy_ids())
        {
            const auto failures = m_coordinator.consecutive_failures(id);
            if (failures < m_cfg.retire_after_failures)
                continue;
            // Cleanup must not run under a probe that is still executing.
            if (probe_pending(id))
            {
                LOGGER_DEBUG("HealthMonitor: retirement of {} deferred, probe still running", id);
                continue;
            }
            if (m_coordinator.remove(id))
            {
                LOGGER_WARN("HealthMonitor: retired {} after {} consecutive failures", id,
                            failures);
                std::lock_guard<std::mutex> lock(m_data_mu);
                ++m_stats.instances_retired;
            }
        }
    }

    const auto counts = m_coordinator.counts();
    const std::size_t min_instances = m_coordinator.config().min_instances;
    const std::size_t covered = counts.healthy + counts.unadmitted + counts.pending;
    if (covered >= min_instances)
    {
        return;
    }
    const std::size_t needed = min_instances - covered;
    LOGGER_INFO("HealthMonitor: {} healthy of minimum {}, creating {} replacement(s)",
                counts.healthy, min_instances, needed);
    std::size_t created = 0;
    for (std::size_t i = 0; i < needed; ++i)
    {
        if (!m_coordinator.create())
        {
            break;
        }
        ++created;
    }
    if (created < needed)
    {
        LOGGER_WARN("HealthMonitor: only {} of {} replacement(s) created", created, needed);
    }
    std::lock_guard<std::mutex> lock(m_data_mu);
    m_stats.instances_replaced += created;
}

void HealthMonitorImpl::purge_history()
{
    const auto cutoff = now_from(m_cfg.clock) - m_cfg.history_retention;
    std::lock_guard<std::mutex> lock(m_data_mu);
    for (auto it = m_history.begin(); it != m_history.end();)
    {
        auto &entries = it->second;
        while (!entries.empty() && entries.front().checked_at < cutoff)
        {
            entries.pop_front();
        }
        it = entries.empty() ? m_history.erase(it) : std::next(it);
    }
    while (!m_system_history.empty() && m_system_history.front().checked_at < cutoff)
    {
        m_system_history.pop_front();
    }
}

// ============================================================================
// HealthMonitor public API
// ============================================================================

HealthMonitor::HealthMonitor(InstanceCoordinator &coordinator, AlertChannel &alerts, Config cfg)
    : pImpl(std::make_unique<HealthMonitorImpl>(coordinator, alerts, std::move(cfg)))
{
}

HealthMonitor::~HealthMonitor()
{
    stop();
}

void HealthMonitor::start()
{
    std::lock_guard<std::mutex> lock(pImpl->m_loop_mu);
    if (pImpl->m_running.load())
    {
        return;
    }
    pImpl->m_stop_requested = false;
    pImpl->m_running.store(true);
    pImpl->m_worker = std::thread(&HealthMonitorImpl::run_loop, pImpl.get());
    LOGGER_INFO("HealthMonitor: started (interval {}ms, timeout {}ms)",
                pImpl->m_cfg.health_check_interval.count(), pImpl->m_cfg.instance_timeout.count());
}

void HealthMonitor::stop()
{
    {
        std::lock_guard<std::mutex> lock(pImpl->m_loop_mu);
        if (!pImpl->m_running.load())
        {
            return;
        }
        pImpl->m_stop_requested = true;
    }
    pImpl->m_loop_cv.notify_all();
    if (pImpl->m_worker.joinable())
    {
        pImpl->m_worker.join();
    }
    pImpl->m_running.store(false);
    LOGGER_INFO("HealthMonitor: stopped");
}

bool HealthMonitor::is_running() const noexcept
{
    return pImpl->m_running.load();
}

void HealthMonitor::run_cycle()
{
    pImpl->run_cycle();
}

std::size_t HealthMonitor::drain_outstanding(std::chrono::milliseconds timeout)
{
    std::lock_guard<std::mutex> lock(pImpl->m_cycle_mu);
    const auto deadline = Clock::now() + timeout;
    auto &outstanding = pImpl->m_outstanding;
    for (auto it = outstanding.begin(); it != outstanding.end();)
    {
        if (it->second.wait_until(deadline) == std::future_status::ready)
        {
            it = outstanding.erase(it);
        }
        else
        {
            LOGGER_WARN("HealthMonitor: probe of {} still running after drain", it->first);
            ++it;
        }
    }
    return outstanding.size();
}

std::size_t HealthMonitor::pending_probes() const
{
    std::lock_guard<std::mutex> lock(pImpl->m_cycle_mu);
    return pImpl->m_outstanding.size();
}

HealthStats HealthMonitor::stats() const
{
    std::lock_guard<std::mutex> lock(pImpl->m_data_mu);
    return pImpl->m_stats;
}

nlohmann::json HealthMonitor::get_health_status() const
{
    const auto counts = pImpl->m_coordinator.counts();
    nlohmann::json j;
    j["monitoring_active"] = is_running();
    j["total_instances"] = counts.total;
    j["healthy_instances"] = counts.healthy;
    j["unhealthy_instances"] = counts.unhealthy;
    j["health_check_interval"] =
        std::chrono::duration<double>(pImpl->m_cfg.health_check_interval).count();
    j["instance_timeout"] = std::chrono::duration<double>(pImpl->m_cfg.instance_timeout).count();

    std::lock_guard<std::mutex> lock(pImpl->m_data_mu);
    j["stats"] = pImpl->m_stats;
    if (pImpl->m_last_check)
        j["last_check"] = wall_seconds(*pImpl->m_last_check);
    else
        j["last_check"] = nullptr;
    return j;
}

std::vector<HealthCheckResult>
HealthMonitor::get_instance_health_history(const std::string &instance_id, std::size_t limit) const
{
    std::lock_guard<std::mutex> lock(pImpl->m_data_mu);
    auto it = pImpl->m_history.find(instance_id);
    if (it == pImpl->m_history.end())
    {
        return {};
    }
    return tail(it->second, limit);
}

std::vector<SystemHealthSample> HealthMonitor::get_system_health_history(std::size_t limit) const
{
    std::lock_guard<std::mutex> lock(pImpl->m_data_mu);
    return tail(pImpl->m_system_history, limit);
}

nlohmann::json HealthMonitor::get_metrics_summary() const
{
    const auto &th = pImpl->m_cfg.thresholds;
    nlohmann::json j;
    j["alert_thresholds"] = {{"response_time", th.response_time},
                             {"error_rate", th.error_rate},
                             {"instance_failure_rate", th.instance_failure_rate}};

    std::lock_guard<std::mutex> lock(pImpl->m_data_mu);
    j["stats"] = pImpl->m_stats;
    j["tracked_instances"] = pImpl->m_history.size();
    j["system_history_size"] = pImpl->m_system_history.size();
    if (pImpl->m_system_history.empty())
        j["current"] = nullptr;
    else
        j["current"] = pImpl->m_system_history.back();
    return j;
}

} // namespace workerpool::pool
