#include "pool/worker_instance.hpp"

#include "utils/logger.hpp"

namespace workerpool::pool
{

const char *to_string(InstanceStatus status) noexcept
{
    switch (status)
    {
    case InstanceStatus::Initializing:
        return "initializing";
    case InstanceStatus::Ready:
        return "ready";
    case InstanceStatus::ReadyDegraded:
        return "ready_degraded";
    case InstanceStatus::Regenerating:
        return "regenerating";
    case InstanceStatus::Failed:
        return "failed";
    case InstanceStatus::Removed:
        return "removed";
    }
    return "unknown";
}

void to_json(nlohmann::json &j, const InstanceSnapshot &s)
{
    j = nlohmann::json{{"instance_id", s.instance_id},
                       {"status", to_string(s.status)},
                       {"created_at_age", s.created_at_age},
                       {"last_activity_age", s.last_activity_age},
                       {"session_age", s.session_age},
                       {"request_count", s.request_count},
                       {"max_requests_per_session", s.max_requests_per_session},
                       {"session_expired", s.session_expired}};
}

WorkerInstance::WorkerInstance(std::string instance_id, InstanceConfig config)
    : m_id(std::move(instance_id)), m_config(std::move(config))
{
    const auto t = now();
    m_created_at = t;
    m_last_activity = t;
    m_session_created_at = t;
}

WorkerInstance::~WorkerInstance() = default;

bool WorkerInstance::transition(InstanceStatus from, InstanceStatus to) noexcept
{
    return m_status.compare_exchange_strong(from, to, std::memory_order_acq_rel);
}

bool WorkerInstance::initialize()
{
    if (status() != InstanceStatus::Initializing)
    {
        return is_serviceable(status());
    }

    bool ok = false;
    try
    {
        ok = do_initialize();
    }
    catch (const std::exception &e)
    {
        LOGGER_WARN("[{}] setup error: {}", m_id, e.what());
    }

    if (ok)
    {
        {
            std::lock_guard<std::mutex> lock(m_time_mu);
            m_session_created_at = now();
            m_last_activity = m_session_created_at;
        }
        if (transition(InstanceStatus::Initializing, InstanceStatus::Ready))
        {
            LOGGER_INFO("[{}] ready", m_id);
            return true;
        }
        return false;
    }

    bool degraded = false;
    try
    {
        degraded = do_enter_degraded_mode();
    }
    catch (const std::exception &e)
    {
        LOGGER_WARN("[{}] degraded mode setup error: {}", m_id, e.what());
    }

    if (degraded && transition(InstanceStatus::Initializing, InstanceStatus::ReadyDegraded))
    {
        LOGGER_WARN("[{}] running in degraded mode", m_id);
        return true;
    }

    if (transition(InstanceStatus::Initializing, InstanceStatus::Failed))
    {
        LOGGER_ERROR("[{}] initialization failed", m_id);
    }
    return false;
}

bool WorkerInstance::session_expired() const
{
    std::lock_guard<std::mutex> lock(m_time_mu);
    const auto age = now() - m_session_created_at;
    return age > m_config.session_lifetime ||
           request_count() >= m_config.max_requests_per_session;
}

bool WorkerInstance::regenerate_session()
{
    if (!transition(InstanceStatus::Ready, InstanceStatus::Regenerating))
    {
        return is_serviceable(status());
    }
    LOGGER_INFO("[{}] session expired after {} requests, regenerating", m_id, request_count());

    bool ok = false;
    try
    {
        ok = do_regenerate_session();
    }
    catch (const std::exception &e)
    {
        LOGGER_WARN("[{}] session regeneration error: {}", m_id, e.what());
    }

    if (ok)
    {
        std::lock_guard<std::mutex> lock(m_time_mu);
        m_session_created_at = now();
        m_request_count.store(0, std::memory_order_relaxed);
    }
    // A concurrent cleanup() leaves the instance removed.
    transition(InstanceStatus::Regenerating, InstanceStatus::Ready);

    if (!ok)
    {
        LOGGER_WARN("[{}] session regeneration failed", m_id);
    }
    return ok && status() == InstanceStatus::Ready;
}

bool WorkerInstance::health_check()
{
    const auto st = status();
    if (!is_serviceable(st))
    {
        return false;
    }
    if (!do_probe())
    {
        return false;
    }
    // Degraded sessions have no regeneration path.
    if (st == InstanceStatus::Ready && session_expired())
    {
        return regenerate_session();
    }
    return is_serviceable(status());
}

bool WorkerInstance::send(const std::string &content, const std::vector<Attachment> &attachments)
{
    const auto st = status();
    if (!is_serviceable(st))
    {
        LOGGER_WARN("[{}] rejected work in state {}", m_id, to_string(st));
        return false;
    }

    bool ok = false;
    try
    {
        ok = do_send(content, attachments);
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("[{}] send failed: {}", m_id, e.what());
        return false;
    }

    if (ok)
    {
        m_request_count.fetch_add(1, std::memory_order_relaxed);
        std::lock_guard<std::mutex> lock(m_time_mu);
        m_last_activity = now();
    }
    return ok;
}

void WorkerInstance::cleanup() noexcept
{
    const auto prev = m_status.exchange(InstanceStatus::Removed, std::memory_order_acq_rel);
    if (prev == InstanceStatus::Removed)
    {
        return;
    }
    do_release();
    LOGGER_INFO("[{}] removed (was {})", m_id, to_string(prev));
}

InstanceSnapshot WorkerInstance::status_snapshot() const
{
    InstanceSnapshot s;
    s.instance_id = m_id;
    s.status = status();
    s.request_count = request_count();
    s.max_requests_per_session = m_config.max_requests_per_session;

    std::lock_guard<std::mutex> lock(m_time_mu);
    const auto t = now();
    s.created_at_age = seconds_between(m_created_at, t);
    s.last_activity_age = seconds_between(m_last_activity, t);
    s.session_age = seconds_between(m_session_created_at, t);
    s.session_expired = (t - m_session_created_at) > m_config.session_lifetime ||
                        s.request_count >= m_config.max_requests_per_session;
    return s;
}

} // namespace workerpool::pool
