#pragma once
/**
 * @file worker_instance.hpp
 * @brief WorkerInstance: one unit of session capacity and its lifecycle.
 *
 * State machine:
 * @code
 *   initializing --> ready | ready_degraded | failed
 *   ready --> regenerating --> ready            (session expiry)
 *   any --> removed                             (cleanup, terminal)
 * @endcode
 *
 * The base class owns the state machine, the request counter and the session
 * expiry policy. Subclasses supply the actual interaction through the
 * protected `do_*` hooks; every hook except `do_probe()` may throw and the
 * base turns the exception into a state transition. Probe exceptions reach
 * the caller of health_check() so the Health Monitor can record them.
 *
 * Subclasses that acquire resources in do_initialize() must release them in
 * do_release(). The registry always calls cleanup() before dropping its
 * reference; a subclass destructor may call cleanup() as well.
 */

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "pool/clock.hpp"
#include "workerpool_export.h"

namespace workerpool::pool
{

enum class InstanceStatus
{
    Initializing,
    Ready,
    ReadyDegraded,
    Regenerating,
    Failed,
    Removed,
};

WORKERPOOL_EXPORT const char *to_string(InstanceStatus status) noexcept;

/// Ready or ReadyDegraded: the instance accepts work.
[[nodiscard]] inline bool is_serviceable(InstanceStatus status) noexcept
{
    return status == InstanceStatus::Ready || status == InstanceStatus::ReadyDegraded;
}

struct InstanceConfig
{
    std::size_t max_requests_per_session{100};
    std::chrono::seconds session_lifetime{3600};
    std::string label{"worker"};
    nlohmann::json options = nlohmann::json::object(); ///< Passed through to the subclass.
    ClockFn clock;
};

/// A file or blob sent alongside the text content of a work item.
struct Attachment
{
    std::string name;
    std::string mime_type;
    std::string data;
};

/// Read-only projection of an instance; ages are in seconds.
struct InstanceSnapshot
{
    std::string instance_id;
    InstanceStatus status{InstanceStatus::Initializing};
    double created_at_age{0.0};
    double last_activity_age{0.0};
    double session_age{0.0};
    std::size_t request_count{0};
    std::size_t max_requests_per_session{0};
    bool session_expired{false};
};

WORKERPOOL_EXPORT void to_json(nlohmann::json &j, const InstanceSnapshot &s);

class WORKERPOOL_EXPORT WorkerInstance
{
  public:
    WorkerInstance(std::string instance_id, InstanceConfig config);
    virtual ~WorkerInstance();

    WorkerInstance(const WorkerInstance &) = delete;
    WorkerInstance &operator=(const WorkerInstance &) = delete;

    [[nodiscard]] const std::string &id() const noexcept { return m_id; }
    [[nodiscard]] InstanceStatus status() const noexcept
    {
        return m_status.load(std::memory_order_acquire);
    }
    [[nodiscard]] std::size_t request_count() const noexcept
    {
        return m_request_count.load(std::memory_order_relaxed);
    }

    /**
     * @brief Bring the instance out of `initializing`.
     *
     * A false or throwing do_initialize() falls back to degraded mode when
     * do_enter_degraded_mode() succeeds, otherwise the instance is `failed`.
     * Calling it again after the first attempt only reports the outcome.
     *
     * @return true if the instance ended in ready or ready_degraded.
     */
    bool initialize();

    /**
     * @brief Liveness probe plus session-expiry policy.
     *
     * Only a `ready` instance is subject to expiry; an expired session is
     * regenerated before the result is reported. A failed regeneration leaves
     * the instance `ready` and reports unhealthy for this probe.
     *
     * @throws whatever do_probe() throws.
     */
    bool health_check();

    /// Forward one work item. Rejected unless ready or ready_degraded.
    bool send(const std::string &content, const std::vector<Attachment> &attachments = {});

    /// Release everything and enter `removed`. Idempotent.
    void cleanup() noexcept;

    [[nodiscard]] InstanceSnapshot status_snapshot() const;

    [[nodiscard]] bool session_expired() const;

    [[nodiscard]] const InstanceConfig &config() const noexcept { return m_config; }

  protected:
    virtual bool do_initialize() = 0;

    /// Set up reduced-capability operation after do_initialize() failed.
    virtual bool do_enter_degraded_mode() { return false; }

    virtual bool do_probe() = 0;

    virtual bool do_regenerate_session() { return true; }

    virtual bool do_send(const std::string &content, const std::vector<Attachment> &attachments) = 0;

    virtual void do_release() noexcept {}

    [[nodiscard]] Clock::time_point now() const { return now_from(m_config.clock); }

  private:
    bool transition(InstanceStatus from, InstanceStatus to) noexcept;
    bool regenerate_session();

    const std::string m_id;
    const InstanceConfig m_config;

    std::atomic<InstanceStatus> m_status{InstanceStatus::Initializing};
    std::atomic<std::size_t> m_request_count{0};

    mutable std::mutex m_time_mu;
    Clock::time_point m_created_at;
    Clock::time_point m_last_activity;
    Clock::time_point m_session_created_at;
};

using InstanceFactory =
    std::function<std::shared_ptr<WorkerInstance>(const std::string &id, const InstanceConfig &)>;

} // namespace workerpool::pool
