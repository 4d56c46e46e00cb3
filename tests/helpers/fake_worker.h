#pragma once
/**
 * @file fake_worker.h
 * @brief Scriptable WorkerInstance and manual clock shared by the pool tests.
 *
 * Every FakeWorker reads its behavior from a FakeBehavior block that the test
 * keeps a handle to, so a test can flip a worker to failing, throwing or
 * hanging between health cycles. FakeWorkerFactory records the behavior of
 * each instance it builds, keyed by instance id, in creation order.
 */
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "wkp_pool.hpp"

namespace workerpool::test
{

/// Steady-clock stand-in that only moves when advance() is called.
class ManualClock
{
  public:
    pool::Clock::time_point now() const
    {
        std::lock_guard<std::mutex> lock(m_mu);
        return m_now;
    }

    void advance(pool::Clock::duration d)
    {
        std::lock_guard<std::mutex> lock(m_mu);
        m_now += d;
    }

    pool::ClockFn fn()
    {
        return [this] { return now(); };
    }

  private:
    mutable std::mutex m_mu;
    pool::Clock::time_point m_now{pool::Clock::now()};
};

struct FakeBehavior
{
    std::atomic<bool> init_ok{true};
    std::atomic<bool> degraded_ok{false};
    std::atomic<bool> probe_ok{true};
    std::atomic<bool> probe_throws{false};
    std::atomic<bool> regenerate_ok{true};
    std::atomic<bool> send_ok{true};

    std::atomic<int> probes{0};
    std::atomic<int> regenerations{0};
    std::atomic<int> releases{0};
    /// Probes currently inside do_probe().
    std::atomic<int> probing{0};
    /// do_release() calls that ran while a probe was still inside do_probe().
    std::atomic<int> released_while_probing{0};

    /// While set, do_probe() blocks until release_hang() (or a 5s safety cap).
    void hang()
    {
        std::lock_guard<std::mutex> lock(m_mu);
        m_hanging = true;
    }

    void release_hang()
    {
        {
            std::lock_guard<std::mutex> lock(m_mu);
            m_hanging = false;
        }
        m_cv.notify_all();
    }

    void wait_while_hanging()
    {
        std::unique_lock<std::mutex> lock(m_mu);
        m_cv.wait_for(lock, std::chrono::seconds(5), [this] { return !m_hanging; });
    }

  private:
    std::mutex m_mu;
    std::condition_variable m_cv;
    bool m_hanging{false};
};

class FakeWorker : public pool::WorkerInstance
{
  public:
    FakeWorker(std::string id, pool::InstanceConfig cfg, std::shared_ptr<FakeBehavior> behavior)
        : WorkerInstance(std::move(id), std::move(cfg)), m_behavior(std::move(behavior))
    {
    }

    ~FakeWorker() override { cleanup(); }

  protected:
    bool do_initialize() override { return m_behavior->init_ok.load(); }

    bool do_enter_degraded_mode() override { return m_behavior->degraded_ok.load(); }

    bool do_probe() override
    {
        ++m_behavior->probes;
        struct InProbe
        {
            FakeBehavior &b;
            explicit InProbe(FakeBehavior &behavior) : b(behavior) { ++b.probing; }
            ~InProbe() { --b.probing; }
        } in_probe(*m_behavior);
        m_behavior->wait_while_hanging();
        if (m_behavior->probe_throws.load())
        {
            throw std::runtime_error("probe exploded");
        }
        return m_behavior->probe_ok.load();
    }

    bool do_regenerate_session() override
    {
        ++m_behavior->regenerations;
        return m_behavior->regenerate_ok.load();
    }

    bool do_send(const std::string & /*content*/,
                 const std::vector<pool::Attachment> & /*attachments*/) override
    {
        return m_behavior->send_ok.load();
    }

    void do_release() noexcept override
    {
        if (m_behavior->probing.load() > 0)
            ++m_behavior->released_while_probing;
        ++m_behavior->releases;
    }

  private:
    std::shared_ptr<FakeBehavior> m_behavior;
};

/// Builds FakeWorkers and keeps a handle on each one's behavior.
class FakeWorkerFactory
{
  public:
    /// Applied to the next instance built; reset to true afterwards.
    std::atomic<bool> next_init_ok{true};
    std::atomic<int> built{0};

    pool::InstanceFactory make()
    {
        return [this](const std::string &id, const pool::InstanceConfig &cfg)
        {
            auto behavior = std::make_shared<FakeBehavior>();
            behavior->init_ok = next_init_ok.exchange(true);
            {
                std::lock_guard<std::mutex> lock(m_mu);
                m_records.push_back(Record{id, behavior});
            }
            ++built;
            return std::make_shared<FakeWorker>(id, cfg, behavior);
        };
    }

    std::shared_ptr<FakeBehavior> behavior(const std::string &id) const
    {
        std::lock_guard<std::mutex> lock(m_mu);
        for (const auto &r : m_records)
        {
            if (r.id == id)
                return r.behavior;
        }
        return nullptr;
    }

    /// Ids of every instance built, including ones that failed to initialize.
    std::vector<std::string> ids() const
    {
        std::vector<std::string> out;
        std::lock_guard<std::mutex> lock(m_mu);
        for (const auto &r : m_records)
            out.push_back(r.id);
        return out;
    }

    void release_all_hangs()
    {
        std::lock_guard<std::mutex> lock(m_mu);
        for (const auto &r : m_records)
            r.behavior->release_hang();
    }

  private:
    struct Record
    {
        std::string id;
        std::shared_ptr<FakeBehavior> behavior;
    };
    mutable std::mutex m_mu;
    std::vector<Record> m_records;
};

} // namespace workerpool::test
