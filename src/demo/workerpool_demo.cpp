/**
 * @file workerpool_demo.cpp
 * @brief Runs a pool of simulated workers under a synthetic request load.
 *
 * Usage: workerpool_demo [pool_config.json]
 *
 * Simulated workers honour two keys in instance_defaults.options:
 *   "probe_failure_rate" (0..1) and "work_ms" (mean time per request).
 * Stops on SIGINT/SIGTERM.
 */
#include "wkp_pool.hpp"

#include <algorithm>
#include <atomic>
#include <csignal>
#include <cstdio>
#include <random>
#include <thread>
#include <vector>

using namespace workerpool;
using namespace std::chrono_literals;

namespace
{
volatile std::sig_atomic_t g_stop = 0; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)

void signal_handler(int /*sig*/)
{
    g_stop = 1;
}

class SimulatedWorker : public pool::WorkerInstance
{
  public:
    SimulatedWorker(std::string id, pool::InstanceConfig cfg)
        : WorkerInstance(std::move(id), std::move(cfg)),
          m_failure_rate(config().options.value("probe_failure_rate", 0.05)),
          m_work_ms(config().options.value("work_ms", 200)),
          m_rng(std::random_device{}())
    {
    }

  protected:
    bool do_initialize() override
    {
        std::this_thread::sleep_for(50ms);
        return true;
    }

    bool do_probe() override
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(draw(5, 40)));
        std::lock_guard<std::mutex> lock(m_mu);
        return std::bernoulli_distribution(m_failure_rate)(m_rng) == false;
    }

    bool do_send(const std::string & /*content*/,
                 const std::vector<pool::Attachment> & /*attachments*/) override
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(draw(m_work_ms / 2, m_work_ms * 3 / 2)));
        return true;
    }

  private:
    int draw(int lo, int hi)
    {
        std::lock_guard<std::mutex> lock(m_mu);
        return std::uniform_int_distribution<int>(lo, std::max(lo, hi))(m_rng);
    }

    const double m_failure_rate;
    const int m_work_ms;
    std::mutex m_mu;
    std::mt19937 m_rng;
};

pool::PoolConfig demo_defaults()
{
    pool::PoolConfig cfg;
    cfg.coordinator.min_instances = 2;
    cfg.coordinator.max_instances = 6;
    cfg.coordinator.initial_count = 2;
    cfg.coordinator.scale_cooldown = 5s;
    cfg.balancer.retry_delay = 100ms;
    cfg.monitor.health_check_interval = 2s;
    cfg.monitor.instance_timeout = 1s;
    return cfg;
}

void client_loop(pool::PoolManager &manager, int client)
{
    std::uint64_t n = 0;
    while (g_stop == 0)
    {
        const std::string request_id = fmt::format("client{}-{}", client, n++);
        auto routed = manager.route(request_id, {{"content", "ping"}});
        if (routed.is_error())
        {
            LOGGER_WARN("demo: {} not routed: {}", request_id, pool::to_string(routed.error()));
            std::this_thread::sleep_for(500ms);
            continue;
        }

        bool ok = false;
        if (auto instance = manager.coordinator().find_instance(routed.content()))
        {
            ok = instance->send("ping");
        }
        manager.complete(request_id, ok, ok ? 4 : 0);
    }
}
} // namespace

int main(int argc, char *argv[])
{
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    pool::PoolConfig cfg;
    try
    {
        cfg = argc >= 2 ? pool::PoolConfig::from_json_file(argv[1]) // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
                        : demo_defaults();
    }
    catch (const std::exception &e)
    {
        std::fprintf(stderr, "workerpool_demo: %s\n", e.what());
        return 1;
    }

    pool::PoolManager manager(cfg, [](const std::string &id, const pool::InstanceConfig &ic)
                              { return std::make_shared<SimulatedWorker>(id, ic); });

    manager.add_alert_callback([](const pool::Alert &alert)
                               { LOGGER_WARN("demo: alert {} {}", pool::to_string(alert.type),
                                             alert.data.dump()); });

    try
    {
        manager.start();
    }
    catch (const pool::PoolBootstrapError &e)
    {
        LOGGER_ERROR("demo: {}", e.what());
        utils::Logger::instance().shutdown();
        return 1;
    }

    std::vector<std::thread> clients;
    for (int i = 0; i < 4; ++i)
    {
        clients.emplace_back(client_loop, std::ref(manager), i);
    }

    int ticks = 0;
    while (g_stop == 0)
    {
        std::this_thread::sleep_for(100ms);
        if (++ticks % 50 == 0)
        {
            LOGGER_INFO("demo: status {}", manager.get_status().dump());
        }
    }

    for (auto &t : clients)
    {
        t.join();
    }
    LOGGER_INFO("demo: final routing stats {}", nlohmann::json(manager.get_routing_stats()).dump(2));
    manager.stop();
    utils::Logger::instance().shutdown();
    return 0;
}
