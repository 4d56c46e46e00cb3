#pragma once
/**
 * @file instance_registry.hpp
 * @brief Creates, tracks and destroys WorkerInstances within a size bound.
 *
 * Thread-safe. Slow work (instance initialize and cleanup) always runs
 * outside the registry lock; a slot is reserved before initialization so
 * concurrent creates can never overshoot max_instances.
 */

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "pool/worker_instance.hpp"
#include "workerpool_export.h"

namespace workerpool::pool
{

struct RegistryEntry
{
    std::shared_ptr<WorkerInstance> instance;
    uint64_t sequence{0}; ///< Creation order, strictly increasing.
};

class WORKERPOOL_EXPORT InstanceRegistry
{
  public:
    InstanceRegistry(InstanceFactory factory, InstanceConfig defaults, std::size_t max_instances);
    ~InstanceRegistry();

    InstanceRegistry(const InstanceRegistry &) = delete;
    InstanceRegistry &operator=(const InstanceRegistry &) = delete;

    /**
     * @brief Create and initialize one instance with the default config.
     * @return The new id, or nullopt when the pool is full, the factory
     *         fails, or the instance ends initialization in `failed`.
     */
    std::optional<std::string> create();
    std::optional<std::string> create(const InstanceConfig &config);

    /// Remove the instance and run its cleanup. False if unknown.
    bool destroy(const std::string &instance_id);

    /// Destroy every instance; returns the ids removed.
    std::vector<std::string> clear();

    [[nodiscard]] std::shared_ptr<WorkerInstance> find(const std::string &instance_id) const;
    [[nodiscard]] bool contains(const std::string &instance_id) const;
    [[nodiscard]] std::optional<uint64_t> sequence_of(const std::string &instance_id) const;

    /// All entries ordered by creation sequence.
    [[nodiscard]] std::vector<RegistryEntry> snapshot() const;

    [[nodiscard]] std::size_t size() const;
    /// Creations reserved but not yet finished.
    [[nodiscard]] std::size_t pending() const;
    [[nodiscard]] std::size_t max_instances() const noexcept { return m_max_instances; }
    [[nodiscard]] const InstanceConfig &defaults() const noexcept { return m_defaults; }

  private:
    InstanceFactory m_factory;
    const InstanceConfig m_defaults;
    const std::size_t m_max_instances;

    mutable std::mutex m_mu;
    std::unordered_map<std::string, RegistryEntry> m_entries;
    std::size_t m_pending{0};
    uint64_t m_next_sequence{1};
};

} // namespace workerpool::pool
