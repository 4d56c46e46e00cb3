#include "pool/instance_registry.hpp"

#include <algorithm>
#include <stdexcept>

#include "utils/logger.hpp"
#include "utils/uid_utils.hpp"

namespace workerpool::pool
{

InstanceRegistry::InstanceRegistry(InstanceFactory factory, InstanceConfig defaults,
                                   std::size_t max_instances)
    : m_factory(std::move(factory)), m_defaults(std::move(defaults)),
      m_max_instances(max_instances)
{
    if (!m_factory)
    {
        throw std::invalid_argument("InstanceRegistry: factory must not be empty");
    }
}

InstanceRegistry::~InstanceRegistry()
{
    clear();
}

std::optional<std::string> InstanceRegistry::create()
{
    return create(m_defaults);
}

std::optional<std::string> InstanceRegistry::create(const InstanceConfig &config)
{
    {
        std::lock_guard<std::mutex> lock(m_mu);
        if (m_entries.size() + m_pending >= m_max_instances)
        {
            LOGGER_WARN("Registry: pool is full ({}/{}), create refused", m_entries.size(),
                        m_max_instances);
            return std::nullopt;
        }
        ++m_pending;
    }

    std::string id;
    std::shared_ptr<WorkerInstance> instance;
    try
    {
        do
        {
            id = uid::generate_instance_id(config.label);
        } while (contains(id));
        instance = m_factory(id, config);
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("Registry: instance factory threw: {}", e.what());
    }

    const bool ok = instance && instance->initialize();
    if (!ok)
    {
        {
            std::lock_guard<std::mutex> lock(m_mu);
            --m_pending;
        }
        if (instance)
        {
            instance->cleanup();
        }
        LOGGER_WARN("Registry: failed to create instance '{}'", id);
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(m_mu);
    --m_pending;
    const uint64_t seq = m_next_sequence++;
    m_entries.emplace(id, RegistryEntry{instance, seq});
    LOGGER_INFO("Registry: created instance {} (#{}, {} total)", id, seq, m_entries.size());
    return id;
}

bool InstanceRegistry::destroy(const std::string &instance_id)
{
    std::shared_ptr<WorkerInstance> instance;
    {
        std::lock_guard<std::mutex> lock(m_mu);
        auto it = m_entries.find(instance_id);
        if (it == m_entries.end())
        {
            return false;
        }
        instance = std::move(it->second.instance);
        m_entries.erase(it);
    }
    instance->cleanup();
    return true;
}

std::vector<std::string> InstanceRegistry::clear()
{
    std::unordered_map<std::string, RegistryEntry> drained;
    {
        std::lock_guard<std::mutex> lock(m_mu);
        drained.swap(m_entries);
    }
    std::vector<std::string> ids;
    ids.reserve(drained.size());
    for (auto &[id, entry] : drained)
    {
        entry.instance->cleanup();
        ids.push_back(id);
    }
    return ids;
}

std::shared_ptr<WorkerInstance> InstanceRegistry::find(const std::string &instance_id) const
{
    std::lock_guard<std::mutex> lock(m_mu);
    auto it = m_entries.find(instance_id);
    return it == m_entries.end() ? nullptr : it->second.instance;
}

bool InstanceRegistry::contains(const std::string &instance_id) const
{
    std::lock_guard<std::mutex> lock(m_mu);
    return m_entries.count(instance_id) != 0;
}

std::optional<uint64_t> InstanceRegistry::sequence_of(const std::string &instance_id) const
{
    std::lock_guard<std::mutex> lock(m_mu);
    auto it = m_entries.find(instance_id);
    if (it == m_entries.end())
    {
        return std::nullopt;
    }
    return it->second.sequence;
}

std::vector<RegistryEntry> InstanceRegistry::snapshot() const
{
    std::vector<RegistryEntry> out;
    {
        std::lock_guard<std::mutex> lock(m_mu);
        out.reserve(m_entries.size());
        for (const auto &[id, entry] : m_entries)
        {
            out.push_back(entry);
        }
    }
    std::sort(out.begin(), out.end(),
              [](const RegistryEntry &a, const RegistryEntry &b) { return a.sequence < b.sequence; });
    return out;
}

std::size_t InstanceRegistry::size() const
{
    std::lock_guard<std::mutex> lock(m_mu);
    return m_entries.size();
}

std::size_t InstanceRegistry::pending() const
{
    std::lock_guard<std::mutex> lock(m_mu);
    return m_pending;
}

} // namespace workerpool::pool
