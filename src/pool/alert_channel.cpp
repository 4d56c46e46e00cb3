#include "pool/alert_channel.hpp"

#include <algorithm>

#include "utils/logger.hpp"

namespace workerpool::pool
{

const char *to_string(AlertType type) noexcept
{
    switch (type)
    {
    case AlertType::InstanceFailed:
        return "instance_failed";
    case AlertType::InstanceRecovered:
        return "instance_recovered";
    case AlertType::HighFailureRate:
        return "high_failure_rate";
    case AlertType::HighResponseTime:
        return "high_response_time";
    case AlertType::HighErrorRate:
        return "high_error_rate";
    case AlertType::NoHealthyInstances:
        return "no_healthy_instances";
    }
    return "unknown";
}

void to_json(nlohmann::json &j, const Alert &alert)
{
    j = nlohmann::json{{"type", to_string(alert.type)},
                       {"timestamp", std::chrono::duration<double>(
                                         alert.timestamp.time_since_epoch())
                                         .count()},
                       {"data", alert.data}};
}

SubscriptionId AlertChannel::subscribe(AlertCallback callback)
{
    std::lock_guard<std::mutex> lock(m_mu);
    const SubscriptionId id = m_next_id++;
    m_subscribers.emplace_back(id, std::move(callback));
    return id;
}

bool AlertChannel::unsubscribe(SubscriptionId id)
{
    std::lock_guard<std::mutex> lock(m_mu);
    auto it = std::find_if(m_subscribers.begin(), m_subscribers.end(),
                           [id](const auto &entry) { return entry.first == id; });
    if (it == m_subscribers.end())
    {
        return false;
    }
    m_subscribers.erase(it);
    return true;
}

std::size_t AlertChannel::publish(const Alert &alert)
{
    std::vector<std::pair<SubscriptionId, AlertCallback>> targets;
    {
        std::lock_guard<std::mutex> lock(m_mu);
        targets = m_subscribers;
        ++m_published;
    }

    LOGGER_INFO("Alert {}: {}", to_string(alert.type), alert.data.dump());

    std::size_t delivered = 0;
    std::uint64_t failures = 0;
    for (const auto &[id, callback] : targets)
    {
        try
        {
            callback(alert);
            ++delivered;
        }
        catch (const std::exception &e)
        {
            ++failures;
            LOGGER_ERROR("Alert subscriber #{} failed on {}: {}", id, to_string(alert.type),
                         e.what());
        }
        catch (...)
        {
            ++failures;
            LOGGER_ERROR("Alert subscriber #{} failed on {}: non-standard exception", id,
                         to_string(alert.type));
        }
    }

    if (failures > 0)
    {
        std::lock_guard<std::mutex> lock(m_mu);
        m_delivery_failures += failures;
    }
    return delivered;
}

std::size_t AlertChannel::publish(AlertType type, nlohmann::json data)
{
    return publish(Alert{type, std::chrono::system_clock::now(), std::move(data)});
}

std::size_t AlertChannel::subscriber_count() const
{
    std::lock_guard<std::mutex> lock(m_mu);
    return m_subscribers.size();
}

std::uint64_t AlertChannel::published_count() const
{
    std::lock_guard<std::mutex> lock(m_mu);
    return m_published;
}

std::uint64_t AlertChannel::delivery_failures() const
{
    std::lock_guard<std::mutex> lock(m_mu);
    return m_delivery_failures;
}

} // namespace workerpool::pool
