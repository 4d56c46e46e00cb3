#pragma once
/**
 * @file alert_channel.hpp
 * @brief Typed publish/subscribe channel for pool alerts.
 *
 * publish() delivers synchronously on the publishing thread. The subscriber
 * list is copied under the lock and invoked outside it, so a callback may
 * subscribe or unsubscribe without deadlocking. An exception thrown by one
 * subscriber is logged and counted; delivery continues with the next one.
 */

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "workerpool_export.h"

namespace workerpool::pool
{

enum class AlertType
{
    InstanceFailed,
    InstanceRecovered,
    HighFailureRate,
    HighResponseTime,
    HighErrorRate,
    NoHealthyInstances,
};

WORKERPOOL_EXPORT const char *to_string(AlertType type) noexcept;

struct Alert
{
    AlertType type;
    std::chrono::system_clock::time_point timestamp;
    nlohmann::json data;
};

WORKERPOOL_EXPORT void to_json(nlohmann::json &j, const Alert &alert);

using AlertCallback = std::function<void(const Alert &)>;
using SubscriptionId = std::uint64_t;

class WORKERPOOL_EXPORT AlertChannel
{
  public:
    AlertChannel() = default;
    AlertChannel(const AlertChannel &) = delete;
    AlertChannel &operator=(const AlertChannel &) = delete;

    /// Ids start at 1 and are never reused.
    SubscriptionId subscribe(AlertCallback callback);
    bool unsubscribe(SubscriptionId id);

    /**
     * @brief Deliver @p alert to every current subscriber.
     * @return Number of subscribers that returned normally.
     */
    std::size_t publish(const Alert &alert);

    /// Build an Alert stamped with the current wall-clock time and publish it.
    std::size_t publish(AlertType type, nlohmann::json data);

    [[nodiscard]] std::size_t subscriber_count() const;
    [[nodiscard]] std::uint64_t published_count() const;
    [[nodiscard]] std::uint64_t delivery_failures() const;

  private:
    mutable std::mutex m_mu;
    std::vector<std::pair<SubscriptionId, AlertCallback>> m_subscribers;
    SubscriptionId m_next_id{1};
    std::uint64_t m_published{0};
    std::uint64_t m_delivery_failures{0};
};

} // namespace workerpool::pool
