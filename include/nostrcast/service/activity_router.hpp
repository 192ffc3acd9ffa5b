#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include <plog/Log.h>

#include "nostrcast/data/coordinate.hpp"
#include "nostrcast/data/domain.hpp"
#include "nostrcast/service/connection_pool.hpp"
#include "nostrcast/util/backoff.hpp"
#include "nostrcast/util/clock.hpp"
#include "nostrcast/util/scheduler.hpp"

namespace nostrcast
{
namespace service
{
typedef std::function<void(const data::ActivityMessage&)> ActivityHandler;

struct ActivityConfig
{
    std::chrono::milliseconds heartbeatInterval = std::chrono::seconds(5);
    std::chrono::milliseconds silenceThreshold = std::chrono::seconds(15);
    std::chrono::milliseconds initialBackoff = std::chrono::seconds(1);
    std::chrono::milliseconds maxBackoff = std::chrono::seconds(30);
    int historyLimit = 50; ///< Stored chat and zap events requested when a coordinate is subscribed.
};

class ActivityRouter;

/**
 * @brief A scoped registration of a handler for one live activity.
 * @remark The handle unsubscribes exactly once, when `cancel` is first called or when the handle
 * is destroyed.  A handle whose coordinate has since been registered again does not remove the
 * newer registration.  Once `cancel` returns, the handler is not called again; if a delivery is
 * in progress on another thread, `cancel` waits for it to finish.
 */
class ActivitySubscription
{
public:
    ActivitySubscription() = default;

    ActivitySubscription(std::weak_ptr<ActivityRouter> router, std::string coordinate, uint64_t generation);

    ~ActivitySubscription();

    ActivitySubscription(const ActivitySubscription&) = delete;

    ActivitySubscription& operator=(const ActivitySubscription&) = delete;

    ActivitySubscription(ActivitySubscription&& other) noexcept;

    ActivitySubscription& operator=(ActivitySubscription&& other) noexcept;

    void cancel();

    bool isActive() const { return this->_isActive; };

    const std::string& coordinate() const { return this->_coordinate; };

private:
    std::weak_ptr<ActivityRouter> _router;
    std::string _coordinate; ///< Normalized.
    uint64_t _generation = 0;
    bool _isActive = false;
};

/**
 * @brief Delivers chat messages and zaps to the handler registered for their live activity.
 * @remark Each coordinate has at most one handler; registering again replaces the handler and
 * its relay subscription.  The router watches for silence on its own subscriptions and reissues
 * them with exponential backoff, independently of the connection pool's health monitor.
 * Instances must be owned by a `std::shared_ptr` so that subscription handles can reach them.
 */
class ActivityRouter : public std::enable_shared_from_this<ActivityRouter>
{
public:
    ActivityRouter(
        std::shared_ptr<util::IClock> clock,
        std::shared_ptr<util::IScheduler> scheduler,
        std::shared_ptr<IConnectionPool> pool,
        ActivityConfig config = ActivityConfig());

    ~ActivityRouter();

    ActivityRouter(const ActivityRouter&) = delete;

    ActivityRouter& operator=(const ActivityRouter&) = delete;

    /**
     * @brief Registers a handler for a live activity and subscribes to its chat and zaps.
     * @param coordinate The activity's `30311:<pubkey>:<d>` coordinate, in any case.
     * @returns A handle that removes the registration when cancelled or destroyed.
     * @remark Any earlier subscription for the same coordinate is closed first.
     */
    ActivitySubscription subscribe(const std::string& coordinate, ActivityHandler handler);

    /**
     * @brief Delivers a message to the handler registered for its coordinate.
     * @returns False if the message has no coordinate, or no handler is registered for it or its
     * handler is being removed.
     */
    bool route(const data::ActivityMessage& message);

    /**
     * @brief Reissues the filter for a subscription that the connection pool dropped while
     * reconnecting.
     * @returns False if the subscription does not belong to this router.
     */
    bool reissue(const std::string& subscriptionId);

    #pragma region Health

    void startHeartbeat();

    void stopHeartbeat();

    /**
     * @brief Begins reconnecting if subscriptions are active and no message has been routed
     * within the silence threshold.
     */
    void checkHealth();

    bool isHealthy();

    std::chrono::milliseconds reconnectDelay();

    #pragma endregion

    size_t activeSubscriptionCount();

    /**
     * @returns The relay subscription ID for a coordinate, or an empty string if none.
     */
    std::string subscriptionIdFor(const std::string& coordinate);

private:
    friend class ActivitySubscription;

    /**
     * @brief Tracks the calls in progress to one registration's handler.
     */
    struct Delivery
    {
        std::mutex mutex;
        std::condition_variable finished;
        bool isStopped = false;
        std::vector<std::thread::id> deliveringThreads; ///< One entry per call in progress.
    };

    struct Registration
    {
        uint64_t generation = 0;
        ActivityHandler handler;
        std::string subscriptionId;
        std::shared_ptr<Delivery> delivery;
    };

    std::shared_ptr<util::IClock> _clock;
    std::shared_ptr<util::IScheduler> _scheduler;
    std::shared_ptr<IConnectionPool> _pool;
    ActivityConfig _config;

    ///< Guards the handler table.
    std::mutex _registrationMutex;
    std::unordered_map<std::string, Registration> _registrations;
    uint64_t _nextGeneration = 1;

    ///< Guards the heartbeat state machine.
    std::mutex _healthMutex;
    bool _isHealthy = true;
    bool _isMonitoring = false;
    util::ExponentialBackoff _backoff;
    std::chrono::system_clock::time_point _lastActivityAt;
    util::IScheduler::TaskId _heartbeatTaskId = 0;
    util::IScheduler::TaskId _reconnectTaskId = 0;

    void _unsubscribe(const std::string& coordinate, uint64_t generation);

    /**
     * @brief Prevents further calls to a registration's handler and waits for calls already in
     * progress on other threads.
     * @remark A call in progress on the current thread is not waited for, so a handler may cancel
     * its own subscription.
     */
    void _stopDelivery(std::shared_ptr<Delivery> delivery);

    std::string _issueFilter(const std::string& coordinate);

    /**
     * @brief Records a new relay subscription for a registration, or closes it if the
     * registration has been replaced in the meantime.
     */
    void _attachSubscription(const std::string& coordinate, uint64_t generation, const std::string& subscriptionId);

    void _markActivity();

    void _scheduleHeartbeat();

    void _attemptReconnect();
};
} // namespace service
} // namespace nostrcast
