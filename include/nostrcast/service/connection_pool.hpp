#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <tuple>
#include <unordered_map>
#include <vector>

#include <plog/Init.h>
#include <plog/Log.h>

#include "nostrcast/client/web_socket_client.hpp"
#include "nostrcast/data/data.hpp"
#include "nostrcast/util/backoff.hpp"
#include "nostrcast/util/clock.hpp"
#include "nostrcast/util/scheduler.hpp"

namespace nostrcast
{
namespace service
{
/**
 * @brief How a subscription is restored after the pool reconnects.
 */
enum class ResubscribePolicy
{
    AUTOMATIC, ///< The pool reissues the retained filter under the original subscription ID.
    EXTERNAL ///< The filter depends on caller-held state; the caller is asked to re-trigger it.
};

struct SubscriptionOptions
{
    ResubscribePolicy policy = ResubscribePolicy::AUTOMATIC;
    bool closeOnEose = false; ///< Close the subscription on each relay once it sends EOSE.
};

/**
 * @brief A subscription recorded by the pool.
 */
struct Subscription
{
    std::string id;
    data::Filters filters;
    std::string purpose; ///< Human-readable label used in logs and resubscription callbacks.
    SubscriptionOptions options;
    std::vector<std::string> relays; ///< Relays on which the subscription is currently open.
};

enum class PoolHealth
{
    HEALTHY,
    RECONNECTING
};

struct PoolConfig
{
    std::chrono::milliseconds healthCheckInterval = std::chrono::seconds(10);
    std::chrono::milliseconds silenceThreshold = std::chrono::seconds(60);
    std::chrono::milliseconds initialBackoff = std::chrono::seconds(1);
    std::chrono::milliseconds maxBackoff = std::chrono::seconds(30);
};

typedef std::function<void(
    const std::string& relay,
    const std::string& subscriptionId,
    std::shared_ptr<data::Event> event)> EventHandler;

typedef std::function<void(const std::string& relay, const std::string& subscriptionId)> EoseHandler;

typedef std::function<void(
    const std::string& relay,
    const std::string& eventId,
    bool accepted,
    const std::string& message)> AcceptanceHandler;

typedef std::function<void(const std::string& subscriptionId, const std::string& purpose)> ResubscribeHandler;

class IConnectionPool
{
public:
    virtual ~IConnectionPool() = default;

    /**
     * @brief Opens connections to the default relays of the pool, as specified in the
     * constructor.
     * @returns A list of the relay URLs to which connections are open.
     */
    virtual std::vector<std::string> connect() = 0;

    /**
     * @brief Closes every open relay connection and forgets all subscriptions.
     */
    virtual void disconnect() = 0;

    /**
     * @brief Opens connections to the specified relays.
     * @remark The relays join the pool's target set, and are reopened by every reconnect until
     * they are closed through `closeRelayConnections` or `disconnect`.
     * @returns A list of the relay URLs to which connections are open.
     */
    virtual std::vector<std::string> openRelayConnections(std::vector<std::string> relays) = 0;

    /**
     * @brief Closes any open connections to the specified relays, and removes them from the
     * target set.
     * @remark Subscriptions stay recorded, and are reissued when connections reopen after a
     * reconnect.
     */
    virtual void closeRelayConnections(std::vector<std::string> relays) = 0;

    /**
     * @brief Opens a subscription on every open relay connection.
     * @param filters The filters to send in the REQ message.
     * @param purpose A label describing what the subscription is for.
     * @param options Resubscription and EOSE behavior.
     * @returns The ID of the new subscription.
     * @throws `std::invalid_argument` if the filters are invalid.
     * @remark Matching events are delivered through the handler set with `setEventHandler`.
     */
    virtual std::string subscribe(
        const data::Filters& filters,
        const std::string& purpose,
        SubscriptionOptions options = SubscriptionOptions()) = 0;

    /**
     * @brief Closes the subscription with the given ID on every relay and forgets it.
     */
    virtual void unsubscribe(const std::string& subscriptionId) = 0;

    /**
     * @brief Publishes a signed Nostr event to all open relay connections.
     * @returns A tuple of `std::vector<std::string>` objects, of the form `<successes, failures>`,
     * indicating to which relays the event was sent successfully, and to which relays it could
     * not be sent.
     * @remark Relay acceptance arrives later as an OK message, reported through the acceptance
     * handler.
     */
    virtual std::tuple<std::vector<std::string>, std::vector<std::string>> publishEvent(
        std::shared_ptr<data::Event> event) = 0;

    /**
     * @brief Sets the handler that receives the merged stream of inbound events from all relays.
     */
    virtual void setEventHandler(EventHandler handler) = 0;

    virtual void setEoseHandler(EoseHandler handler) = 0;

    virtual void setAcceptanceHandler(AcceptanceHandler handler) = 0;

    /**
     * @brief Sets the handler invoked for each `EXTERNAL` subscription dropped by a reconnect.
     */
    virtual void setResubscribeHandler(ResubscribeHandler handler) = 0;
};

/**
 * @brief Maintains connections to many relays, tracks subscriptions, and recovers from
 * connection loss or silence by reconnecting with exponential backoff.
 * @remark The subscription table and the health state are guarded by separate mutexes, and no
 * handler is invoked while either is held.
 */
class ConnectionPool : public IConnectionPool
{
public:
    ConnectionPool(
        std::shared_ptr<plog::IAppender> appender,
        std::shared_ptr<client::IWebSocketClient> client,
        std::shared_ptr<util::IClock> clock,
        std::shared_ptr<util::IScheduler> scheduler,
        PoolConfig config,
        std::vector<std::string> relays);

    ~ConnectionPool() override;

    std::vector<std::string> defaultRelays() const;

    std::vector<std::string> activeRelays();

    /**
     * @brief The relays the pool reopens on reconnect: the default relays after `connect`,
     * plus every relay opened through `openRelayConnections` and not since closed.
     */
    std::vector<std::string> targetRelays();

    /**
     * @brief A map from subscription IDs to the relays on which each subscription is open.
     */
    std::unordered_map<std::string, std::vector<std::string>> subscriptions();

    std::vector<std::string> connect() override;

    void disconnect() override;

    std::vector<std::string> openRelayConnections(std::vector<std::string> relays) override;

    void closeRelayConnections(std::vector<std::string> relays) override;

    std::string subscribe(
        const data::Filters& filters,
        const std::string& purpose,
        SubscriptionOptions options = SubscriptionOptions()) override;

    void unsubscribe(const std::string& subscriptionId) override;

    std::tuple<std::vector<std::string>, std::vector<std::string>> publishEvent(
        std::shared_ptr<data::Event> event) override;

    void setEventHandler(EventHandler handler) override;

    void setEoseHandler(EoseHandler handler) override;

    void setAcceptanceHandler(AcceptanceHandler handler) override;

    void setResubscribeHandler(ResubscribeHandler handler) override;

    #pragma region Health

    /**
     * @brief Starts the periodic health check.
     */
    void startHealthMonitor();

    /**
     * @brief Stops the periodic health check and any pending reconnection attempt.
     */
    void stopHealthMonitor();

    /**
     * @brief Compares the time since the last received message against the silence threshold,
     * and begins reconnecting if it is exceeded while subscriptions are active.
     * @remark Called by the health monitor.  Exposed so that callers can force a check.
     */
    void checkHealth();

    PoolHealth health();

    /**
     * @brief The delay before the next reconnection attempt.
     */
    std::chrono::milliseconds reconnectDelay();

    #pragma endregion

private:
    ///< The WebSocket client used to communicate with relays.
    std::shared_ptr<client::IWebSocketClient> _client;
    std::shared_ptr<util::IClock> _clock;
    std::shared_ptr<util::IScheduler> _scheduler;
    PoolConfig _config;

    ///< A mutex to protect the relay lists, subscription table, and handlers.
    std::mutex _propertyMutex;

    ///< The default set of Nostr relays to which the pool will attempt to connect.
    std::vector<std::string> _defaultRelays;

    ///< The set of Nostr relays to which the pool is currently connected.
    std::vector<std::string> _activeRelays;

    ///< The set of Nostr relays the pool is meant to hold open, whether or not they are open now.
    std::vector<std::string> _targetRelays;

    std::unordered_map<std::string, Subscription> _subscriptions;

    EventHandler _eventHandler;
    EoseHandler _eoseHandler;
    AcceptanceHandler _acceptanceHandler;
    ResubscribeHandler _resubscribeHandler;

    ///< A mutex to protect the health state machine.
    std::mutex _healthMutex;
    PoolHealth _health = PoolHealth::HEALTHY;
    util::ExponentialBackoff _backoff;
    std::chrono::system_clock::time_point _lastMessageAt;
    bool _isMonitoring = false;
    util::IScheduler::TaskId _healthTaskId = 0;
    util::IScheduler::TaskId _reconnectTaskId = 0;

    std::vector<std::string> _getUnconnectedRelays(std::vector<std::string> relays);

    /**
     * @brief Opens connections without changing the target set.
     */
    void _openRelays(std::vector<std::string> relays);

    /**
     * @brief Closes connections without changing the target set.
     */
    void _closeRelays(std::vector<std::string> relays);

    void _eraseActiveRelay(std::string relay);

    void _connect(std::string relay);

    void _disconnect(std::string relay);

    std::string _generateSubscriptionId();

    std::string _generateCloseRequest(std::string subscriptionId);

    /**
     * @brief Sends a REQ message to each of the given relays, and records the relays that
     * received it on the subscription.
     */
    void _sendSubscription(
        const std::string& subscriptionId,
        const std::string& request,
        std::vector<std::string> relays);

    /**
     * @brief Removes a relay from a subscription's relay list, forgetting the subscription once
     * no relay holds it open.
     */
    void _forgetSubscriptionRelay(const std::string& subscriptionId, const std::string& relay);

    void _scheduleHealthCheck();

    void _beginReconnect(const std::string& reason);

    void _attemptReconnect();

    /**
     * @brief Reissues `AUTOMATIC` subscriptions under their original IDs, and drops `EXTERNAL`
     * subscriptions after notifying the resubscribe handler.
     */
    void _resubscribe();

    void _onMessage(const std::string& relay, const std::string& message);

    void _onConnectionLost(const std::string& relay);
};
} // namespace service
} // namespace nostrcast
