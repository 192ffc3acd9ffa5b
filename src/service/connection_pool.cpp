#include <algorithm>
#include <future>
#include <thread>

#include <nlohmann/json.hpp>
#include <uuid_v4.h>

#include "nostrcast/service/connection_pool.hpp"

using namespace nlohmann;
using namespace nostrcast::client;
using namespace nostrcast::data;
using namespace nostrcast::service;
using namespace nostrcast::util;
using namespace std;

ConnectionPool::ConnectionPool(
    shared_ptr<plog::IAppender> appender,
    shared_ptr<IWebSocketClient> client,
    shared_ptr<IClock> clock,
    shared_ptr<IScheduler> scheduler,
    PoolConfig config,
    vector<string> relays)
: _client(client),
  _clock(clock),
  _scheduler(scheduler),
  _config(config),
  _defaultRelays(relays),
  _backoff(config.initialBackoff, config.maxBackoff)
{
    plog::init(plog::debug, appender.get());

    this->_lastMessageAt = this->_clock->now();

    this->_client->start();
    this->_client->onConnectionLost([this](const string& relay)
    {
        this->_onConnectionLost(relay);
    });
};

ConnectionPool::~ConnectionPool()
{
    this->stopHealthMonitor();
    this->_client->onConnectionLost(nullptr);
    this->_client->stop();
};

vector<string> ConnectionPool::defaultRelays() const { return this->_defaultRelays; };

vector<string> ConnectionPool::activeRelays()
{
    lock_guard<mutex> lock(this->_propertyMutex);
    return this->_activeRelays;
};

vector<string> ConnectionPool::targetRelays()
{
    lock_guard<mutex> lock(this->_propertyMutex);
    return this->_targetRelays;
};

unordered_map<string, vector<string>> ConnectionPool::subscriptions()
{
    lock_guard<mutex> lock(this->_propertyMutex);
    unordered_map<string, vector<string>> subscriptionRelays;
    for (const auto& [subscriptionId, subscription] : this->_subscriptions)
    {
        subscriptionRelays[subscriptionId] = subscription.relays;
    }

    return subscriptionRelays;
};

#pragma region Connections

vector<string> ConnectionPool::connect()
{
    {
        lock_guard<mutex> lock(this->_healthMutex);
        this->_lastMessageAt = this->_clock->now();
    }

    return this->openRelayConnections(this->_defaultRelays);
};

void ConnectionPool::disconnect()
{
    PLOG_INFO << "Disconnecting from all relays.";

    {
        lock_guard<mutex> lock(this->_healthMutex);
        if (this->_reconnectTaskId != 0)
        {
            this->_scheduler->cancel(this->_reconnectTaskId);
            this->_reconnectTaskId = 0;
        }
        this->_health = PoolHealth::HEALTHY;
        this->_backoff.reset();
    }

    unique_lock<mutex> lock(this->_propertyMutex);
    this->_subscriptions.clear();
    this->_targetRelays.clear();
    vector<string> relays = this->_activeRelays;
    lock.unlock();

    this->_closeRelays(relays);
};

vector<string> ConnectionPool::openRelayConnections(vector<string> relays)
{
    {
        lock_guard<mutex> lock(this->_propertyMutex);
        for (const string& relay : relays)
        {
            if (find(this->_targetRelays.begin(), this->_targetRelays.end(), relay) == this->_targetRelays.end())
            {
                this->_targetRelays.push_back(relay);
            }
        }
    }

    this->_openRelays(relays);

    lock_guard<mutex> lock(this->_propertyMutex);
    size_t targetCount = relays.size();
    size_t activeCount = count_if(relays.begin(), relays.end(), [this](const string& relay)
    {
        return find(this->_activeRelays.begin(), this->_activeRelays.end(), relay) != this->_activeRelays.end();
    });
    PLOG_INFO << "Connected to " << activeCount << "/" << targetCount << " target relays.";

    return this->_activeRelays;
};

void ConnectionPool::closeRelayConnections(vector<string> relays)
{
    {
        lock_guard<mutex> lock(this->_propertyMutex);
        for (const string& relay : relays)
        {
            auto it = find(this->_targetRelays.begin(), this->_targetRelays.end(), relay);
            if (it != this->_targetRelays.end())
            {
                this->_targetRelays.erase(it);
            }
        }
    }

    this->_closeRelays(relays);
};

#pragma endregion

#pragma region Subscriptions

string ConnectionPool::subscribe(
    const Filters& filters,
    const string& purpose,
    SubscriptionOptions options)
{
    string subscriptionId = this->_generateSubscriptionId();
    string request;

    try
    {
        request = filters.serialize(subscriptionId);
    }
    catch (const invalid_argument& e)
    {
        PLOG_ERROR << "Failed to serialize filters for " << purpose << " - invalid object: " << e.what();
        throw;
    }

    unique_lock<mutex> lock(this->_propertyMutex);
    bool wasIdle = this->_subscriptions.empty();
    this->_subscriptions[subscriptionId] = Subscription{ subscriptionId, filters, purpose, options, {} };
    vector<string> relays = this->_activeRelays;
    lock.unlock();

    // Silence before the first subscription is not a sign of an unhealthy connection.
    if (wasIdle)
    {
        lock_guard<mutex> healthLock(this->_healthMutex);
        this->_lastMessageAt = this->_clock->now();
    }

    this->_sendSubscription(subscriptionId, request, relays);
    PLOG_INFO << "Opened subscription " << subscriptionId << " for " << purpose << ".";

    return subscriptionId;
};

void ConnectionPool::unsubscribe(const string& subscriptionId)
{
    unique_lock<mutex> lock(this->_propertyMutex);
    auto it = this->_subscriptions.find(subscriptionId);
    if (it == this->_subscriptions.end())
    {
        PLOG_WARNING << "Subscription " << subscriptionId << " not found.";
        return;
    }

    vector<string> relays = it->second.relays;
    string purpose = it->second.purpose;
    this->_subscriptions.erase(it);
    lock.unlock();

    string request = this->_generateCloseRequest(subscriptionId);
    for (const string& relay : relays)
    {
        auto [uri, success] = this->_client->send(request, relay);
        if (!success)
        {
            PLOG_WARNING << "Failed to send close request for subscription " << subscriptionId << " to relay " << uri;
        }
    }

    PLOG_INFO << "Closed subscription " << subscriptionId << " for " << purpose << ".";
};

tuple<vector<string>, vector<string>> ConnectionPool::publishEvent(shared_ptr<Event> event)
{
    vector<string> successfulRelays;
    vector<string> failedRelays;

    PLOG_INFO << "Attempting to publish event to Nostr relays.";

    string message;
    try
    {
        message = json::array({ "EVENT", json(*event) }).dump();
    }
    catch (const json::exception& je)
    {
        PLOG_ERROR << "Failed to serialize event: " << je.what();
        return make_tuple(successfulRelays, this->activeRelays());
    }

    vector<string> targetRelays = this->activeRelays();
    vector<future<tuple<string, bool>>> publishFutures;
    for (const string& relay : targetRelays)
    {
        publishFutures.push_back(async(launch::async, [this, relay, message]()
        {
            return this->_client->send(message, relay);
        }));
    }

    for (auto& publishFuture : publishFutures)
    {
        auto [relay, isSuccess] = publishFuture.get();
        if (isSuccess)
        {
            successfulRelays.push_back(relay);
        }
        else
        {
            PLOG_WARNING << "Failed to send event to relay " << relay;
            failedRelays.push_back(relay);
        }
    }

    size_t targetCount = targetRelays.size();
    size_t successfulCount = successfulRelays.size();
    PLOG_INFO << "Published event " << event->id << " to " << successfulCount << "/" << targetCount << " target relays.";

    return make_tuple(successfulRelays, failedRelays);
};

void ConnectionPool::setEventHandler(EventHandler handler)
{
    lock_guard<mutex> lock(this->_propertyMutex);
    this->_eventHandler = handler;
};

void ConnectionPool::setEoseHandler(EoseHandler handler)
{
    lock_guard<mutex> lock(this->_propertyMutex);
    this->_eoseHandler = handler;
};

void ConnectionPool::setAcceptanceHandler(AcceptanceHandler handler)
{
    lock_guard<mutex> lock(this->_propertyMutex);
    this->_acceptanceHandler = handler;
};

void ConnectionPool::setResubscribeHandler(ResubscribeHandler handler)
{
    lock_guard<mutex> lock(this->_propertyMutex);
    this->_resubscribeHandler = handler;
};

#pragma endregion

#pragma region Health

void ConnectionPool::startHealthMonitor()
{
    {
        lock_guard<mutex> lock(this->_healthMutex);
        if (this->_isMonitoring)
        {
            return;
        }
        this->_isMonitoring = true;
    }

    PLOG_INFO << "Starting relay health monitor.";
    this->_scheduleHealthCheck();
};

void ConnectionPool::stopHealthMonitor()
{
    lock_guard<mutex> lock(this->_healthMutex);
    this->_isMonitoring = false;

    if (this->_healthTaskId != 0)
    {
        this->_scheduler->cancel(this->_healthTaskId);
        this->_healthTaskId = 0;
    }
    if (this->_reconnectTaskId != 0)
    {
        this->_scheduler->cancel(this->_reconnectTaskId);
        this->_reconnectTaskId = 0;
    }
};

void ConnectionPool::checkHealth()
{
    chrono::system_clock::duration silence;
    {
        lock_guard<mutex> lock(this->_healthMutex);
        if (this->_health != PoolHealth::HEALTHY)
        {
            return;
        }
        silence = this->_clock->now() - this->_lastMessageAt;
    }

    bool hasSubscriptions;
    {
        lock_guard<mutex> lock(this->_propertyMutex);
        hasSubscriptions = !this->_subscriptions.empty();
    }

    if (hasSubscriptions && silence > this->_config.silenceThreshold)
    {
        auto seconds = chrono::duration_cast<chrono::seconds>(silence).count();
        this->_beginReconnect("No messages received for " + to_string(seconds) + "s");
    }
};

PoolHealth ConnectionPool::health()
{
    lock_guard<mutex> lock(this->_healthMutex);
    return this->_health;
};

chrono::milliseconds ConnectionPool::reconnectDelay()
{
    lock_guard<mutex> lock(this->_healthMutex);
    return this->_backoff.delay();
};

void ConnectionPool::_scheduleHealthCheck()
{
    lock_guard<mutex> lock(this->_healthMutex);
    if (!this->_isMonitoring)
    {
        return;
    }

    this->_healthTaskId = this->_scheduler->schedule(this->_config.healthCheckInterval, [this]()
    {
        this->checkHealth();
        this->_scheduleHealthCheck();
    });
};

void ConnectionPool::_beginReconnect(const string& reason)
{
    chrono::milliseconds delay;
    {
        lock_guard<mutex> lock(this->_healthMutex);
        if (this->_health == PoolHealth::RECONNECTING)
        {
            return;
        }
        this->_health = PoolHealth::RECONNECTING;
        delay = this->_backoff.delay();
    }

    PLOG_WARNING << reason << " - reconnecting to relays in " << delay.count() << "ms.";
    this->_closeRelays(this->activeRelays());

    lock_guard<mutex> lock(this->_healthMutex);
    if (this->_health == PoolHealth::RECONNECTING)
    {
        this->_reconnectTaskId = this->_scheduler->schedule(delay, [this]()
        {
            this->_attemptReconnect();
        });
    }
};

void ConnectionPool::_attemptReconnect()
{
    {
        lock_guard<mutex> lock(this->_healthMutex);
        this->_reconnectTaskId = 0;
        if (this->_health != PoolHealth::RECONNECTING)
        {
            return;
        }
    }

    PLOG_INFO << "Reconnecting to relays.";
    this->_closeRelays(this->activeRelays());
    this->_openRelays(this->targetRelays());
    this->_resubscribe();

    // Stay in the reconnecting state until a message arrives, retrying with a longer delay.
    lock_guard<mutex> lock(this->_healthMutex);
    if (this->_health == PoolHealth::RECONNECTING)
    {
        auto delay = this->_backoff.increase();
        PLOG_INFO << "Next reconnection attempt in " << delay.count() << "ms unless a relay responds.";
        this->_reconnectTaskId = this->_scheduler->schedule(delay, [this]()
        {
            this->_attemptReconnect();
        });
    }
};

void ConnectionPool::_resubscribe()
{
    vector<tuple<string, string>> automatic;
    vector<tuple<string, string>> external;
    vector<string> relays;
    ResubscribeHandler resubscribeHandler;

    {
        lock_guard<mutex> lock(this->_propertyMutex);
        relays = this->_activeRelays;
        resubscribeHandler = this->_resubscribeHandler;

        for (auto it = this->_subscriptions.begin(); it != this->_subscriptions.end();)
        {
            Subscription& subscription = it->second;
            if (subscription.options.policy == ResubscribePolicy::AUTOMATIC)
            {
                subscription.relays.clear();
                automatic.push_back(make_tuple(subscription.id, subscription.filters.serialize(subscription.id)));
                ++it;
            }
            else
            {
                external.push_back(make_tuple(subscription.id, subscription.purpose));
                it = this->_subscriptions.erase(it);
            }
        }
    }

    for (const auto& [subscriptionId, request] : automatic)
    {
        this->_sendSubscription(subscriptionId, request, relays);
    }
    PLOG_INFO << "Reissued " << automatic.size() << " subscriptions.";

    for (const auto& [subscriptionId, purpose] : external)
    {
        PLOG_INFO << "Subscription " << subscriptionId << " for " << purpose << " needs to be re-triggered.";
        if (resubscribeHandler)
        {
            resubscribeHandler(subscriptionId, purpose);
        }
    }
};

#pragma endregion

#pragma region Private Helpers

vector<string> ConnectionPool::_getUnconnectedRelays(vector<string> relays)
{
    PLOG_VERBOSE << "Identifying unconnected relays.";
    vector<string> unconnectedRelays;
    for (string relay : relays)
    {
        bool isConnected = this->_client->isConnected(relay);

        lock_guard<mutex> lock(this->_propertyMutex);
        bool isActive = find(this->_activeRelays.begin(), this->_activeRelays.end(), relay)
            != this->_activeRelays.end();
        PLOG_VERBOSE << "Relay " << relay << " is active: " << isActive << ", is connected: " << isConnected;

        if (!isActive && !isConnected)
        {
            unconnectedRelays.push_back(relay);
        }
        else if (isActive && !isConnected)
        {
            PLOG_VERBOSE << "Relay " << relay << " is active but not connected.  Removing from active relays list.";
            this->_eraseActiveRelay(relay);
            unconnectedRelays.push_back(relay);
        }
        else if (!isActive && isConnected)
        {
            PLOG_VERBOSE << "Relay " << relay << " is connected but not active.  Adding to active relays list.";
            this->_activeRelays.push_back(relay);
        }
    }
    return unconnectedRelays;
};

void ConnectionPool::_openRelays(vector<string> relays)
{
    PLOG_INFO << "Attempting to connect to Nostr relays.";
    vector<string> unconnectedRelays = this->_getUnconnectedRelays(relays);

    vector<thread> connectionThreads;
    for (string relay : unconnectedRelays)
    {
        thread connectionThread([this, relay]() {
            this->_connect(relay);
        });
        connectionThreads.push_back(move(connectionThread));
    }

    for (thread& connectionThread : connectionThreads)
    {
        connectionThread.join();
    }
};

void ConnectionPool::_closeRelays(vector<string> relays)
{
    PLOG_INFO << "Disconnecting from Nostr relays.";

    vector<string> connectedRelays;
    {
        lock_guard<mutex> lock(this->_propertyMutex);
        for (const string& relay : relays)
        {
            if (find(this->_activeRelays.begin(), this->_activeRelays.end(), relay) != this->_activeRelays.end())
            {
                connectedRelays.push_back(relay);
            }
        }
    }

    vector<thread> disconnectionThreads;
    for (string relay : connectedRelays)
    {
        thread disconnectionThread([this, relay]() {
            this->_disconnect(relay);
        });
        disconnectionThreads.push_back(move(disconnectionThread));
    }

    for (thread& disconnectionThread : disconnectionThreads)
    {
        disconnectionThread.join();
    }
};

void ConnectionPool::_eraseActiveRelay(string relay)
{
    auto it = find(this->_activeRelays.begin(), this->_activeRelays.end(), relay);
    if (it != this->_activeRelays.end())
    {
        this->_activeRelays.erase(it);
    }
};

void ConnectionPool::_connect(string relay)
{
    PLOG_VERBOSE << "Connecting to relay " << relay;
    this->_client->openConnection(relay);

    if (!this->_client->isConnected(relay))
    {
        PLOG_ERROR << "Failed to connect to relay " << relay;
        return;
    }

    this->_client->receive(relay, [this, relay](const string& message)
    {
        this->_onMessage(relay, message);
    });

    lock_guard<mutex> lock(this->_propertyMutex);
    if (find(this->_activeRelays.begin(), this->_activeRelays.end(), relay) == this->_activeRelays.end())
    {
        this->_activeRelays.push_back(relay);
    }
    PLOG_VERBOSE << "Connected to relay " << relay;
};

void ConnectionPool::_disconnect(string relay)
{
    this->_client->closeConnection(relay);

    lock_guard<mutex> lock(this->_propertyMutex);
    this->_eraseActiveRelay(relay);
    for (auto& [subscriptionId, subscription] : this->_subscriptions)
    {
        auto it = find(subscription.relays.begin(), subscription.relays.end(), relay);
        if (it != subscription.relays.end())
        {
            subscription.relays.erase(it);
        }
    }
};

string ConnectionPool::_generateSubscriptionId()
{
    UUIDv4::UUIDGenerator<std::mt19937_64> uuidGenerator;
    UUIDv4::UUID uuid = uuidGenerator.getUUID();
    return uuid.str();
};

string ConnectionPool::_generateCloseRequest(string subscriptionId)
{
    json jarr = json::array({ "CLOSE", subscriptionId });
    return jarr.dump();
};

void ConnectionPool::_sendSubscription(
    const string& subscriptionId,
    const string& request,
    vector<string> relays)
{
    vector<string> successfulRelays;
    for (const string& relay : relays)
    {
        auto [uri, success] = this->_client->send(request, relay);
        if (success)
        {
            successfulRelays.push_back(uri);
        }
        else
        {
            PLOG_WARNING << "Failed to send subscription " << subscriptionId << " to relay " << uri;
        }
    }

    lock_guard<mutex> lock(this->_propertyMutex);
    auto it = this->_subscriptions.find(subscriptionId);
    if (it == this->_subscriptions.end())
    {
        // Unsubscribed while the request was in flight.
        return;
    }
    for (const string& relay : successfulRelays)
    {
        if (find(it->second.relays.begin(), it->second.relays.end(), relay) == it->second.relays.end())
        {
            it->second.relays.push_back(relay);
        }
    }
    PLOG_VERBOSE << "Sent subscription " << subscriptionId << " to " << successfulRelays.size() << "/" << relays.size() << " relays.";
};

void ConnectionPool::_forgetSubscriptionRelay(const string& subscriptionId, const string& relay)
{
    lock_guard<mutex> lock(this->_propertyMutex);
    auto it = this->_subscriptions.find(subscriptionId);
    if (it == this->_subscriptions.end())
    {
        return;
    }

    auto& relays = it->second.relays;
    auto relayIt = find(relays.begin(), relays.end(), relay);
    if (relayIt != relays.end())
    {
        relays.erase(relayIt);
    }
    if (relays.empty())
    {
        this->_subscriptions.erase(it);
    }
};

void ConnectionPool::_onMessage(const string& relay, const string& message)
{
    bool recovered = false;
    {
        lock_guard<mutex> lock(this->_healthMutex);
        this->_lastMessageAt = this->_clock->now();
        if (this->_health == PoolHealth::RECONNECTING)
        {
            this->_health = PoolHealth::HEALTHY;
            this->_backoff.reset();
            if (this->_reconnectTaskId != 0)
            {
                this->_scheduler->cancel(this->_reconnectTaskId);
                this->_reconnectTaskId = 0;
            }
            recovered = true;
        }
    }
    if (recovered)
    {
        PLOG_INFO << "Relay " << relay << " responded - connection pool is healthy.";
    }

    json jMessage = json::parse(message, nullptr, false);
    if (jMessage.is_discarded() || !jMessage.is_array() || jMessage.empty() || !jMessage[0].is_string())
    {
        PLOG_WARNING << "Dropping malformed message from relay " << relay << ": " << message;
        return;
    }

    try
    {
        string messageType = jMessage.at(0);
        if (messageType == "EVENT")
        {
            string subscriptionId = jMessage.at(1);
            auto event = make_shared<Event>(Event::fromJson(jMessage.at(2)));

            EventHandler handler;
            {
                lock_guard<mutex> lock(this->_propertyMutex);
                if (this->_subscriptions.find(subscriptionId) == this->_subscriptions.end())
                {
                    PLOG_VERBOSE << "Dropping event for closed subscription " << subscriptionId << " from relay " << relay;
                    return;
                }
                handler = this->_eventHandler;
            }
            if (handler)
            {
                handler(relay, subscriptionId, event);
            }
        }
        else if (messageType == "EOSE")
        {
            string subscriptionId = jMessage.at(1);
            PLOG_VERBOSE << "Received EOSE for subscription " << subscriptionId << " from relay " << relay;

            EoseHandler handler;
            bool closeOnEose = false;
            {
                lock_guard<mutex> lock(this->_propertyMutex);
                handler = this->_eoseHandler;
                auto it = this->_subscriptions.find(subscriptionId);
                closeOnEose = it != this->_subscriptions.end() && it->second.options.closeOnEose;
            }
            if (handler)
            {
                handler(relay, subscriptionId);
            }

            if (closeOnEose)
            {
                this->_client->send(this->_generateCloseRequest(subscriptionId), relay);
                this->_forgetSubscriptionRelay(subscriptionId, relay);
            }
        }
        else if (messageType == "CLOSED")
        {
            string subscriptionId = jMessage.at(1);
            string reason = jMessage.size() > 2 ? jMessage.at(2).get<string>() : string();
            PLOG_WARNING << "Relay " << relay << " closed subscription " << subscriptionId << ": " << reason;
            this->_forgetSubscriptionRelay(subscriptionId, relay);
        }
        else if (messageType == "OK")
        {
            string eventId = jMessage.at(1);
            bool isAccepted = jMessage.at(2).get<bool>();
            string reason = jMessage.size() > 3 ? jMessage.at(3).get<string>() : string();
            if (isAccepted)
            {
                PLOG_INFO << "Relay " << relay << " accepted event: " << eventId;
            }
            else
            {
                PLOG_WARNING << "Relay " << relay << " rejected event: " << eventId << " " << reason;
            }

            AcceptanceHandler handler;
            {
                lock_guard<mutex> lock(this->_propertyMutex);
                handler = this->_acceptanceHandler;
            }
            if (handler)
            {
                handler(relay, eventId, isAccepted, reason);
            }
        }
        else if (messageType == "NOTICE")
        {
            string notice = jMessage.size() > 1 ? jMessage.at(1).dump() : string();
            PLOG_INFO << "Notice from relay " << relay << ": " << notice;
        }
        else
        {
            PLOG_WARNING << "Dropping message of unknown type " << messageType << " from relay " << relay;
        }
    }
    catch (const json::exception& je)
    {
        PLOG_WARNING << "Dropping malformed message from relay " << relay << ": " << je.what();
    }
};

void ConnectionPool::_onConnectionLost(const string& relay)
{
    bool hasSubscriptions;
    {
        lock_guard<mutex> lock(this->_propertyMutex);
        if (find(this->_activeRelays.begin(), this->_activeRelays.end(), relay) == this->_activeRelays.end())
        {
            PLOG_VERBOSE << "Ignoring lost connection to inactive relay " << relay;
            return;
        }
        this->_eraseActiveRelay(relay);
        for (auto& [subscriptionId, subscription] : this->_subscriptions)
        {
            auto it = find(subscription.relays.begin(), subscription.relays.end(), relay);
            if (it != subscription.relays.end())
            {
                subscription.relays.erase(it);
            }
        }
        hasSubscriptions = !this->_subscriptions.empty();
    }

    bool isMonitoring;
    {
        lock_guard<mutex> lock(this->_healthMutex);
        isMonitoring = this->_isMonitoring;
    }

    if (hasSubscriptions && isMonitoring)
    {
        this->_beginReconnect("Lost connection to relay " + relay);
    }
    else
    {
        PLOG_WARNING << "Lost connection to relay " << relay;
    }
};

#pragma endregion
