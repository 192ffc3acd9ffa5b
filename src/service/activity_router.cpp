#include <algorithm>
#include <tuple>

#include "nostrcast/service/activity_router.hpp"

using namespace nostrcast::data;
using namespace nostrcast::service;
using namespace nostrcast::util;
using namespace std;

#pragma region ActivitySubscription

ActivitySubscription::ActivitySubscription(weak_ptr<ActivityRouter> router, string coordinate, uint64_t generation)
: _router(router), _coordinate(move(coordinate)), _generation(generation), _isActive(true)
{
};

ActivitySubscription::~ActivitySubscription()
{
    this->cancel();
};

ActivitySubscription::ActivitySubscription(ActivitySubscription&& other) noexcept
: _router(move(other._router)),
  _coordinate(move(other._coordinate)),
  _generation(other._generation),
  _isActive(other._isActive)
{
    other._isActive = false;
};

ActivitySubscription& ActivitySubscription::operator=(ActivitySubscription&& other) noexcept
{
    if (this != &other)
    {
        this->cancel();
        this->_router = move(other._router);
        this->_coordinate = move(other._coordinate);
        this->_generation = other._generation;
        this->_isActive = other._isActive;
        other._isActive = false;
    }
    return *this;
};

void ActivitySubscription::cancel()
{
    if (!this->_isActive)
    {
        return;
    }
    this->_isActive = false;

    auto router = this->_router.lock();
    if (router != nullptr)
    {
        router->_unsubscribe(this->_coordinate, this->_generation);
    }
};

#pragma endregion

#pragma region Constructors and Destructors

ActivityRouter::ActivityRouter(
    shared_ptr<IClock> clock,
    shared_ptr<IScheduler> scheduler,
    shared_ptr<IConnectionPool> pool,
    ActivityConfig config)
: _clock(clock),
  _scheduler(scheduler),
  _pool(pool),
  _config(config),
  _backoff(config.initialBackoff, config.maxBackoff)
{
    this->_lastActivityAt = this->_clock->now();
};

ActivityRouter::~ActivityRouter()
{
    this->stopHeartbeat();
};

#pragma endregion

#pragma region Routing

ActivitySubscription ActivityRouter::subscribe(const string& coordinate, ActivityHandler handler)
{
    string normalized = Coordinate::normalize(coordinate);
    string previousSubscriptionId;
    shared_ptr<Delivery> previousDelivery;
    uint64_t generation;
    bool wasIdle;
    {
        lock_guard<mutex> lock(this->_registrationMutex);
        wasIdle = this->_registrations.empty();

        auto it = this->_registrations.find(normalized);
        if (it != this->_registrations.end())
        {
            previousSubscriptionId = it->second.subscriptionId;
            previousDelivery = it->second.delivery;
        }

        generation = this->_nextGeneration++;
        this->_registrations[normalized] = Registration{ generation, handler, "", make_shared<Delivery>() };
    }

    if (previousDelivery != nullptr)
    {
        this->_stopDelivery(previousDelivery);
    }

    if (!previousSubscriptionId.empty())
    {
        PLOG_DEBUG << "Replacing activity subscription " << previousSubscriptionId << " for " << normalized;
        this->_pool->unsubscribe(previousSubscriptionId);
    }

    if (wasIdle)
    {
        lock_guard<mutex> lock(this->_healthMutex);
        this->_lastActivityAt = this->_clock->now();
    }

    string subscriptionId = this->_issueFilter(normalized);
    this->_attachSubscription(normalized, generation, subscriptionId);

    return ActivitySubscription(this->weak_from_this(), normalized, generation);
};

bool ActivityRouter::route(const ActivityMessage& message)
{
    if (!message.coordinate.has_value())
    {
        return false;
    }

    string normalized = Coordinate::normalize(message.coordinate.value());
    ActivityHandler handler;
    shared_ptr<Delivery> delivery;
    {
        lock_guard<mutex> lock(this->_registrationMutex);
        auto it = this->_registrations.find(normalized);
        if (it == this->_registrations.end())
        {
            PLOG_VERBOSE << "No activity handler for " << normalized << "; dropping message " << message.id;
            return false;
        }
        handler = it->second.handler;
        delivery = it->second.delivery;
    }

    this->_markActivity();

    thread::id currentThread = this_thread::get_id();
    {
        lock_guard<mutex> lock(delivery->mutex);
        if (delivery->isStopped)
        {
            PLOG_VERBOSE << "Activity handler for " << normalized << " was removed; dropping message " << message.id;
            return false;
        }
        delivery->deliveringThreads.push_back(currentThread);
    }

    try
    {
        handler(message);
    }
    catch (const exception& e)
    {
        PLOG_ERROR << "Activity handler for " << normalized << " failed on message " << message.id << ": " << e.what();
    }

    {
        lock_guard<mutex> lock(delivery->mutex);
        auto& threads = delivery->deliveringThreads;
        threads.erase(find(threads.begin(), threads.end(), currentThread));
    }
    delivery->finished.notify_all();

    return true;
};

bool ActivityRouter::reissue(const string& subscriptionId)
{
    string coordinate;
    uint64_t generation = 0;
    {
        lock_guard<mutex> lock(this->_registrationMutex);
        for (auto& [key, registration] : this->_registrations)
        {
            if (registration.subscriptionId == subscriptionId)
            {
                coordinate = key;
                generation = registration.generation;
                registration.subscriptionId.clear();
                break;
            }
        }
    }

    if (coordinate.empty())
    {
        return false;
    }

    string newSubscriptionId = this->_issueFilter(coordinate);
    this->_attachSubscription(coordinate, generation, newSubscriptionId);
    PLOG_INFO << "Reissued activity subscription for " << coordinate;

    return true;
};

size_t ActivityRouter::activeSubscriptionCount()
{
    lock_guard<mutex> lock(this->_registrationMutex);
    return this->_registrations.size();
};

string ActivityRouter::subscriptionIdFor(const string& coordinate)
{
    lock_guard<mutex> lock(this->_registrationMutex);
    auto it = this->_registrations.find(Coordinate::normalize(coordinate));
    return it == this->_registrations.end() ? string() : it->second.subscriptionId;
};

void ActivityRouter::_unsubscribe(const string& coordinate, uint64_t generation)
{
    string subscriptionId;
    shared_ptr<Delivery> delivery;
    {
        lock_guard<mutex> lock(this->_registrationMutex);
        auto it = this->_registrations.find(coordinate);
        if (it == this->_registrations.end() || it->second.generation != generation)
        {
            return;
        }
        subscriptionId = it->second.subscriptionId;
        delivery = it->second.delivery;
        this->_registrations.erase(it);
    }

    this->_stopDelivery(delivery);

    if (!subscriptionId.empty())
    {
        this->_pool->unsubscribe(subscriptionId);
    }
    PLOG_DEBUG << "Removed activity handler for " << coordinate;
};

void ActivityRouter::_stopDelivery(shared_ptr<Delivery> delivery)
{
    thread::id currentThread = this_thread::get_id();

    unique_lock<mutex> lock(delivery->mutex);
    delivery->isStopped = true;
    delivery->finished.wait(lock, [&delivery, &currentThread]()
    {
        const auto& threads = delivery->deliveringThreads;
        return static_cast<size_t>(count(threads.begin(), threads.end(), currentThread)) == threads.size();
    });
};

string ActivityRouter::_issueFilter(const string& coordinate)
{
    Filters filters;
    filters.kinds = { kind::LIVE_CHAT, kind::ZAP_RECEIPT };
    filters.tags["a"] = { coordinate };
    filters.limit = this->_config.historyLimit;

    SubscriptionOptions options;
    options.policy = ResubscribePolicy::EXTERNAL;

    return this->_pool->subscribe(filters, "activity " + coordinate, options);
};

void ActivityRouter::_attachSubscription(const string& coordinate, uint64_t generation, const string& subscriptionId)
{
    {
        lock_guard<mutex> lock(this->_registrationMutex);
        auto it = this->_registrations.find(coordinate);
        if (it != this->_registrations.end() && it->second.generation == generation)
        {
            it->second.subscriptionId = subscriptionId;
            return;
        }
    }

    this->_pool->unsubscribe(subscriptionId);
};

#pragma endregion

#pragma region Health

void ActivityRouter::startHeartbeat()
{
    {
        lock_guard<mutex> lock(this->_healthMutex);
        if (this->_isMonitoring)
        {
            return;
        }
        this->_isMonitoring = true;
        this->_lastActivityAt = this->_clock->now();
    }

    this->_scheduleHeartbeat();
};

void ActivityRouter::stopHeartbeat()
{
    lock_guard<mutex> lock(this->_healthMutex);
    this->_isMonitoring = false;

    if (this->_heartbeatTaskId != 0)
    {
        this->_scheduler->cancel(this->_heartbeatTaskId);
        this->_heartbeatTaskId = 0;
    }
    if (this->_reconnectTaskId != 0)
    {
        this->_scheduler->cancel(this->_reconnectTaskId);
        this->_reconnectTaskId = 0;
    }
};

void ActivityRouter::checkHealth()
{
    if (this->activeSubscriptionCount() == 0)
    {
        return;
    }

    chrono::milliseconds delay;
    {
        lock_guard<mutex> lock(this->_healthMutex);
        if (!this->_isHealthy)
        {
            return;
        }

        auto silence = this->_clock->now() - this->_lastActivityAt;
        if (silence <= this->_config.silenceThreshold)
        {
            return;
        }

        this->_isHealthy = false;
        delay = this->_backoff.delay();
        this->_reconnectTaskId = this->_scheduler->schedule(delay, [this]() { this->_attemptReconnect(); });
    }

    PLOG_WARNING << "No live activity received recently; reissuing subscriptions in " << delay.count() << " ms.";
};

bool ActivityRouter::isHealthy()
{
    lock_guard<mutex> lock(this->_healthMutex);
    return this->_isHealthy;
};

chrono::milliseconds ActivityRouter::reconnectDelay()
{
    lock_guard<mutex> lock(this->_healthMutex);
    return this->_backoff.delay();
};

void ActivityRouter::_markActivity()
{
    IScheduler::TaskId reconnectTaskId = 0;
    {
        lock_guard<mutex> lock(this->_healthMutex);
        this->_lastActivityAt = this->_clock->now();
        if (this->_isHealthy)
        {
            return;
        }

        this->_isHealthy = true;
        this->_backoff.reset();
        reconnectTaskId = this->_reconnectTaskId;
        this->_reconnectTaskId = 0;
    }

    if (reconnectTaskId != 0)
    {
        this->_scheduler->cancel(reconnectTaskId);
    }
    PLOG_INFO << "Live activity resumed.";
};

void ActivityRouter::_scheduleHeartbeat()
{
    lock_guard<mutex> lock(this->_healthMutex);
    if (!this->_isMonitoring)
    {
        return;
    }

    this->_heartbeatTaskId = this->_scheduler->schedule(this->_config.heartbeatInterval, [this]()
    {
        this->checkHealth();
        this->_scheduleHeartbeat();
    });
};

void ActivityRouter::_attemptReconnect()
{
    {
        lock_guard<mutex> lock(this->_healthMutex);
        if (this->_isHealthy)
        {
            return;
        }
        this->_reconnectTaskId = 0;
    }

    vector<tuple<string, uint64_t, string>> registrations;
    {
        lock_guard<mutex> lock(this->_registrationMutex);
        for (const auto& [coordinate, registration] : this->_registrations)
        {
            registrations.emplace_back(coordinate, registration.generation, registration.subscriptionId);
        }
    }

    if (registrations.empty())
    {
        lock_guard<mutex> lock(this->_healthMutex);
        this->_isHealthy = true;
        this->_backoff.reset();
        this->_reconnectTaskId = 0;
        PLOG_INFO << "No activity subscriptions remain; reconnect stopped.";
        return;
    }

    PLOG_INFO << "Reissuing " << registrations.size() << " activity subscriptions.";
    for (const auto& [coordinate, generation, subscriptionId] : registrations)
    {
        if (!subscriptionId.empty())
        {
            this->_pool->unsubscribe(subscriptionId);
        }
        this->_attachSubscription(coordinate, generation, this->_issueFilter(coordinate));
    }

    lock_guard<mutex> lock(this->_healthMutex);
    if (this->_isHealthy)
    {
        return;
    }

    chrono::milliseconds delay = this->_backoff.increase();
    this->_reconnectTaskId = this->_scheduler->schedule(delay, [this]() { this->_attemptReconnect(); });
};

#pragma endregion
