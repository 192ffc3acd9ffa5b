#include "nostrcast/service/event_router.hpp"

using namespace nostrcast::data;
using namespace nostrcast::service;
using namespace nostrcast::validation;
using namespace std;

EventRouter::EventRouter(shared_ptr<EventValidator> validator, shared_ptr<ProfileCache> profileCache)
: _validator(validator), _profileCache(profileCache)
{
    this->_registerBuiltInRoutes();
};

EventRouter::~EventRouter()
{
    this->stop();
};

void EventRouter::registerHandler(int kind, KindHandler handler, VerificationMode mode)
{
    lock_guard<mutex> lock(this->_tableMutex);
    this->_routes[kind] = Route{ handler, mode };
};

void EventRouter::unregisterHandler(int kind)
{
    lock_guard<mutex> lock(this->_tableMutex);
    this->_routes.erase(kind);
};

bool EventRouter::hasHandler(int kind)
{
    lock_guard<mutex> lock(this->_tableMutex);
    return this->_routes.find(kind) != this->_routes.end();
};

#pragma region Dispatch

void EventRouter::enqueue(shared_ptr<Event> event)
{
    if (event == nullptr)
    {
        return;
    }

    {
        lock_guard<mutex> lock(this->_queueMutex);
        this->_queue.push_back(event);
    }
    this->_queueCondition.notify_one();
};

bool EventRouter::dispatch(shared_ptr<Event> event)
{
    if (event == nullptr)
    {
        return false;
    }

    Route route;
    {
        lock_guard<mutex> lock(this->_tableMutex);
        auto it = this->_routes.find(event->kind);
        if (it == this->_routes.end())
        {
            PLOG_VERBOSE << "No handler for kind " << event->kind << "; dropping event " << event->id;
            return false;
        }
        route = it->second;
    }

    ValidationResult result = route.mode == VerificationMode::FULL
        ? this->_validator->validate(*event)
        : this->_validator->validateWithoutSignature(*event);
    if (!result.isValid())
    {
        PLOG_DEBUG << "Dropping invalid kind " << event->kind << " event " << event->id
                   << ": " << toString(result.error) << " (" << result.message << ")";
        return false;
    }

    try
    {
        route.handler(event);
    }
    catch (const exception& e)
    {
        PLOG_ERROR << "Handler for kind " << event->kind << " failed on event " << event->id << ": " << e.what();
    }

    return true;
};

void EventRouter::start()
{
    lock_guard<mutex> lock(this->_queueMutex);
    if (this->_isRunning)
    {
        return;
    }

    this->_isRunning = true;
    this->_dispatchThread = thread(&EventRouter::_run, this);
    PLOG_INFO << "Event router started.";
};

void EventRouter::stop()
{
    {
        lock_guard<mutex> lock(this->_queueMutex);
        if (!this->_isRunning)
        {
            return;
        }
        this->_isRunning = false;
        this->_queue.clear();
    }
    this->_queueCondition.notify_all();

    if (this->_dispatchThread.joinable())
    {
        this->_dispatchThread.join();
    }
    PLOG_INFO << "Event router stopped.";
};

size_t EventRouter::queuedCount()
{
    lock_guard<mutex> lock(this->_queueMutex);
    return this->_queue.size();
};

void EventRouter::_run()
{
    while (true)
    {
        shared_ptr<Event> event;
        {
            unique_lock<mutex> lock(this->_queueMutex);
            this->_queueCondition.wait(lock, [this]() { return !this->_isRunning || !this->_queue.empty(); });
            if (!this->_isRunning)
            {
                return;
            }
            event = this->_queue.front();
            this->_queue.pop_front();
        }

        this->dispatch(event);
    }
};

#pragma endregion

#pragma region Typed Callbacks

void EventRouter::onProfile(function<void(const Profile&)> callback)
{
    lock_guard<mutex> lock(this->_tableMutex);
    this->_profileCallback = callback;
};

void EventRouter::onFollowList(function<void(const FollowList&)> callback)
{
    lock_guard<mutex> lock(this->_tableMutex);
    this->_followListCallback = callback;
};

void EventRouter::onRelayList(function<void(const RelayList&)> callback)
{
    lock_guard<mutex> lock(this->_tableMutex);
    this->_relayListCallback = callback;
};

void EventRouter::onStreamMetadata(function<void(const StreamMetadata&)> callback)
{
    lock_guard<mutex> lock(this->_tableMutex);
    this->_streamCallback = callback;
};

void EventRouter::onChatMessage(function<void(const ActivityMessage&)> callback)
{
    lock_guard<mutex> lock(this->_tableMutex);
    this->_chatCallback = callback;
};

void EventRouter::onZapReceipt(function<void(const ActivityMessage&)> callback)
{
    lock_guard<mutex> lock(this->_tableMutex);
    this->_zapCallback = callback;
};

void EventRouter::onRpcMessage(function<void(shared_ptr<Event>)> callback)
{
    lock_guard<mutex> lock(this->_tableMutex);
    this->_rpcCallback = callback;
};

#pragma endregion

#pragma region Built-in Routes

void EventRouter::_registerBuiltInRoutes()
{
    this->registerHandler(kind::METADATA, [this](shared_ptr<Event> event) { this->_handleProfile(event); });
    this->registerHandler(kind::FOLLOW_LIST, [this](shared_ptr<Event> event) { this->_handleFollowList(event); });
    this->registerHandler(kind::RELAY_LIST, [this](shared_ptr<Event> event) { this->_handleRelayList(event); });
    this->registerHandler(kind::LIVE_STREAM, [this](shared_ptr<Event> event) { this->_handleStreamMetadata(event); });
    this->registerHandler(kind::LIVE_CHAT, [this](shared_ptr<Event> event) { this->_handleChatMessage(event); });
    this->registerHandler(kind::ZAP_RECEIPT, [this](shared_ptr<Event> event) { this->_handleZapReceipt(event); });
    this->registerHandler(kind::REMOTE_SIGNING, [this](shared_ptr<Event> event) { this->_handleRpcMessage(event); });
};

void EventRouter::_handleProfile(shared_ptr<Event> event)
{
    auto profile = Profile::fromEvent(*event);
    if (!profile.has_value())
    {
        PLOG_DEBUG << "Ignoring unparseable profile " << event->id;
        return;
    }

    if (this->_profileCache != nullptr)
    {
        this->_profileCache->put(profile->pubkey, *profile);
    }

    auto callback = this->_callback(this->_profileCallback);
    if (callback)
    {
        callback(*profile);
    }
};

void EventRouter::_handleFollowList(shared_ptr<Event> event)
{
    FollowList followList = FollowList::fromEvent(*event);
    auto callback = this->_callback(this->_followListCallback);
    if (callback)
    {
        callback(followList);
    }
};

void EventRouter::_handleRelayList(shared_ptr<Event> event)
{
    RelayList relayList = RelayList::fromEvent(*event);
    auto callback = this->_callback(this->_relayListCallback);
    if (callback)
    {
        callback(relayList);
    }
};

void EventRouter::_handleStreamMetadata(shared_ptr<Event> event)
{
    auto stream = StreamMetadata::fromEvent(*event);
    if (!stream.has_value())
    {
        return;
    }

    if (this->_profileCache != nullptr && !stream->hostPubkey.empty())
    {
        this->_profileCache->requestLookup(stream->hostPubkey);
    }

    auto callback = this->_callback(this->_streamCallback);
    if (callback)
    {
        callback(*stream);
    }
};

void EventRouter::_handleChatMessage(shared_ptr<Event> event)
{
    auto message = ActivityMessage::fromChatEvent(*event);
    if (!message.has_value())
    {
        return;
    }
    this->_resolveSenderName(*message);

    auto callback = this->_callback(this->_chatCallback);
    if (callback)
    {
        callback(*message);
    }
};

void EventRouter::_handleZapReceipt(shared_ptr<Event> event)
{
    auto message = ActivityMessage::fromZapReceipt(*event);
    if (!message.has_value())
    {
        PLOG_DEBUG << "Ignoring zap receipt " << event->id << " without a readable zap request.";
        return;
    }
    this->_resolveSenderName(*message);

    auto callback = this->_callback(this->_zapCallback);
    if (callback)
    {
        callback(*message);
    }
};

void EventRouter::_handleRpcMessage(shared_ptr<Event> event)
{
    auto callback = this->_callback(this->_rpcCallback);
    if (callback)
    {
        callback(event);
    }
};

void EventRouter::_resolveSenderName(ActivityMessage& message)
{
    if (this->_profileCache == nullptr || message.senderPubkey.empty())
    {
        return;
    }

    auto entry = this->_profileCache->get(message.senderPubkey);
    if (entry.has_value())
    {
        message.senderName = entry->profile.displayNameOrName();
    }
    else
    {
        this->_profileCache->requestLookup(message.senderPubkey);
    }
};

#pragma endregion
