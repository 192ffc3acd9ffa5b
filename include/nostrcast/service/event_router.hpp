#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

#include <plog/Log.h>

#include "nostrcast/data/data.hpp"
#include "nostrcast/data/domain.hpp"
#include "nostrcast/service/profile_cache.hpp"
#include "nostrcast/validation/event_validator.hpp"

namespace nostrcast
{
namespace service
{
enum class VerificationMode
{
    FULL, ///< Structural checks, identifier, and signature.
    WITHOUT_SIGNATURE ///< Structural checks and identifier only.
};

typedef std::function<void(std::shared_ptr<data::Event>)> KindHandler;

/**
 * @brief Validates inbound events and dispatches each to the handler registered for its kind.
 * @remark Events enqueued from relay threads are dispatched in arrival order on the router's own
 * thread.  Events of kinds with no registered handler, and events that fail validation, are
 * dropped.  Exactly one handler runs for each accepted event.
 */
class EventRouter
{
public:
    /**
     * @param validator Validates each event before dispatch.
     * @param profileCache Receives profile events and resolves sender names.  May be null.
     */
    EventRouter(
        std::shared_ptr<validation::EventValidator> validator,
        std::shared_ptr<ProfileCache> profileCache);

    ~EventRouter();

    EventRouter(const EventRouter&) = delete;

    EventRouter& operator=(const EventRouter&) = delete;

    /**
     * @brief Adds or replaces the handler for an event kind.
     * @param mode Whether events of this kind must carry a valid signature.
     */
    void registerHandler(int kind, KindHandler handler, VerificationMode mode = VerificationMode::FULL);

    /**
     * @brief Removes the handler for an event kind, so that events of that kind are dropped.
     */
    void unregisterHandler(int kind);

    bool hasHandler(int kind);

    /**
     * @brief Queues an event for dispatch on the router thread.
     */
    void enqueue(std::shared_ptr<data::Event> event);

    /**
     * @brief Validates an event and runs its handler on the calling thread.
     * @returns True if a handler ran.
     */
    bool dispatch(std::shared_ptr<data::Event> event);

    void start();

    /**
     * @brief Stops the dispatch thread.  Events still queued are discarded.
     */
    void stop();

    size_t queuedCount();

    #pragma region Typed Callbacks

    void onProfile(std::function<void(const data::Profile&)> callback);

    void onFollowList(std::function<void(const data::FollowList&)> callback);

    void onRelayList(std::function<void(const data::RelayList&)> callback);

    void onStreamMetadata(std::function<void(const data::StreamMetadata&)> callback);

    void onChatMessage(std::function<void(const data::ActivityMessage&)> callback);

    void onZapReceipt(std::function<void(const data::ActivityMessage&)> callback);

    void onRpcMessage(std::function<void(std::shared_ptr<data::Event>)> callback);

    #pragma endregion

private:
    struct Route
    {
        KindHandler handler;
        VerificationMode mode = VerificationMode::FULL;
    };

    std::shared_ptr<validation::EventValidator> _validator;
    std::shared_ptr<ProfileCache> _profileCache;

    ///< Guards the dispatch table and the typed callbacks.
    std::mutex _tableMutex;
    std::unordered_map<int, Route> _routes;
    std::function<void(const data::Profile&)> _profileCallback;
    std::function<void(const data::FollowList&)> _followListCallback;
    std::function<void(const data::RelayList&)> _relayListCallback;
    std::function<void(const data::StreamMetadata&)> _streamCallback;
    std::function<void(const data::ActivityMessage&)> _chatCallback;
    std::function<void(const data::ActivityMessage&)> _zapCallback;
    std::function<void(std::shared_ptr<data::Event>)> _rpcCallback;

    std::mutex _queueMutex;
    std::condition_variable _queueCondition;
    std::deque<std::shared_ptr<data::Event>> _queue;
    bool _isRunning = false;
    std::thread _dispatchThread;

    void _registerBuiltInRoutes();

    void _run();

    void _handleProfile(std::shared_ptr<data::Event> event);

    void _handleFollowList(std::shared_ptr<data::Event> event);

    void _handleRelayList(std::shared_ptr<data::Event> event);

    void _handleStreamMetadata(std::shared_ptr<data::Event> event);

    void _handleChatMessage(std::shared_ptr<data::Event> event);

    void _handleZapReceipt(std::shared_ptr<data::Event> event);

    void _handleRpcMessage(std::shared_ptr<data::Event> event);

    /**
     * @brief Fills the sender's display name from the profile cache, or requests the profile.
     */
    void _resolveSenderName(data::ActivityMessage& message);

    template <typename Callback>
    Callback _callback(const Callback& callback)
    {
        std::lock_guard<std::mutex> lock(this->_tableMutex);
        return callback;
    };
};
} // namespace service
} // namespace nostrcast
