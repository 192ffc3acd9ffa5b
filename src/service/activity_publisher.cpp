#include <stdexcept>

#include "nostrcast/service/activity_publisher.hpp"

using namespace nostrcast::data;
using namespace nostrcast::service;
using namespace nostrcast::signer;
using namespace std;

ActivityPublisher::ActivityPublisher(shared_ptr<RemoteSignerClient> signer, shared_ptr<IConnectionPool> pool)
: _signer(signer), _pool(pool)
{
};

future<shared_ptr<Event>> ActivityPublisher::sendChatMessage(const string& coordinate, const string& content)
{
    Event chatMessage = makeLiveChatEvent(coordinate, content);
    auto signedFuture = this->_signer->signEvent(chatMessage);

    return async(launch::async, [pool = this->_pool, signedFuture = move(signedFuture), coordinate]() mutable
    {
        auto event = make_shared<Event>(signedFuture.get());

        auto [acceptedRelays, rejectedRelays] = pool->publishEvent(event);
        if (acceptedRelays.empty())
        {
            PLOG_ERROR << "Chat message " << event->id << " was rejected by all " << rejectedRelays.size() << " relays.";
            throw runtime_error("No relay accepted chat message " + event->id);
        }

        PLOG_INFO << "Sent chat message " << event->id << " to " << coordinate
                  << " through " << acceptedRelays.size() << " relays.";
        return event;
    });
};

future<Event> ActivityPublisher::signZapRequest(const ZapRequest& request)
{
    Event zapRequest = request.toEvent();
    PLOG_DEBUG << "Requesting signature for a zap of " << request.amountMillisats << " msat to " << request.coordinate;

    return this->_signer->signEvent(zapRequest);
};
