#include "nostrcast/client/websocketpp_client.hpp"
#include "nostrcast/service/nostr_client.hpp"
#include "nostrcast/signer/noscrypt_signer.hpp"

using namespace nostrcast::client;
using namespace nostrcast::config;
using namespace nostrcast::cryptography;
using namespace nostrcast::data;
using namespace nostrcast::service;
using namespace nostrcast::signer;
using namespace nostrcast::util;
using namespace nostrcast::validation;
using namespace std;

NostrClient::NostrClient(shared_ptr<plog::IAppender> appender, ClientConfig config)
: NostrClient(
    appender,
    config,
    make_shared<WebsocketppClient>(),
    make_shared<NoscryptSigner>(),
    make_shared<NoscryptVerifier>(),
    make_shared<SystemClock>(),
    make_shared<ThreadScheduler>(),
    make_shared<ThreadScheduler>())
{
    this->_ownedSchedulers.push_back(dynamic_pointer_cast<ThreadScheduler>(this->_poolScheduler));
    this->_ownedSchedulers.push_back(dynamic_pointer_cast<ThreadScheduler>(this->_scheduler));
};

NostrClient::NostrClient(
    shared_ptr<plog::IAppender> appender,
    ClientConfig config,
    shared_ptr<IWebSocketClient> webSocketClient,
    shared_ptr<ILocalSigner> localSigner,
    shared_ptr<ISignatureVerifier> verifier,
    shared_ptr<IClock> clock,
    shared_ptr<IScheduler> poolScheduler,
    shared_ptr<IScheduler> scheduler)
: _config(config), _clock(clock), _poolScheduler(poolScheduler), _scheduler(scheduler)
{
    // Components share the logger initialized here, so they are given no appender of their own.
    plog::init(this->_config.logSeverity, appender.get());
    plog::get()->setMaxSeverity(this->_config.logSeverity);
    shared_ptr<plog::IAppender> sharedLogger;

    this->_pool = make_shared<ConnectionPool>(
        sharedLogger,
        webSocketClient,
        this->_clock,
        this->_poolScheduler,
        this->_config.pool,
        this->_config.relays);
    this->_validator = make_shared<EventValidator>(this->_clock, verifier, this->_config.futureTolerance);
    this->_profileCache = make_shared<ProfileCache>(
        this->_clock,
        this->_scheduler,
        this->_pool,
        this->_config.profileCache);
    this->_router = make_shared<EventRouter>(this->_validator, this->_profileCache);
    this->_activityRouter = make_shared<ActivityRouter>(
        this->_clock,
        this->_scheduler,
        this->_pool,
        this->_config.activity);
    this->_remoteSigner = make_shared<RemoteSignerClient>(
        sharedLogger,
        this->_pool,
        localSigner,
        this->_clock,
        this->_scheduler,
        this->_config.remoteSigner);
    this->_activityPublisher = make_shared<ActivityPublisher>(this->_remoteSigner, this->_pool);

    this->_wire();
};

NostrClient::~NostrClient()
{
    this->stop();
    for (auto& scheduler : this->_ownedSchedulers)
    {
        if (scheduler != nullptr)
        {
            scheduler->stop();
        }
    }
    this->_unwire();
};

vector<string> NostrClient::start()
{
    if (this->_isRunning)
    {
        return this->_pool->activeRelays();
    }
    this->_isRunning = true;

    this->_router->start();
    vector<string> connectedRelays = this->_pool->connect();
    this->_pool->startHealthMonitor();
    this->_activityRouter->startHeartbeat();

    PLOG_INFO << "Nostr client started with " << connectedRelays.size() << " of "
              << this->_config.relays.size() << " relays.";
    return connectedRelays;
};

void NostrClient::stop()
{
    if (!this->_isRunning)
    {
        return;
    }
    this->_isRunning = false;

    this->_remoteSigner->disconnect();
    this->_activityRouter->stopHeartbeat();
    this->_pool->stopHealthMonitor();
    this->_pool->disconnect();
    this->_router->stop();

    PLOG_INFO << "Nostr client stopped.";
};

void NostrClient::_wire()
{
    this->_pool->setEventHandler([this](const string& relay, const string& subscriptionId, shared_ptr<Event> event)
    {
        this->_router->enqueue(event);
    });

    this->_pool->setResubscribeHandler([this](const string& subscriptionId, const string& purpose)
    {
        if (!this->_activityRouter->reissue(subscriptionId))
        {
            PLOG_WARNING << "No component owns subscription " << subscriptionId << " for " << purpose
                         << "; it will not be reissued.";
        }
    });

    this->_router->onChatMessage([this](const ActivityMessage& message)
    {
        this->_activityRouter->route(message);
    });
    this->_router->onZapReceipt([this](const ActivityMessage& message)
    {
        this->_activityRouter->route(message);
    });
    this->_router->onRpcMessage([this](shared_ptr<Event> event)
    {
        this->_remoteSigner->handleRpcEvent(event);
    });
};

void NostrClient::_unwire()
{
    this->_pool->setEventHandler(nullptr);
    this->_pool->setResubscribeHandler(nullptr);
    this->_router->onChatMessage(nullptr);
    this->_router->onZapReceipt(nullptr);
    this->_router->onRpcMessage(nullptr);
};
