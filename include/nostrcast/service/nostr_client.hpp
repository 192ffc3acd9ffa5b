#pragma once

#include <memory>
#include <string>
#include <vector>

#include <plog/Init.h>
#include <plog/Log.h>

#include "nostrcast/client/web_socket_client.hpp"
#include "nostrcast/config/client_config.hpp"
#include "nostrcast/cryptography/signature_verifier.hpp"
#include "nostrcast/service/activity_publisher.hpp"
#include "nostrcast/service/activity_router.hpp"
#include "nostrcast/service/connection_pool.hpp"
#include "nostrcast/service/event_router.hpp"
#include "nostrcast/service/profile_cache.hpp"
#include "nostrcast/signer/remote_signer_client.hpp"
#include "nostrcast/signer/signer.hpp"
#include "nostrcast/util/clock.hpp"
#include "nostrcast/util/scheduler.hpp"
#include "nostrcast/validation/event_validator.hpp"

namespace nostrcast
{
namespace service
{
/**
 * @brief Owns and connects the components of a Nostr client.
 * @remark Events received by the connection pool are validated and dispatched by the event
 * router.  Chat messages and zap receipts are passed on to the activity router, and remote
 * signing messages to the remote signer client.  Consumers receive live activity through
 * `activityRouter().subscribe` and other event kinds through the router's typed callbacks.
 */
class NostrClient
{
public:
    /**
     * @brief Creates a client that talks to relays over WebSocket++ with a fresh local key.
     * @param appender The plog appender for all components.  The log severity is taken from
     * the configuration.
     */
    NostrClient(std::shared_ptr<plog::IAppender> appender, config::ClientConfig config);

    /**
     * @brief Creates a client from the given collaborators.
     * @param poolScheduler Runs the pool's health checks and reconnects, which block while relays
     * are reopened.
     * @param scheduler Runs the timers of the other components.
     */
    NostrClient(
        std::shared_ptr<plog::IAppender> appender,
        config::ClientConfig config,
        std::shared_ptr<client::IWebSocketClient> webSocketClient,
        std::shared_ptr<signer::ILocalSigner> localSigner,
        std::shared_ptr<cryptography::ISignatureVerifier> verifier,
        std::shared_ptr<util::IClock> clock,
        std::shared_ptr<util::IScheduler> poolScheduler,
        std::shared_ptr<util::IScheduler> scheduler);

    ~NostrClient();

    NostrClient(const NostrClient&) = delete;

    NostrClient& operator=(const NostrClient&) = delete;

    /**
     * @brief Starts dispatch, connects to the configured relays, and starts health monitoring.
     * @returns The relays to which the client connected.
     */
    std::vector<std::string> start();

    /**
     * @brief Disconnects the remote signer and every relay, and stops monitoring and dispatch.
     */
    void stop();

    const config::ClientConfig& config() const { return this->_config; };

    ConnectionPool& pool() { return *this->_pool; };

    EventRouter& router() { return *this->_router; };

    ProfileCache& profileCache() { return *this->_profileCache; };

    ActivityRouter& activityRouter() { return *this->_activityRouter; };

    signer::RemoteSignerClient& remoteSigner() { return *this->_remoteSigner; };

    ActivityPublisher& activityPublisher() { return *this->_activityPublisher; };

private:
    config::ClientConfig _config;
    std::shared_ptr<util::IClock> _clock;
    std::shared_ptr<util::IScheduler> _poolScheduler;
    std::shared_ptr<util::IScheduler> _scheduler;
    ///< Schedulers created by this client, stopped before the components that use them.
    std::vector<std::shared_ptr<util::ThreadScheduler>> _ownedSchedulers;

    std::shared_ptr<ConnectionPool> _pool;
    std::shared_ptr<validation::EventValidator> _validator;
    std::shared_ptr<ProfileCache> _profileCache;
    std::shared_ptr<EventRouter> _router;
    std::shared_ptr<ActivityRouter> _activityRouter;
    std::shared_ptr<signer::RemoteSignerClient> _remoteSigner;
    std::shared_ptr<ActivityPublisher> _activityPublisher;

    bool _isRunning = false;

    void _wire();

    void _unwire();
};
} // namespace service
} // namespace nostrcast
