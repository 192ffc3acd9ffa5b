#pragma once

#include <chrono>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <plog/Init.h>
#include <plog/Log.h>

#include "nostrcast/data/data.hpp"
#include "nostrcast/service/connection_pool.hpp"
#include "nostrcast/signer/connection_uri.hpp"
#include "nostrcast/signer/remote_signer_error.hpp"
#include "nostrcast/signer/signer.hpp"
#include "nostrcast/util/clock.hpp"
#include "nostrcast/util/scheduler.hpp"

namespace nostrcast
{
namespace signer
{
enum class ConnectionStatus
{
    DISCONNECTED,
    CONNECTING,
    WAITING_FOR_SCAN, ///< Reverse flow: the connection URI is displayed and no signer has replied.
    WAITING_FOR_APPROVAL, ///< The signer is known and has not yet approved the connection.
    CONNECTED,
    ERROR
};

std::string toString(ConnectionStatus status);

struct ConnectionState
{
    ConnectionStatus status = ConnectionStatus::DISCONNECTED;
    std::string remoteIdentity; ///< The user's pubkey, once connected.
    std::string reason; ///< Why the session failed, in the `ERROR` state.
};

struct RemoteSignerConfig
{
    std::chrono::milliseconds requestTimeout = std::chrono::seconds(30);
    std::chrono::milliseconds handshakeTimeout = std::chrono::seconds(180);
};

/**
 * @brief An RPC request awaiting its response.
 */
struct PendingRequest
{
    std::string id;
    std::string method;
    std::chrono::system_clock::time_point sentAt;
    std::shared_ptr<std::promise<std::string>> promise;
    util::IScheduler::TaskId timeoutHandle = 0;
};

/**
 * @brief Handshake state for one connection to a remote signer.
 */
struct BunkerSession
{
    std::string remotePubkey; ///< Empty in the reverse flow until the signer first replies.
    std::vector<std::string> relays;
    std::string secret; ///< Cleared once the signer has echoed it.
    std::string userPubkey; ///< Set when the handshake completes.
    std::string subscriptionId;
    std::shared_ptr<std::promise<void>> handshake; ///< Resolved by the first reply in the reverse flow.
    util::IScheduler::TaskId handshakeTimeout = 0;
};

/**
 * @brief A NIP-46 client that delegates signing to a remote signer over relays.
 * @remark Requests are encrypted to the signer with NIP-44, wrapped in kind 24133 events signed
 * by an ephemeral local key, and published through the connection pool.  Responses reach the
 * client through `handleRpcEvent`.  Each request is resolved exactly once, by its response, its
 * timeout, or `disconnect`.
 */
class RemoteSignerClient
{
public:
    RemoteSignerClient(
        std::shared_ptr<plog::IAppender> appender,
        std::shared_ptr<service::IConnectionPool> pool,
        std::shared_ptr<ILocalSigner> localSigner,
        std::shared_ptr<util::IClock> clock,
        std::shared_ptr<util::IScheduler> scheduler,
        RemoteSignerConfig config = RemoteSignerConfig());

    ~RemoteSignerClient();

    RemoteSignerClient(const RemoteSignerClient&) = delete;

    RemoteSignerClient& operator=(const RemoteSignerClient&) = delete;

    #pragma region Handshake

    /**
     * @brief Connects to the remote signer named by a `bunker://` URI.
     * @returns A future holding the user's pubkey once the signer approves the connection.
     * @remark The future fails with a `RemoteSignerError`: `INVALID_URI` for a malformed URI,
     * `AUTHENTICATION_FAILED` if the signer does not echo the secret, or the error of the failed
     * handshake request.
     */
    std::future<std::string> connect(const std::string& bunkerUri);

    /**
     * @brief Builds a `nostrconnect://` URI for a remote signer to scan.
     * @param relays The relays on which the client will wait for the signer.
     * @param metadata Client details shown by the signer, such as `name`, `url`, and `perms`.
     * @returns The URI, containing the local pubkey and a fresh random secret.
     */
    std::string createNostrConnectUri(
        const std::vector<std::string>& relays,
        const std::map<std::string, std::string>& metadata = {});

    /**
     * @brief Waits for a remote signer to connect using a URI from `createNostrConnectUri`.
     * @returns A future holding the user's pubkey once the signer has connected.
     * @remark The first reply sets the signer's pubkey and must carry the URI's secret.  The
     * future fails with `TIMEOUT` if no signer replies within the handshake timeout.
     */
    std::future<std::string> waitForSignerConnection(const std::string& nostrConnectUri);

    /**
     * @brief Ends the session.
     * @remark Cancels every request timeout, fails every waiting caller with `NOT_CONNECTED`,
     * fails any handshake in progress, and closes the response subscription.
     */
    void disconnect();

    ConnectionState state();

    /**
     * @brief Sets a callback invoked with every state change.
     */
    void onStateChange(std::function<void(const ConnectionState&)> observer);

    std::string localPubkey() const;

    #pragma endregion

    #pragma region RPC

    /**
     * @brief Sends a request to the connected signer.
     * @returns A future holding the `result` of the response.
     * @remark The future fails with `NOT_CONNECTED` outside a connected session, `TIMEOUT` if
     * no response arrives in time, or `REMOTE_ERROR` with the signer's error message.
     */
    std::future<std::string> sendRequest(const std::string& method, const std::vector<std::string>& params);

    std::future<std::string> ping();

    std::future<std::string> getPublicKey();

    /**
     * @brief Asks the signer to sign an event on the user's behalf.
     * @returns A future holding the signed event.
     */
    std::future<data::Event> signEvent(const data::Event& event);

    /**
     * @brief Processes an inbound kind 24133 event.
     * @remark Events from pubkeys other than the session's signer are ignored.
     */
    void handleRpcEvent(std::shared_ptr<data::Event> event);

    size_t pendingRequestCount();

    bool hasPendingRequest(const std::string& requestId);

    #pragma endregion

private:
    std::shared_ptr<service::IConnectionPool> _pool;
    std::shared_ptr<ILocalSigner> _localSigner;
    std::shared_ptr<util::IClock> _clock;
    std::shared_ptr<util::IScheduler> _scheduler;
    RemoteSignerConfig _config;

    ///< Guards the session, its state, and the observer.
    std::mutex _sessionMutex;
    BunkerSession _session;
    ConnectionState _state;
    uint64_t _sessionGeneration = 0;
    std::function<void(const ConnectionState&)> _stateObserver;
    std::future<void> _handshakeTask;

    ///< Guards the pending request table.
    std::mutex _pendingMutex;
    std::unordered_map<std::string, PendingRequest> _pendingRequests;

    /**
     * @brief Starts a new session if none is active.
     * @returns The generation of the new session.
     * @throws `RemoteSignerError` with code `CONNECTION_FAILED` if a session is already active.
     */
    uint64_t _beginSession(BunkerSession session);

    /**
     * @brief Opens the session relays and subscribes for replies addressed to the local key.
     * @throws `RemoteSignerError` with code `CONNECTION_FAILED` if no relay could be opened.
     */
    void _openSession(uint64_t generation, const std::vector<std::string>& relays);

    /**
     * @brief Fetches the user's pubkey and marks the session connected.
     */
    std::string _completeHandshake(uint64_t generation);

    /**
     * @brief Publishes a state change, unless the session has since ended or, when `expected` is
     * given, the session has already left that status.
     */
    void _setState(
        uint64_t generation,
        ConnectionState state,
        std::optional<ConnectionStatus> expected = std::nullopt);

    void _failSession(uint64_t generation, const std::string& reason);

    void _failHandshake(uint64_t generation, RemoteSignerErrorCode code, const std::string& message);

    void _handleSignerHello(
        uint64_t generation,
        const std::string& signerPubkey,
        const nlohmann::json& message);

    /**
     * @brief Encrypts, signs, and publishes a request, and registers it as pending.
     * @remark Fails with `NOT_CONNECTED` if the session generation has moved on by the time the
     * request is registered, so that no request outlives the `disconnect` that failed the
     * pending table.  The session and pending locks are never held together.
     */
    std::future<std::string> _sendRequest(
        uint64_t generation,
        const std::string& method,
        const std::vector<std::string>& params,
        const std::string& recipient);

    /**
     * @brief Removes a pending request, so that only the first of its response, timeout, or
     * disconnect resolves it.
     */
    std::optional<PendingRequest> _takePendingRequest(const std::string& requestId);

    void _expireRequest(const std::string& requestId);

    std::string _generateRequestId() const;

    static std::future<std::string> _failedFuture(RemoteSignerErrorCode code, const std::string& message);
};
} // namespace signer
} // namespace nostrcast
