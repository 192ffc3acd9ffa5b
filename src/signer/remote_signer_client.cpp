#include <algorithm>

#include <nlohmann/json.hpp>
#include <uuid_v4.h>

#include "nostrcast/signer/remote_signer_client.hpp"
#include "nostrcast/util/encoding.hpp"
#include "../cryptography/nostr_secure_rng.hpp"

using namespace nlohmann;
using namespace nostrcast::cryptography;
using namespace nostrcast::data;
using namespace nostrcast::service;
using namespace nostrcast::signer;
using namespace nostrcast::util;
using namespace std;

string nostrcast::signer::toString(ConnectionStatus status)
{
    switch (status)
    {
    case ConnectionStatus::DISCONNECTED:
        return "disconnected";
    case ConnectionStatus::CONNECTING:
        return "connecting";
    case ConnectionStatus::WAITING_FOR_SCAN:
        return "waiting for scan";
    case ConnectionStatus::WAITING_FOR_APPROVAL:
        return "waiting for approval";
    case ConnectionStatus::CONNECTED:
        return "connected";
    case ConnectionStatus::ERROR:
        return "error";
    }
    return "unknown";
};

#pragma region Constructors and Destructors

RemoteSignerClient::RemoteSignerClient(
    shared_ptr<plog::IAppender> appender,
    shared_ptr<IConnectionPool> pool,
    shared_ptr<ILocalSigner> localSigner,
    shared_ptr<IClock> clock,
    shared_ptr<IScheduler> scheduler,
    RemoteSignerConfig config)
: _pool(pool), _localSigner(localSigner), _clock(clock), _scheduler(scheduler), _config(config)
{
    plog::init(plog::debug, appender.get());
};

RemoteSignerClient::~RemoteSignerClient()
{
    this->disconnect();
    if (this->_handshakeTask.valid())
    {
        this->_handshakeTask.wait();
    }
};

#pragma endregion

#pragma region Handshake

future<string> RemoteSignerClient::connect(const string& bunkerUri)
{
    ConnectionUri uri;
    try
    {
        uri = ConnectionUri::parse(bunkerUri);
    }
    catch (const RemoteSignerError& e)
    {
        PLOG_ERROR << "Cannot connect to remote signer: " << e.what();
        return _failedFuture(e.code(), e.what());
    }

    if (uri.scheme != ConnectionUri::Scheme::BUNKER)
    {
        return _failedFuture(RemoteSignerErrorCode::INVALID_URI, "A direct connection requires a 'bunker://' URI.");
    }

    BunkerSession session;
    session.remotePubkey = uri.pubkey;
    session.relays = uri.relays;
    session.secret = uri.secret.value_or(string());

    uint64_t generation;
    try
    {
        generation = this->_beginSession(session);
    }
    catch (const RemoteSignerError& e)
    {
        return _failedFuture(e.code(), e.what());
    }

    PLOG_INFO << "Connecting to remote signer " << uri.pubkey;

    auto result = make_shared<promise<string>>();
    auto resultFuture = result->get_future();

    if (this->_handshakeTask.valid())
    {
        this->_handshakeTask.wait();
    }
    this->_handshakeTask = async(launch::async, [this, generation, uri, result]()
    {
        try
        {
            this->_openSession(generation, uri.relays);
            this->_setState(generation, ConnectionState{ ConnectionStatus::WAITING_FOR_APPROVAL, "", "" });

            vector<string> params = { uri.pubkey };
            if (uri.secret.has_value())
            {
                params.push_back(*uri.secret);
            }

            string reply = this->_sendRequest(generation, "connect", params, uri.pubkey).get();
            if (uri.secret.has_value() && reply != "ack" && reply != *uri.secret)
            {
                throw RemoteSignerError(
                    RemoteSignerErrorCode::AUTHENTICATION_FAILED,
                    "The remote signer did not echo the connection secret.");
            }

            {
                lock_guard<mutex> lock(this->_sessionMutex);
                if (generation == this->_sessionGeneration)
                {
                    this->_session.secret.clear();
                }
            }

            result->set_value(this->_completeHandshake(generation));
        }
        catch (const exception& e)
        {
            this->_failSession(generation, e.what());
            result->set_exception(current_exception());
        }
    });

    return resultFuture;
};

string RemoteSignerClient::createNostrConnectUri(
    const vector<string>& relays,
    const map<string, string>& metadata)
{
    ConnectionUri uri;
    uri.scheme = ConnectionUri::Scheme::NOSTR_CONNECT;
    uri.pubkey = this->localPubkey();
    uri.relays = relays;
    uri.secret = NostrSecureRng::hexToken(16);
    uri.metadata = metadata;

    return uri.toString();
};

future<string> RemoteSignerClient::waitForSignerConnection(const string& nostrConnectUri)
{
    ConnectionUri uri;
    try
    {
        uri = ConnectionUri::parse(nostrConnectUri);
    }
    catch (const RemoteSignerError& e)
    {
        PLOG_ERROR << "Cannot wait for remote signer: " << e.what();
        return _failedFuture(e.code(), e.what());
    }

    if (uri.scheme != ConnectionUri::Scheme::NOSTR_CONNECT || uri.pubkey != this->localPubkey())
    {
        return _failedFuture(
            RemoteSignerErrorCode::INVALID_URI,
            "A reverse connection requires a 'nostrconnect://' URI for this client's key.");
    }

    BunkerSession session;
    session.relays = uri.relays;
    session.secret = uri.secret.value_or(string());
    session.handshake = make_shared<promise<void>>();
    auto handshakeFuture = session.handshake->get_future();

    uint64_t generation;
    try
    {
        generation = this->_beginSession(session);
    }
    catch (const RemoteSignerError& e)
    {
        return _failedFuture(e.code(), e.what());
    }

    PLOG_INFO << "Waiting for a remote signer to connect.";

    auto result = make_shared<promise<string>>();
    auto resultFuture = result->get_future();

    if (this->_handshakeTask.valid())
    {
        this->_handshakeTask.wait();
    }
    this->_handshakeTask = async(
        launch::async,
        [this, generation, uri, result, handshakeFuture = move(handshakeFuture)]() mutable
    {
        try
        {
            this->_openSession(generation, uri.relays);
            this->_setState(
                generation,
                ConnectionState{ ConnectionStatus::WAITING_FOR_SCAN, "", "" },
                ConnectionStatus::CONNECTING);

            auto handshakeTimeout = this->_scheduler->schedule(
                this->_config.handshakeTimeout,
                [this, generation]()
                {
                    this->_failHandshake(
                        generation,
                        RemoteSignerErrorCode::TIMEOUT,
                        "No remote signer connected in time.");
                });
            bool isTracked = false;
            {
                lock_guard<mutex> lock(this->_sessionMutex);
                if (generation == this->_sessionGeneration && this->_session.handshake != nullptr)
                {
                    this->_session.handshakeTimeout = handshakeTimeout;
                    isTracked = true;
                }
            }
            if (!isTracked)
            {
                this->_scheduler->cancel(handshakeTimeout);
            }

            handshakeFuture.get();
            result->set_value(this->_completeHandshake(generation));
        }
        catch (const exception& e)
        {
            this->_failSession(generation, e.what());
            result->set_exception(current_exception());
        }
    });

    return resultFuture;
};

void RemoteSignerClient::disconnect()
{
    shared_ptr<promise<void>> handshake;
    string subscriptionId;
    IScheduler::TaskId handshakeTimeout;
    bool wasActive;
    ConnectionState state;
    function<void(const ConnectionState&)> observer;

    {
        lock_guard<mutex> lock(this->_sessionMutex);
        wasActive = this->_state.status != ConnectionStatus::DISCONNECTED;
        handshake = move(this->_session.handshake);
        subscriptionId = this->_session.subscriptionId;
        handshakeTimeout = this->_session.handshakeTimeout;

        this->_session = BunkerSession();
        this->_sessionGeneration++;
        this->_state = ConnectionState();
        state = this->_state;
        observer = this->_stateObserver;
    }

    if (handshakeTimeout != 0)
    {
        this->_scheduler->cancel(handshakeTimeout);
    }
    if (handshake != nullptr)
    {
        handshake->set_exception(make_exception_ptr(RemoteSignerError(
            RemoteSignerErrorCode::NOT_CONNECTED,
            "The remote signer session was disconnected.")));
    }

    vector<PendingRequest> requests;
    {
        lock_guard<mutex> lock(this->_pendingMutex);
        for (auto& [requestId, request] : this->_pendingRequests)
        {
            requests.push_back(move(request));
        }
        this->_pendingRequests.clear();
    }

    for (auto& request : requests)
    {
        this->_scheduler->cancel(request.timeoutHandle);
        request.promise->set_exception(make_exception_ptr(RemoteSignerError(
            RemoteSignerErrorCode::NOT_CONNECTED,
            "The remote signer session was disconnected before " + request.method + " completed.")));
    }

    if (!subscriptionId.empty())
    {
        this->_pool->unsubscribe(subscriptionId);
    }

    if (wasActive)
    {
        PLOG_INFO << "Disconnected from remote signer; failed " << requests.size() << " pending requests.";
        if (observer)
        {
            observer(state);
        }
    }
};

ConnectionState RemoteSignerClient::state()
{
    lock_guard<mutex> lock(this->_sessionMutex);
    return this->_state;
};

void RemoteSignerClient::onStateChange(function<void(const ConnectionState&)> observer)
{
    lock_guard<mutex> lock(this->_sessionMutex);
    this->_stateObserver = observer;
};

string RemoteSignerClient::localPubkey() const
{
    return this->_localSigner->publicKey();
};

#pragma endregion

#pragma region RPC

future<string> RemoteSignerClient::sendRequest(const string& method, const vector<string>& params)
{
    string remotePubkey;
    uint64_t generation;
    {
        lock_guard<mutex> lock(this->_sessionMutex);
        if (this->_state.status != ConnectionStatus::CONNECTED)
        {
            return _failedFuture(
                RemoteSignerErrorCode::NOT_CONNECTED,
                "No remote signer is connected; cannot send " + method + ".");
        }
        remotePubkey = this->_session.remotePubkey;
        generation = this->_sessionGeneration;
    }

    return this->_sendRequest(generation, method, params, remotePubkey);
};

future<string> RemoteSignerClient::ping()
{
    return this->sendRequest("ping", {});
};

future<string> RemoteSignerClient::getPublicKey()
{
    return this->sendRequest("get_public_key", {});
};

future<Event> RemoteSignerClient::signEvent(const Event& event)
{
    string userPubkey;
    {
        lock_guard<mutex> lock(this->_sessionMutex);
        userPubkey = this->_session.userPubkey;
    }

    json unsignedEvent = {
        { "kind", event.kind },
        { "content", event.content },
        { "tags", event.tags },
        { "created_at", event.createdAt > 0 ? event.createdAt : chrono::system_clock::to_time_t(this->_clock->now()) },
        { "pubkey", userPubkey }
    };

    auto response = this->sendRequest("sign_event", { unsignedEvent.dump() });

    return async(launch::deferred, [response = move(response)]() mutable
    {
        string signedJson = response.get();

        Event signedEvent;
        try
        {
            signedEvent = Event::fromString(signedJson);
        }
        catch (const json::exception& je)
        {
            throw RemoteSignerError(
                RemoteSignerErrorCode::INVALID_RESPONSE,
                string("The signed event could not be parsed: ") + je.what());
        }

        if (signedEvent.id.empty() || signedEvent.sig.empty())
        {
            throw RemoteSignerError(
                RemoteSignerErrorCode::INVALID_RESPONSE,
                "The signed event is missing its id or signature.");
        }

        return signedEvent;
    });
};

void RemoteSignerClient::handleRpcEvent(shared_ptr<Event> event)
{
    if (event == nullptr || event->kind != kind::REMOTE_SIGNING)
    {
        return;
    }

    string local = this->localPubkey();
    auto recipients = event->tagValues("p");
    if (find(recipients.begin(), recipients.end(), local) == recipients.end())
    {
        PLOG_VERBOSE << "Ignoring signer message " << event->id << " addressed to another client.";
        return;
    }

    string sender = toLower(event->pubkey);
    ConnectionStatus status;
    string remotePubkey;
    uint64_t generation;
    {
        lock_guard<mutex> lock(this->_sessionMutex);
        status = this->_state.status;
        remotePubkey = this->_session.remotePubkey;
        generation = this->_sessionGeneration;
    }

    if (status == ConnectionStatus::DISCONNECTED || status == ConnectionStatus::ERROR)
    {
        PLOG_VERBOSE << "Ignoring signer message " << event->id << " outside an active session.";
        return;
    }
    if (!remotePubkey.empty() && sender != remotePubkey)
    {
        PLOG_DEBUG << "Ignoring signer message from unexpected pubkey " << sender;
        return;
    }

    string plaintext = this->_localSigner->decrypt(event->content, sender);
    if (plaintext.empty())
    {
        PLOG_WARNING << "Failed to decrypt signer message " << event->id;
        return;
    }

    json message = json::parse(plaintext, nullptr, false);
    if (message.is_discarded() || !message.is_object() || !message.contains("id") || !message["id"].is_string())
    {
        PLOG_WARNING << "Dropping malformed signer message " << event->id;
        return;
    }

    if (remotePubkey.empty())
    {
        this->_handleSignerHello(generation, sender, message);
        return;
    }

    string requestId = message["id"].get<string>();
    auto request = this->_takePendingRequest(requestId);
    if (!request.has_value())
    {
        PLOG_VERBOSE << "No pending request matches signer response " << requestId;
        return;
    }
    this->_scheduler->cancel(request->timeoutHandle);

    if (message.contains("error") && message["error"].is_string() && !message["error"].get<string>().empty())
    {
        string error = message["error"].get<string>();
        PLOG_WARNING << "Remote signer returned an error for " << request->method << ": " << error;
        request->promise->set_exception(make_exception_ptr(
            RemoteSignerError(RemoteSignerErrorCode::REMOTE_ERROR, error)));
    }
    else if (message.contains("result") && message["result"].is_string())
    {
        PLOG_DEBUG << "Received response to " << request->method << " request " << requestId;
        request->promise->set_value(message["result"].get<string>());
    }
    else
    {
        request->promise->set_exception(make_exception_ptr(RemoteSignerError(
            RemoteSignerErrorCode::INVALID_RESPONSE,
            "The response to " + request->method + " has neither a result nor an error.")));
    }
};

size_t RemoteSignerClient::pendingRequestCount()
{
    lock_guard<mutex> lock(this->_pendingMutex);
    return this->_pendingRequests.size();
};

bool RemoteSignerClient::hasPendingRequest(const string& requestId)
{
    lock_guard<mutex> lock(this->_pendingMutex);
    return this->_pendingRequests.find(requestId) != this->_pendingRequests.end();
};

#pragma endregion

#pragma region Session Helpers

uint64_t RemoteSignerClient::_beginSession(BunkerSession session)
{
    uint64_t generation;
    ConnectionState state;
    function<void(const ConnectionState&)> observer;
    {
        lock_guard<mutex> lock(this->_sessionMutex);
        if (this->_state.status != ConnectionStatus::DISCONNECTED
            && this->_state.status != ConnectionStatus::ERROR)
        {
            throw RemoteSignerError(
                RemoteSignerErrorCode::CONNECTION_FAILED,
                "A remote signer session is already " + toString(this->_state.status) + ".");
        }

        this->_session = move(session);
        generation = ++this->_sessionGeneration;
        this->_state = ConnectionState{ ConnectionStatus::CONNECTING, "", "" };
        state = this->_state;
        observer = this->_stateObserver;
    }

    if (observer)
    {
        observer(state);
    }

    return generation;
};

void RemoteSignerClient::_openSession(uint64_t generation, const vector<string>& relays)
{
    auto openRelays = this->_pool->openRelayConnections(relays);
    bool anyOpen = any_of(relays.begin(), relays.end(), [&openRelays](const string& relay)
    {
        return find(openRelays.begin(), openRelays.end(), relay) != openRelays.end();
    });
    if (!anyOpen)
    {
        throw RemoteSignerError(
            RemoteSignerErrorCode::CONNECTION_FAILED,
            "Could not connect to any of the remote signer's relays.");
    }

    Filters filters;
    filters.kinds = { kind::REMOTE_SIGNING };
    filters.tags["p"] = { this->localPubkey() };
    filters.since = chrono::system_clock::to_time_t(this->_clock->now());

    string subscriptionId = this->_pool->subscribe(filters, "remote signer");

    unique_lock<mutex> lock(this->_sessionMutex);
    if (generation != this->_sessionGeneration)
    {
        lock.unlock();
        this->_pool->unsubscribe(subscriptionId);
        throw RemoteSignerError(
            RemoteSignerErrorCode::NOT_CONNECTED,
            "The remote signer session ended while connecting.");
    }
    this->_session.subscriptionId = subscriptionId;
};

string RemoteSignerClient::_completeHandshake(uint64_t generation)
{
    string remotePubkey;
    {
        lock_guard<mutex> lock(this->_sessionMutex);
        remotePubkey = this->_session.remotePubkey;
    }

    string userPubkey = toLower(this->_sendRequest(generation, "get_public_key", {}, remotePubkey).get());
    if (!isHex(userPubkey, 64))
    {
        throw RemoteSignerError(
            RemoteSignerErrorCode::INVALID_RESPONSE,
            "The remote signer returned an invalid user pubkey.");
    }

    {
        lock_guard<mutex> lock(this->_sessionMutex);
        if (generation != this->_sessionGeneration)
        {
            throw RemoteSignerError(
                RemoteSignerErrorCode::NOT_CONNECTED,
                "The remote signer session ended during the handshake.");
        }
        this->_session.userPubkey = userPubkey;
    }

    this->_setState(generation, ConnectionState{ ConnectionStatus::CONNECTED, userPubkey, "" });
    PLOG_INFO << "Connected to remote signer for user " << userPubkey;

    return userPubkey;
};

void RemoteSignerClient::_setState(
    uint64_t generation,
    ConnectionState state,
    optional<ConnectionStatus> expected)
{
    function<void(const ConnectionState&)> observer;
    {
        lock_guard<mutex> lock(this->_sessionMutex);
        if (generation != this->_sessionGeneration
            || this->_state.status == ConnectionStatus::DISCONNECTED
            || this->_state.status == ConnectionStatus::ERROR)
        {
            return;
        }
        if (expected.has_value() && this->_state.status != *expected)
        {
            return;
        }

        this->_state = state;
        observer = this->_stateObserver;
    }

    PLOG_DEBUG << "Remote signer state: " << toString(state.status);
    if (observer)
    {
        observer(state);
    }
};

void RemoteSignerClient::_failSession(uint64_t generation, const string& reason)
{
    string subscriptionId;
    IScheduler::TaskId handshakeTimeout;
    ConnectionState state;
    function<void(const ConnectionState&)> observer;
    {
        lock_guard<mutex> lock(this->_sessionMutex);
        if (generation != this->_sessionGeneration
            || this->_state.status == ConnectionStatus::DISCONNECTED
            || this->_state.status == ConnectionStatus::ERROR)
        {
            return;
        }

        subscriptionId = this->_session.subscriptionId;
        handshakeTimeout = this->_session.handshakeTimeout;
        this->_session.subscriptionId.clear();
        this->_session.handshakeTimeout = 0;
        this->_session.handshake.reset();
        this->_session.secret.clear();

        this->_state = ConnectionState{ ConnectionStatus::ERROR, "", reason };
        state = this->_state;
        observer = this->_stateObserver;
    }

    PLOG_ERROR << "Remote signer connection failed: " << reason;

    if (handshakeTimeout != 0)
    {
        this->_scheduler->cancel(handshakeTimeout);
    }
    if (!subscriptionId.empty())
    {
        this->_pool->unsubscribe(subscriptionId);
    }
    if (observer)
    {
        observer(state);
    }
};

void RemoteSignerClient::_failHandshake(
    uint64_t generation,
    RemoteSignerErrorCode code,
    const string& message)
{
    shared_ptr<promise<void>> handshake;
    {
        lock_guard<mutex> lock(this->_sessionMutex);
        if (generation != this->_sessionGeneration)
        {
            return;
        }
        handshake = move(this->_session.handshake);
        this->_session.handshakeTimeout = 0;
    }

    if (handshake != nullptr)
    {
        handshake->set_exception(make_exception_ptr(RemoteSignerError(code, message)));
    }
};

void RemoteSignerClient::_handleSignerHello(
    uint64_t generation,
    const string& signerPubkey,
    const json& message)
{
    shared_ptr<promise<void>> handshake;
    string secret;
    IScheduler::TaskId handshakeTimeout;
    {
        lock_guard<mutex> lock(this->_sessionMutex);
        if (generation != this->_sessionGeneration
            || !this->_session.remotePubkey.empty()
            || (this->_state.status != ConnectionStatus::CONNECTING
                && this->_state.status != ConnectionStatus::WAITING_FOR_SCAN))
        {
            return;
        }

        this->_session.remotePubkey = signerPubkey;
        secret = this->_session.secret;
        handshake = move(this->_session.handshake);
        handshakeTimeout = this->_session.handshakeTimeout;
        this->_session.handshakeTimeout = 0;
    }

    if (handshakeTimeout != 0)
    {
        this->_scheduler->cancel(handshakeTimeout);
    }

    PLOG_INFO << "Remote signer " << signerPubkey << " responded to the connection URI.";
    this->_setState(generation, ConnectionState{ ConnectionStatus::WAITING_FOR_APPROVAL, "", "" });

    if (handshake == nullptr)
    {
        return;
    }

    string result = message.contains("result") && message["result"].is_string()
        ? message["result"].get<string>()
        : string();
    string error = message.contains("error") && message["error"].is_string()
        ? message["error"].get<string>()
        : string();

    if (!error.empty())
    {
        handshake->set_exception(make_exception_ptr(
            RemoteSignerError(RemoteSignerErrorCode::REMOTE_ERROR, error)));
        return;
    }

    if (!secret.empty() && result != secret && result != "ack")
    {
        handshake->set_exception(make_exception_ptr(RemoteSignerError(
            RemoteSignerErrorCode::AUTHENTICATION_FAILED,
            "The remote signer replied with the wrong connection secret.")));
        return;
    }

    {
        lock_guard<mutex> lock(this->_sessionMutex);
        if (generation == this->_sessionGeneration)
        {
            this->_session.secret.clear();
        }
    }
    handshake->set_value();
};

#pragma endregion

#pragma region Request Helpers

future<string> RemoteSignerClient::_sendRequest(
    uint64_t generation,
    const string& method,
    const vector<string>& params,
    const string& recipient)
{
    string requestId = this->_generateRequestId();
    json payload = {
        { "id", requestId },
        { "method", method },
        { "params", params }
    };

    string encryptedContent = this->_localSigner->encrypt(payload.dump(), recipient);
    if (encryptedContent.empty())
    {
        return _failedFuture(
            RemoteSignerErrorCode::ENCRYPTION_FAILED,
            "Failed to encrypt the " + method + " request.");
    }

    auto requestEvent = make_shared<Event>();
    requestEvent->kind = kind::REMOTE_SIGNING;
    requestEvent->tags.push_back({ "p", recipient });
    requestEvent->content = encryptedContent;
    requestEvent->createdAt = chrono::system_clock::to_time_t(this->_clock->now());

    try
    {
        this->_localSigner->sign(requestEvent);
    }
    catch (const exception& e)
    {
        return _failedFuture(
            RemoteSignerErrorCode::ENCRYPTION_FAILED,
            "Failed to sign the " + method + " request: " + e.what());
    }

    auto responsePromise = make_shared<promise<string>>();
    auto responseFuture = responsePromise->get_future();

    // The request is registered before it is published so that a fast response finds it.
    {
        lock_guard<mutex> lock(this->_pendingMutex);
        PendingRequest request;
        request.id = requestId;
        request.method = method;
        request.sentAt = this->_clock->now();
        request.promise = responsePromise;
        this->_pendingRequests[requestId] = request;
    }

    auto timeoutHandle = this->_scheduler->schedule(this->_config.requestTimeout, [this, requestId]()
    {
        this->_expireRequest(requestId);
    });
    bool isPending = false;
    {
        lock_guard<mutex> lock(this->_pendingMutex);
        auto it = this->_pendingRequests.find(requestId);
        if (it != this->_pendingRequests.end())
        {
            it->second.timeoutHandle = timeoutHandle;
            isPending = true;
        }
    }
    if (!isPending)
    {
        this->_scheduler->cancel(timeoutHandle);
    }

    // A disconnect that bumped the generation before the request was registered has already
    // drained the table, so the request is withdrawn here instead.
    bool isCurrent;
    {
        lock_guard<mutex> lock(this->_sessionMutex);
        isCurrent = generation == this->_sessionGeneration;
    }
    if (!isCurrent)
    {
        this->_scheduler->cancel(timeoutHandle);
        auto request = this->_takePendingRequest(requestId);
        if (request.has_value())
        {
            request->promise->set_exception(make_exception_ptr(RemoteSignerError(
                RemoteSignerErrorCode::NOT_CONNECTED,
                "The remote signer session ended before the " + method + " request was sent.")));
        }
        return responseFuture;
    }

    PLOG_DEBUG << "Sending " << method << " request " << requestId << " to remote signer.";
    auto [successes, failures] = this->_pool->publishEvent(requestEvent);
    if (successes.empty())
    {
        auto request = this->_takePendingRequest(requestId);
        if (request.has_value())
        {
            this->_scheduler->cancel(request->timeoutHandle);
            request->promise->set_exception(make_exception_ptr(RemoteSignerError(
                RemoteSignerErrorCode::CONNECTION_FAILED,
                "The " + method + " request could not be sent to any relay.")));
        }
    }

    return responseFuture;
};

optional<PendingRequest> RemoteSignerClient::_takePendingRequest(const string& requestId)
{
    lock_guard<mutex> lock(this->_pendingMutex);
    auto it = this->_pendingRequests.find(requestId);
    if (it == this->_pendingRequests.end())
    {
        return nullopt;
    }

    PendingRequest request = move(it->second);
    this->_pendingRequests.erase(it);
    return request;
};

void RemoteSignerClient::_expireRequest(const string& requestId)
{
    auto request = this->_takePendingRequest(requestId);
    if (!request.has_value())
    {
        return;
    }

    PLOG_WARNING << "Remote signer request " << request->method << " " << requestId << " timed out.";
    request->promise->set_exception(make_exception_ptr(RemoteSignerError(
        RemoteSignerErrorCode::TIMEOUT,
        "The " + request->method + " request timed out.")));
};

string RemoteSignerClient::_generateRequestId() const
{
    UUIDv4::UUIDGenerator<std::mt19937_64> uuidGenerator;
    UUIDv4::UUID uuid = uuidGenerator.getUUID();
    return uuid.str();
};

future<string> RemoteSignerClient::_failedFuture(RemoteSignerErrorCode code, const string& message)
{
    promise<string> failed;
    failed.set_exception(make_exception_ptr(RemoteSignerError(code, message)));
    return failed.get_future();
};

#pragma endregion
