#include <chrono>
#include <condition_variable>
#include <deque>
#include <future>
#include <mutex>
#include <thread>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Formatters/TxtFormatter.h>

#include "nostrcast/signer/connection_uri.hpp"
#include "nostrcast/signer/remote_signer_client.hpp"
#include "test_support.hpp"

using namespace nostrcast::data;
using namespace nostrcast::service;
using namespace nostrcast::signer;
using namespace std;
using namespace ::testing;

using nlohmann::json;

namespace nostrcast_test
{
class RemoteSignerClientTest : public testing::Test
{
public:
    inline static const string SIGNER = "5be6446aa8a31c11b3b453bf8dafc9b346ff328d1fa11a0fa02a1e6461f6a9b1";
    inline static const string USER = "f7234bd4c1394dda46d09f35bd384dd30cc552ad5541990f98844fb06676e9ca";
    inline static const string RELAY = "wss://relay.nsec.app";

    static string bunkerUri(const string& secret = "s3cret")
    {
        return "bunker://" + SIGNER + "?relay=wss%3A%2F%2Frelay.nsec.app&secret=" + secret;
    };

    /**
     * @brief Reads the JSON-RPC payload of a request published by the client.
     */
    static json requestOf(shared_ptr<Event> event)
    {
        return json::parse(event->content.substr(string("fake:").length()));
    };

    /**
     * @brief Builds a kind 24133 reply addressed to the client.
     */
    static shared_ptr<Event> reply(json payload, const string& sender = SIGNER)
    {
        auto event = make_shared<Event>();
        event->id = "reply-" + payload.value("id", string());
        event->pubkey = sender;
        event->kind = kind::REMOTE_SIGNING;
        event->tags = { { "p", FakeLocalSigner::PUBKEY } };
        event->content = "fake:" + payload.dump();
        event->createdAt = 1700000000;
        return event;
    };

    static shared_ptr<Event> resultFor(const json& request, const string& result, const string& sender = SIGNER)
    {
        return reply({ { "id", request.at("id") }, { "result", result } }, sender);
    };

    template <typename T>
    static RemoteSignerErrorCode errorCodeOf(future<T>& pending)
    {
        try
        {
            pending.get();
        }
        catch (const RemoteSignerError& e)
        {
            return e.code();
        }
        throw runtime_error("The future resolved without a remote signer error.");
    };

protected:
    shared_ptr<plog::ConsoleAppender<plog::TxtFormatter>> testAppender;
    shared_ptr<NiceMock<MockConnectionPool>> mockPool;
    shared_ptr<FakeLocalSigner> localSigner;
    shared_ptr<ManualClock> clock;
    shared_ptr<ManualScheduler> scheduler;
    unique_ptr<RemoteSignerClient> client;

    mutex publishMutex;
    condition_variable publishCondition;
    deque<shared_ptr<Event>> published;

    mutex stateMutex;
    vector<ConnectionStatus> observedStates;

    void SetUp() override
    {
        testAppender = make_shared<plog::ConsoleAppender<plog::TxtFormatter>>();
        mockPool = make_shared<NiceMock<MockConnectionPool>>();
        localSigner = make_shared<FakeLocalSigner>();
        clock = make_shared<ManualClock>();
        scheduler = make_shared<ManualScheduler>(clock);

        ON_CALL(*mockPool, openRelayConnections(_))
            .WillByDefault(Invoke([](vector<string> relays) { return relays; }));
        ON_CALL(*mockPool, subscribe(_, _, _)).WillByDefault(Return("signer-subscription"));
        ON_CALL(*mockPool, publishEvent(_))
            .WillByDefault(Invoke([this](shared_ptr<Event> event)
            {
                {
                    lock_guard<mutex> lock(publishMutex);
                    published.push_back(event);
                }
                publishCondition.notify_all();
                return make_tuple(vector<string>({ RELAY }), vector<string>());
            }));

        client = make_unique<RemoteSignerClient>(testAppender, mockPool, localSigner, clock, scheduler);
        client->onStateChange([this](const ConnectionState& state)
        {
            lock_guard<mutex> lock(stateMutex);
            observedStates.push_back(state.status);
        });
    };

    void TearDown() override
    {
        client.reset();
    };

    shared_ptr<Event> nextPublished()
    {
        unique_lock<mutex> lock(publishMutex);
        bool arrived = publishCondition.wait_for(lock, chrono::seconds(5), [this]() { return !published.empty(); });
        if (!arrived)
        {
            return nullptr;
        }
        auto event = published.front();
        published.pop_front();
        return event;
    };

    bool waitUntil(function<bool()> condition)
    {
        auto deadline = chrono::steady_clock::now() + chrono::seconds(5);
        while (chrono::steady_clock::now() < deadline)
        {
            if (condition())
            {
                return true;
            }
            this_thread::sleep_for(chrono::milliseconds(5));
        }
        return condition();
    };

    vector<ConnectionStatus> statesSeen()
    {
        lock_guard<mutex> lock(stateMutex);
        return observedStates;
    };

    /**
     * @brief Runs the direct handshake to completion.
     */
    void connectDirectly()
    {
        auto connected = client->connect(bunkerUri());

        auto connectRequest = nextPublished();
        ASSERT_NE(connectRequest, nullptr);
        client->handleRpcEvent(resultFor(requestOf(connectRequest), "ack"));

        auto keyRequest = nextPublished();
        ASSERT_NE(keyRequest, nullptr);
        client->handleRpcEvent(resultFor(requestOf(keyRequest), USER));

        ASSERT_EQ(connected.wait_for(chrono::seconds(5)), future_status::ready);
        ASSERT_EQ(connected.get(), USER);
    };
};

#pragma region Connection URIs

TEST(ConnectionUriTest, Parse_ReadsBunkerUri)
{
    auto uri = ConnectionUri::parse(
        "bunker://5BE6446AA8A31C11B3B453BF8DAFC9B346FF328D1FA11A0FA02A1E6461F6A9B1"
        "?relay=wss%3A%2F%2Frelay.nsec.app&relay=wss://nos.lol&relay=wss%3A%2F%2Frelay.nsec.app"
        "&secret=abc123&name=My%20Client");

    ASSERT_EQ(uri.scheme, ConnectionUri::Scheme::BUNKER);
    ASSERT_EQ(uri.pubkey, RemoteSignerClientTest::SIGNER);
    ASSERT_EQ(uri.relays, vector<string>({ "wss://relay.nsec.app", "wss://nos.lol" }));
    ASSERT_EQ(uri.secret.value(), "abc123");
    ASSERT_EQ(uri.metadata.at("name"), "My Client");
};

TEST(ConnectionUriTest, Parse_Rejects_MalformedUris)
{
    vector<string> malformed = {
        "https://relay.nsec.app",
        "bunker://not-a-pubkey?relay=wss://nos.lol",
        "bunker://" + RemoteSignerClientTest::SIGNER,
        "nostrconnect://" + RemoteSignerClientTest::SIGNER + "?secret=abc"
    };

    for (const string& uri : malformed)
    {
        try
        {
            ConnectionUri::parse(uri);
            FAIL() << "Parsed malformed URI " << uri;
        }
        catch (const RemoteSignerError& e)
        {
            ASSERT_EQ(e.code(), RemoteSignerErrorCode::INVALID_URI);
        }
    }
};

TEST(ConnectionUriTest, ToString_EncodesQueryValues)
{
    ConnectionUri uri;
    uri.scheme = ConnectionUri::Scheme::NOSTR_CONNECT;
    uri.pubkey = RemoteSignerClientTest::SIGNER;
    uri.relays = { "wss://relay.nsec.app" };
    uri.secret = "abc";
    uri.metadata = { { "name", "My Client" } };

    string text = uri.toString();

    ASSERT_EQ(
        text,
        "nostrconnect://" + RemoteSignerClientTest::SIGNER
            + "?relay=wss%3A%2F%2Frelay.nsec.app&secret=abc&name=My%20Client");

    auto reparsed = ConnectionUri::parse(text);
    ASSERT_EQ(reparsed.relays, uri.relays);
    ASSERT_EQ(reparsed.metadata, uri.metadata);
};

#pragma endregion

#pragma region Direct Flow

TEST_F(RemoteSignerClientTest, Connect_CompletesHandshake_WithBunkerUri)
{
    auto connected = client->connect(bunkerUri());

    auto connectRequest = nextPublished();
    ASSERT_NE(connectRequest, nullptr);
    ASSERT_EQ(connectRequest->kind, kind::REMOTE_SIGNING);
    ASSERT_EQ(connectRequest->pubkey, FakeLocalSigner::PUBKEY);
    ASSERT_EQ(connectRequest->tagValue("p").value(), SIGNER);

    json connectPayload = requestOf(connectRequest);
    ASSERT_EQ(connectPayload.at("method"), "connect");
    ASSERT_EQ(connectPayload.at("params"), json::array({ SIGNER, "s3cret" }));
    ASSERT_EQ(client->state().status, ConnectionStatus::WAITING_FOR_APPROVAL);

    client->handleRpcEvent(resultFor(connectPayload, "s3cret"));

    auto keyRequest = nextPublished();
    ASSERT_NE(keyRequest, nullptr);
    ASSERT_EQ(requestOf(keyRequest).at("method"), "get_public_key");

    string upperUser = "F7234BD4C1394DDA46D09F35BD384DD30CC552AD5541990F98844FB06676E9CA";
    client->handleRpcEvent(resultFor(requestOf(keyRequest), upperUser));

    ASSERT_EQ(connected.wait_for(chrono::seconds(5)), future_status::ready);
    ASSERT_EQ(connected.get(), USER);

    auto state = client->state();
    ASSERT_EQ(state.status, ConnectionStatus::CONNECTED);
    ASSERT_EQ(state.remoteIdentity, USER);
    ASSERT_EQ(
        statesSeen(),
        vector<ConnectionStatus>({
            ConnectionStatus::CONNECTING,
            ConnectionStatus::WAITING_FOR_APPROVAL,
            ConnectionStatus::CONNECTED }));
    ASSERT_EQ(client->pendingRequestCount(), 0);
};

TEST_F(RemoteSignerClientTest, Connect_Subscribes_ForRepliesToLocalKey)
{
    EXPECT_CALL(*mockPool, subscribe(_, "remote signer", _))
        .WillOnce(Invoke([](const Filters& filters, const string&, SubscriptionOptions)
        {
            EXPECT_EQ(filters.kinds, vector<int>({ kind::REMOTE_SIGNING }));
            EXPECT_EQ(filters.tags.at("p"), vector<string>({ FakeLocalSigner::PUBKEY }));
            EXPECT_GT(filters.since, 0);
            return string("signer-subscription");
        }));

    connectDirectly();
};

TEST_F(RemoteSignerClientTest, Connect_Fails_WithInvalidUri)
{
    auto wrongScheme = client->connect("https://relay.nsec.app");
    auto reverseUri = client->connect("nostrconnect://" + SIGNER + "?relay=wss://nos.lol");

    ASSERT_EQ(errorCodeOf(wrongScheme), RemoteSignerErrorCode::INVALID_URI);
    ASSERT_EQ(errorCodeOf(reverseUri), RemoteSignerErrorCode::INVALID_URI);
    ASSERT_EQ(client->state().status, ConnectionStatus::DISCONNECTED);
};

TEST_F(RemoteSignerClientTest, Connect_Fails_WhenNoRelayOpens)
{
    ON_CALL(*mockPool, openRelayConnections(_)).WillByDefault(Return(vector<string>()));

    auto connected = client->connect(bunkerUri());

    ASSERT_EQ(errorCodeOf(connected), RemoteSignerErrorCode::CONNECTION_FAILED);
    ASSERT_EQ(client->state().status, ConnectionStatus::ERROR);
};

TEST_F(RemoteSignerClientTest, Connect_Fails_WhenSecretIsNotEchoed)
{
    auto connected = client->connect(bunkerUri());

    auto connectRequest = nextPublished();
    ASSERT_NE(connectRequest, nullptr);
    client->handleRpcEvent(resultFor(requestOf(connectRequest), "wrong-secret"));

    ASSERT_EQ(errorCodeOf(connected), RemoteSignerErrorCode::AUTHENTICATION_FAILED);
    ASSERT_EQ(client->state().status, ConnectionStatus::ERROR);
};

TEST_F(RemoteSignerClientTest, Connect_Fails_WhileSessionIsActive)
{
    connectDirectly();

    auto second = client->connect(bunkerUri());

    ASSERT_EQ(errorCodeOf(second), RemoteSignerErrorCode::CONNECTION_FAILED);
    ASSERT_EQ(client->state().status, ConnectionStatus::CONNECTED);
};

#pragma endregion

#pragma region Reverse Flow

TEST_F(RemoteSignerClientTest, CreateNostrConnectUri_NamesLocalKey_AndFreshSecret)
{
    string first = client->createNostrConnectUri({ RELAY }, { { "name", "nostrcast" } });
    string second = client->createNostrConnectUri({ RELAY });

    auto uri = ConnectionUri::parse(first);
    ASSERT_EQ(uri.scheme, ConnectionUri::Scheme::NOSTR_CONNECT);
    ASSERT_EQ(uri.pubkey, FakeLocalSigner::PUBKEY);
    ASSERT_EQ(uri.relays, vector<string>({ RELAY }));
    ASSERT_EQ(uri.secret.value().length(), 32);
    ASSERT_EQ(uri.metadata.at("name"), "nostrcast");
    ASSERT_NE(ConnectionUri::parse(second).secret.value(), uri.secret.value());
};

TEST_F(RemoteSignerClientTest, WaitForSignerConnection_CompletesHandshake)
{
    string uri = client->createNostrConnectUri({ RELAY });
    string secret = ConnectionUri::parse(uri).secret.value();

    auto connected = client->waitForSignerConnection(uri);
    ASSERT_TRUE(waitUntil([this]() { return client->state().status == ConnectionStatus::WAITING_FOR_SCAN; }));

    client->handleRpcEvent(reply({ { "id", "hello" }, { "result", secret } }));

    auto keyRequest = nextPublished();
    ASSERT_NE(keyRequest, nullptr);
    ASSERT_EQ(keyRequest->tagValue("p").value(), SIGNER);
    ASSERT_EQ(requestOf(keyRequest).at("method"), "get_public_key");
    client->handleRpcEvent(resultFor(requestOf(keyRequest), USER));

    ASSERT_EQ(connected.wait_for(chrono::seconds(5)), future_status::ready);
    ASSERT_EQ(connected.get(), USER);
    ASSERT_EQ(
        statesSeen(),
        vector<ConnectionStatus>({
            ConnectionStatus::CONNECTING,
            ConnectionStatus::WAITING_FOR_SCAN,
            ConnectionStatus::WAITING_FOR_APPROVAL,
            ConnectionStatus::CONNECTED }));
};

TEST_F(RemoteSignerClientTest, WaitForSignerConnection_Fails_OnSecretMismatch)
{
    string uri = client->createNostrConnectUri({ RELAY });

    auto connected = client->waitForSignerConnection(uri);
    ASSERT_TRUE(waitUntil([this]() { return client->state().status == ConnectionStatus::WAITING_FOR_SCAN; }));

    client->handleRpcEvent(reply({ { "id", "hello" }, { "result", "not-the-secret" } }));

    ASSERT_EQ(errorCodeOf(connected), RemoteSignerErrorCode::AUTHENTICATION_FAILED);
    ASSERT_EQ(client->state().status, ConnectionStatus::ERROR);

    auto states = statesSeen();
    ASSERT_EQ(find(states.begin(), states.end(), ConnectionStatus::CONNECTED), states.end());
};

TEST_F(RemoteSignerClientTest, WaitForSignerConnection_TimesOut_WithoutSigner)
{
    string uri = client->createNostrConnectUri({ RELAY });

    auto connected = client->waitForSignerConnection(uri);
    ASSERT_TRUE(waitUntil([this]() { return scheduler->pendingCount() == 1; }));
    ASSERT_EQ(scheduler->nextDelay(), chrono::seconds(180));

    scheduler->advance(chrono::seconds(180));

    ASSERT_EQ(errorCodeOf(connected), RemoteSignerErrorCode::TIMEOUT);
    ASSERT_EQ(client->state().status, ConnectionStatus::ERROR);
};

TEST_F(RemoteSignerClientTest, WaitForSignerConnection_Rejects_UriForAnotherKey)
{
    auto connected = client->waitForSignerConnection("nostrconnect://" + SIGNER + "?relay=wss://nos.lol");

    ASSERT_EQ(errorCodeOf(connected), RemoteSignerErrorCode::INVALID_URI);
};

#pragma endregion

#pragma region Requests

TEST_F(RemoteSignerClientTest, SendRequest_Fails_WhenNotConnected)
{
    auto pong = client->ping();

    ASSERT_EQ(errorCodeOf(pong), RemoteSignerErrorCode::NOT_CONNECTED);
};

TEST_F(RemoteSignerClientTest, Ping_ResolvesWithResult)
{
    connectDirectly();

    auto pong = client->ping();
    auto request = nextPublished();
    ASSERT_NE(request, nullptr);
    ASSERT_EQ(requestOf(request).at("method"), "ping");
    ASSERT_TRUE(client->hasPendingRequest(requestOf(request).at("id")));

    client->handleRpcEvent(resultFor(requestOf(request), "pong"));

    ASSERT_EQ(pong.get(), "pong");
    ASSERT_EQ(client->pendingRequestCount(), 0);
};

TEST_F(RemoteSignerClientTest, Ping_TimesOut_AndForgetsRequest)
{
    connectDirectly();

    auto pong = client->ping();
    auto request = nextPublished();
    ASSERT_NE(request, nullptr);
    ASSERT_EQ(client->pendingRequestCount(), 1);

    scheduler->advance(chrono::seconds(30));

    ASSERT_EQ(errorCodeOf(pong), RemoteSignerErrorCode::TIMEOUT);
    ASSERT_EQ(client->pendingRequestCount(), 0);

    // A late reply finds nothing to resolve.
    client->handleRpcEvent(resultFor(requestOf(request), "pong"));
    ASSERT_EQ(client->state().status, ConnectionStatus::CONNECTED);
};

TEST_F(RemoteSignerClientTest, ResponseAndTimeout_ResolveRequestExactlyOnce)
{
    connectDirectly();

    for (int i = 0; i < 50; i++)
    {
        auto pong = client->ping();
        auto request = nextPublished();
        ASSERT_NE(request, nullptr);
        auto response = resultFor(requestOf(request), "pong");

        thread responder([this, response]() { client->handleRpcEvent(response); });
        thread expirer([this]() { scheduler->advance(chrono::seconds(30)); });
        responder.join();
        expirer.join();

        ASSERT_EQ(pong.wait_for(chrono::seconds(0)), future_status::ready);
        try
        {
            ASSERT_EQ(pong.get(), "pong");
        }
        catch (const RemoteSignerError& e)
        {
            ASSERT_EQ(e.code(), RemoteSignerErrorCode::TIMEOUT);
        }
        ASSERT_EQ(client->pendingRequestCount(), 0);
    }
};

TEST_F(RemoteSignerClientTest, RemoteError_FailsRequest)
{
    connectDirectly();

    auto pong = client->ping();
    auto request = nextPublished();
    ASSERT_NE(request, nullptr);
    client->handleRpcEvent(reply({ { "id", requestOf(request).at("id") }, { "error", "permission denied" } }));

    try
    {
        pong.get();
        FAIL() << "Expected a remote error.";
    }
    catch (const RemoteSignerError& e)
    {
        ASSERT_EQ(e.code(), RemoteSignerErrorCode::REMOTE_ERROR);
        ASSERT_STREQ(e.what(), "permission denied");
    }
};

TEST_F(RemoteSignerClientTest, HandleRpcEvent_Ignores_MessagesFromOtherSenders)
{
    connectDirectly();

    auto pong = client->ping();
    auto request = nextPublished();
    ASSERT_NE(request, nullptr);

    client->handleRpcEvent(resultFor(requestOf(request), "forged", USER));
    ASSERT_EQ(pong.wait_for(chrono::seconds(0)), future_status::timeout);

    auto undecryptable = resultFor(requestOf(request), "garbled");
    undecryptable->content = "garbled";
    client->handleRpcEvent(undecryptable);
    ASSERT_EQ(pong.wait_for(chrono::seconds(0)), future_status::timeout);

    client->handleRpcEvent(resultFor(requestOf(request), "pong"));
    ASSERT_EQ(pong.get(), "pong");
};

TEST_F(RemoteSignerClientTest, SignEvent_ReturnsEventSignedByRemote)
{
    connectDirectly();

    Event unsignedEvent;
    unsignedEvent.kind = 1;
    unsignedEvent.content = "Hello, World!";
    unsignedEvent.createdAt = 1700000100;

    auto signedFuture = client->signEvent(unsignedEvent);
    auto request = nextPublished();
    ASSERT_NE(request, nullptr);

    json payload = requestOf(request);
    ASSERT_EQ(payload.at("method"), "sign_event");
    json template_ = json::parse(payload.at("params").at(0).get<string>());
    ASSERT_EQ(template_.at("pubkey"), USER);
    ASSERT_EQ(template_.at("kind"), 1);
    ASSERT_EQ(template_.at("created_at"), 1700000100);

    json signedEvent = template_;
    signedEvent["id"] = "5c83da77af1dec6d7289834998ad7aafbd9e2191396d75ec3cc27f5a77226f36";
    signedEvent["sig"] = string(128, 'b');
    client->handleRpcEvent(resultFor(payload, signedEvent.dump()));

    Event result = signedFuture.get();
    ASSERT_EQ(result.id, "5c83da77af1dec6d7289834998ad7aafbd9e2191396d75ec3cc27f5a77226f36");
    ASSERT_EQ(result.pubkey, USER);
    ASSERT_EQ(result.content, "Hello, World!");
};

TEST_F(RemoteSignerClientTest, SignEvent_Fails_OnUnreadableResult)
{
    connectDirectly();

    Event unsignedEvent;
    unsignedEvent.kind = 1;
    unsignedEvent.content = "Hello, World!";

    auto signedFuture = client->signEvent(unsignedEvent);
    auto request = nextPublished();
    ASSERT_NE(request, nullptr);
    client->handleRpcEvent(resultFor(requestOf(request), "not an event"));

    ASSERT_EQ(errorCodeOf(signedFuture), RemoteSignerErrorCode::INVALID_RESPONSE);
};

TEST_F(RemoteSignerClientTest, SendRequest_Fails_WhenEncryptionFails)
{
    connectDirectly();
    localSigner->failEncryption = true;

    auto pong = client->ping();

    ASSERT_EQ(errorCodeOf(pong), RemoteSignerErrorCode::ENCRYPTION_FAILED);
    ASSERT_EQ(client->pendingRequestCount(), 0);
};

TEST_F(RemoteSignerClientTest, SendRequest_Fails_WhenNoRelayAcceptsIt)
{
    connectDirectly();
    ON_CALL(*mockPool, publishEvent(_))
        .WillByDefault(Return(make_tuple(vector<string>(), vector<string>({ RELAY }))));

    auto pong = client->ping();

    ASSERT_EQ(errorCodeOf(pong), RemoteSignerErrorCode::CONNECTION_FAILED);
    ASSERT_EQ(client->pendingRequestCount(), 0);
};

TEST_F(RemoteSignerClientTest, Disconnect_FailsPendingRequests)
{
    connectDirectly();

    auto pong = client->ping();
    ASSERT_NE(nextPublished(), nullptr);

    EXPECT_CALL(*mockPool, unsubscribe("signer-subscription")).Times(1);
    client->disconnect();

    ASSERT_EQ(errorCodeOf(pong), RemoteSignerErrorCode::NOT_CONNECTED);
    ASSERT_EQ(client->pendingRequestCount(), 0);
    ASSERT_EQ(client->state().status, ConnectionStatus::DISCONNECTED);
    ASSERT_EQ(statesSeen().back(), ConnectionStatus::DISCONNECTED);
};

TEST_F(RemoteSignerClientTest, Disconnect_RacingRequest_NeverLeavesItPending)
{
    for (int i = 0; i < 20; i++)
    {
        connectDirectly();
        {
            lock_guard<mutex> lock(publishMutex);
            published.clear();
        }

        future<string> pong;
        thread requester([this, &pong]() { pong = client->ping(); });
        thread disconnector([this]() { client->disconnect(); });
        requester.join();
        disconnector.join();

        ASSERT_EQ(pong.wait_for(chrono::seconds(5)), future_status::ready);
        ASSERT_EQ(errorCodeOf(pong), RemoteSignerErrorCode::NOT_CONNECTED);
        ASSERT_EQ(client->pendingRequestCount(), 0);
        ASSERT_EQ(scheduler->pendingCount(), 0);
    }
};

TEST_F(RemoteSignerClientTest, Disconnect_FailsHandshakeInProgress)
{
    auto connected = client->connect(bunkerUri());
    ASSERT_NE(nextPublished(), nullptr);

    client->disconnect();

    ASSERT_EQ(errorCodeOf(connected), RemoteSignerErrorCode::NOT_CONNECTED);
    ASSERT_EQ(client->state().status, ConnectionStatus::DISCONNECTED);
};

TEST_F(RemoteSignerClientTest, Connect_Succeeds_AfterDisconnect)
{
    connectDirectly();
    client->disconnect();

    connectDirectly();

    ASSERT_EQ(client->state().status, ConnectionStatus::CONNECTED);
};

#pragma endregion
} // namespace nostrcast_test
