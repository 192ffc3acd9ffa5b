#include <chrono>
#include <future>
#include <mutex>
#include <thread>
#include <unordered_map>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Formatters/TxtFormatter.h>

#include "nostrcast/service/nostr_client.hpp"
#include "test_support.hpp"

using namespace nostrcast::config;
using namespace nostrcast::data;
using namespace nostrcast::service;
using namespace std;
using namespace ::testing;

using nlohmann::json;

namespace nostrcast_test
{
class NostrClientTest : public testing::Test
{
public:
    inline static const vector<string> defaultTestRelays =
    {
        "wss://relay.damus.io",
        "wss://nostr.thesamecat.io"
    };
    inline static const string HOST = "f7234bd4c1394dda46d09f35bd384dd30cc552ad5541990f98844fb06676e9ca";
    inline static const string SENDER = "13f1a0a7b6e7c1d2e3f405162738495a6b7c8d9eafb0c1d2e3f405162738495a";

    static string streamCoordinate()
    {
        return "30311:" + HOST + ":show";
    };

protected:
    shared_ptr<plog::ConsoleAppender<plog::TxtFormatter>> testAppender;
    shared_ptr<NiceMock<MockWebSocketClient>> mockClient;
    shared_ptr<ManualClock> clock;
    shared_ptr<ManualScheduler> poolScheduler;
    shared_ptr<ManualScheduler> scheduler;

    mutex relayMutex;
    unordered_map<string, bool> connectionStatus;
    unordered_map<string, function<void(const string&)>> messageHandlers;

    unique_ptr<NostrClient> client;

    void SetUp() override
    {
        testAppender = make_shared<plog::ConsoleAppender<plog::TxtFormatter>>();
        mockClient = make_shared<NiceMock<MockWebSocketClient>>();
        clock = make_shared<ManualClock>();
        poolScheduler = make_shared<ManualScheduler>(clock);
        scheduler = make_shared<ManualScheduler>();

        ON_CALL(*mockClient, openConnection(_))
            .WillByDefault(Invoke([this](string uri)
            {
                lock_guard<mutex> lock(relayMutex);
                connectionStatus[uri] = true;
            }));
        ON_CALL(*mockClient, isConnected(_))
            .WillByDefault(Invoke([this](string uri)
            {
                lock_guard<mutex> lock(relayMutex);
                return connectionStatus[uri];
            }));
        ON_CALL(*mockClient, closeConnection(_))
            .WillByDefault(Invoke([this](string uri)
            {
                lock_guard<mutex> lock(relayMutex);
                connectionStatus[uri] = false;
                messageHandlers.erase(uri);
            }));
        ON_CALL(*mockClient, receive(_, _))
            .WillByDefault(Invoke([this](string uri, function<void(const string&)> messageHandler)
            {
                lock_guard<mutex> lock(relayMutex);
                messageHandlers[uri] = messageHandler;
            }));
        ON_CALL(*mockClient, send(_, _))
            .WillByDefault(Invoke([](string message, string uri) { return make_tuple(uri, true); }));

        ClientConfig config;
        config.relays = defaultTestRelays;

        client = make_unique<NostrClient>(
            testAppender,
            config,
            mockClient,
            make_shared<FakeLocalSigner>(),
            make_shared<FakeVerifier>(true),
            clock,
            poolScheduler,
            scheduler);
    };

    void TearDown() override
    {
        client.reset();
    };

    void deliver(const string& relay, const string& message)
    {
        function<void(const string&)> handler;
        {
            lock_guard<mutex> lock(relayMutex);
            auto it = messageHandlers.find(relay);
            ASSERT_NE(it, messageHandlers.end());
            handler = it->second;
        }
        handler(message);
    };

    static string eventMessage(const string& subscriptionId, shared_ptr<Event> event)
    {
        return json::array({ "EVENT", subscriptionId, json(*event) }).dump();
    };

    template <typename Predicate>
    static bool waitUntil(Predicate predicate)
    {
        auto deadline = chrono::steady_clock::now() + chrono::seconds(5);
        while (chrono::steady_clock::now() < deadline)
        {
            if (predicate())
            {
                return true;
            }
            this_thread::sleep_for(chrono::milliseconds(5));
        }
        return predicate();
    };
};

TEST_F(NostrClientTest, Start_ConnectsToConfiguredRelays)
{
    auto connectedRelays = client->start();

    ASSERT_EQ(connectedRelays.size(), defaultTestRelays.size());
    ASSERT_EQ(client->pool().activeRelays().size(), defaultTestRelays.size());
    ASSERT_GT(poolScheduler->pendingCount(), 0);
};

TEST_F(NostrClientTest, Start_IsIdempotent)
{
    EXPECT_CALL(*mockClient, openConnection(_)).Times(static_cast<int>(defaultTestRelays.size()));

    client->start();
    auto connectedRelays = client->start();

    ASSERT_EQ(connectedRelays.size(), defaultTestRelays.size());
};

TEST_F(NostrClientTest, Stop_ClosesRelayConnections)
{
    client->start();

    EXPECT_CALL(*mockClient, closeConnection(_)).Times(static_cast<int>(defaultTestRelays.size()));
    client->stop();

    ASSERT_TRUE(client->pool().activeRelays().empty());
    ASSERT_EQ(poolScheduler->pendingCount(), 0);
};

TEST_F(NostrClientTest, ProfileEvent_FromRelay_IsCached)
{
    client->start();

    Filters filters;
    filters.kinds = { kind::METADATA };
    filters.authors = { SENDER };
    string subscriptionId = client->pool().subscribe(filters, "profiles");

    auto event = makeEvent(kind::METADATA, SENDER, {}, "{\"name\":\"cat\"}");
    deliver(defaultTestRelays[0], eventMessage(subscriptionId, event));

    ASSERT_TRUE(waitUntil([this]() { return client->profileCache().get(SENDER).has_value(); }));
    ASSERT_EQ(client->profileCache().get(SENDER)->profile.name.value(), "cat");
};

TEST_F(NostrClientTest, ChatEvent_FromRelay_ReachesActivitySubscriber)
{
    client->start();

    promise<string> delivered;
    auto deliveredFuture = delivered.get_future();
    auto handle = client->activityRouter().subscribe(streamCoordinate(), [&delivered](const ActivityMessage& message)
    {
        delivered.set_value(message.content);
    });
    string subscriptionId = client->activityRouter().subscriptionIdFor(streamCoordinate());
    ASSERT_FALSE(subscriptionId.empty());

    auto event = makeEvent(kind::LIVE_CHAT, SENDER, { { "a", streamCoordinate() } }, "gm");
    deliver(defaultTestRelays[1], eventMessage(subscriptionId, event));

    ASSERT_EQ(deliveredFuture.wait_for(chrono::seconds(5)), future_status::ready);
    ASSERT_EQ(deliveredFuture.get(), "gm");

    handle.cancel();
};

TEST_F(NostrClientTest, Reconnect_ReissuesActivitySubscription_UnderNewId)
{
    client->start();

    auto handle = client->activityRouter().subscribe(streamCoordinate(), [](const ActivityMessage&) {});
    string originalId = client->activityRouter().subscriptionIdFor(streamCoordinate());

    clock->advance(chrono::seconds(61));
    client->pool().checkHealth();
    poolScheduler->advance(chrono::seconds(1));

    string reissuedId = client->activityRouter().subscriptionIdFor(streamCoordinate());
    ASSERT_FALSE(reissuedId.empty());
    ASSERT_NE(reissuedId, originalId);
    ASSERT_EQ(client->pool().subscriptions().count(originalId), 0);
    ASSERT_EQ(client->pool().subscriptions().count(reissuedId), 1);

    handle.cancel();
};
} // namespace nostrcast_test
