#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "nostrcast/service/activity_router.hpp"
#include "test_support.hpp"

using namespace nostrcast::data;
using namespace nostrcast::service;
using namespace std;
using namespace ::testing;

namespace nostrcast_test
{
class ActivityRouterTest : public testing::Test
{
public:
    inline static const string COORDINATE = "30311:F7234BD4C1394DDA46D09F35BD384DD30CC552AD5541990F98844FB06676E9CA:Show";
    inline static const string NORMALIZED = "30311:f7234bd4c1394dda46d09f35bd384dd30cc552ad5541990f98844fb06676e9ca:Show";

    static ActivityMessage chatFor(const string& coordinate, const string& content = "hi")
    {
        ActivityMessage message;
        message.id = "chat-" + content;
        message.senderPubkey = "13f1a0a7b6e7c1d2e3f405162738495a6b7c8d9eafb0c1d2e3f405162738495a";
        message.content = content;
        message.coordinate = coordinate;
        return message;
    };

protected:
    shared_ptr<ManualClock> clock;
    shared_ptr<ManualScheduler> scheduler;
    shared_ptr<NiceMock<MockConnectionPool>> mockPool;
    shared_ptr<ActivityRouter> router;
    int subscriptionCount = 0;

    void SetUp() override
    {
        clock = make_shared<ManualClock>();
        scheduler = make_shared<ManualScheduler>(clock);
        mockPool = make_shared<NiceMock<MockConnectionPool>>();
        ON_CALL(*mockPool, subscribe(_, _, _))
            .WillByDefault(Invoke([this](const Filters&, const string&, SubscriptionOptions)
            {
                return "sub-" + to_string(++subscriptionCount);
            }));

        router = make_shared<ActivityRouter>(clock, scheduler, mockPool);
    };
};

TEST_F(ActivityRouterTest, Subscribe_IssuesFilter_ForNormalizedCoordinate)
{
    EXPECT_CALL(*mockPool, subscribe(_, "activity " + NORMALIZED, _))
        .WillOnce(Invoke([](const Filters& filters, const string&, SubscriptionOptions options)
        {
            EXPECT_EQ(filters.kinds, vector<int>({ kind::LIVE_CHAT, kind::ZAP_RECEIPT }));
            EXPECT_EQ(filters.tags.at("a"), vector<string>({ NORMALIZED }));
            EXPECT_EQ(filters.limit, 50);
            EXPECT_EQ(options.policy, ResubscribePolicy::EXTERNAL);
            return string("activity-subscription");
        }));

    auto handle = router->subscribe(COORDINATE, [](const ActivityMessage&) {});

    ASSERT_TRUE(handle.isActive());
    ASSERT_EQ(handle.coordinate(), NORMALIZED);
    ASSERT_EQ(router->subscriptionIdFor(COORDINATE), "activity-subscription");
};

TEST_F(ActivityRouterTest, Route_Matches_CoordinatesRegardlessOfPubkeyCase)
{
    vector<string> delivered;
    auto handle = router->subscribe(COORDINATE, [&delivered](const ActivityMessage& message)
    {
        delivered.push_back(message.content);
    });

    ASSERT_TRUE(router->route(chatFor(NORMALIZED, "lower")));
    ASSERT_TRUE(router->route(chatFor(COORDINATE, "upper")));

    ASSERT_EQ(delivered, vector<string>({ "lower", "upper" }));
};

TEST_F(ActivityRouterTest, Route_Drops_UnmatchedMessages)
{
    int deliveredCount = 0;
    auto handle = router->subscribe(COORDINATE, [&deliveredCount](const ActivityMessage&) { deliveredCount++; });

    ActivityMessage withoutCoordinate = chatFor(COORDINATE);
    withoutCoordinate.coordinate.reset();

    ASSERT_FALSE(router->route(chatFor("30311:" + string(64, 'a') + ":other")));
    ASSERT_FALSE(router->route(chatFor("30311:F7234BD4C1394DDA46D09F35BD384DD30CC552AD5541990F98844FB06676E9CA:show")));
    ASSERT_FALSE(router->route(withoutCoordinate));
    ASSERT_EQ(deliveredCount, 0);
};

TEST_F(ActivityRouterTest, Subscribe_Replaces_PriorRegistration)
{
    int firstCount = 0;
    int secondCount = 0;

    EXPECT_CALL(*mockPool, unsubscribe(_)).Times(AnyNumber());
    EXPECT_CALL(*mockPool, unsubscribe("sub-1")).Times(1);

    auto first = router->subscribe(COORDINATE, [&firstCount](const ActivityMessage&) { firstCount++; });
    auto second = router->subscribe(NORMALIZED, [&secondCount](const ActivityMessage&) { secondCount++; });

    ASSERT_TRUE(router->route(chatFor(COORDINATE)));

    ASSERT_EQ(firstCount, 0);
    ASSERT_EQ(secondCount, 1);
    ASSERT_EQ(router->activeSubscriptionCount(), 1);
    ASSERT_EQ(router->subscriptionIdFor(COORDINATE), "sub-2");
};

TEST_F(ActivityRouterTest, StaleHandle_Cancel_LeavesNewerRegistration)
{
    int secondCount = 0;
    auto first = router->subscribe(COORDINATE, [](const ActivityMessage&) {});
    auto second = router->subscribe(COORDINATE, [&secondCount](const ActivityMessage&) { secondCount++; });

    EXPECT_CALL(*mockPool, unsubscribe(_)).Times(0);
    first.cancel();
    Mock::VerifyAndClearExpectations(mockPool.get());

    ASSERT_FALSE(first.isActive());
    ASSERT_TRUE(second.isActive());
    ASSERT_EQ(router->activeSubscriptionCount(), 1);
    ASSERT_TRUE(router->route(chatFor(COORDINATE)));
    ASSERT_EQ(secondCount, 1);
};

TEST_F(ActivityRouterTest, Cancel_IsIdempotent)
{
    auto handle = router->subscribe(COORDINATE, [](const ActivityMessage&) {});

    EXPECT_CALL(*mockPool, unsubscribe("sub-1")).Times(1);
    handle.cancel();
    handle.cancel();

    ASSERT_FALSE(handle.isActive());
    ASSERT_EQ(router->activeSubscriptionCount(), 0);
    ASSERT_FALSE(router->route(chatFor(COORDINATE)));
};

TEST_F(ActivityRouterTest, HandleDestructor_CancelsRegistration)
{
    EXPECT_CALL(*mockPool, unsubscribe("sub-1")).Times(1);

    {
        auto handle = router->subscribe(COORDINATE, [](const ActivityMessage&) {});
        ASSERT_EQ(router->activeSubscriptionCount(), 1);
    }

    ASSERT_EQ(router->activeSubscriptionCount(), 0);
};

TEST_F(ActivityRouterTest, MovedHandle_OwnsRegistration)
{
    auto original = router->subscribe(COORDINATE, [](const ActivityMessage&) {});
    ActivitySubscription moved = move(original);

    ASSERT_FALSE(original.isActive());
    ASSERT_TRUE(moved.isActive());

    original.cancel();
    ASSERT_EQ(router->activeSubscriptionCount(), 1);

    moved.cancel();
    ASSERT_EQ(router->activeSubscriptionCount(), 0);
};

TEST_F(ActivityRouterTest, Handle_OutlivesRouter)
{
    auto handle = router->subscribe(COORDINATE, [](const ActivityMessage&) {});

    router.reset();

    ASSERT_NO_THROW(handle.cancel());
    ASSERT_FALSE(handle.isActive());
};

TEST_F(ActivityRouterTest, HandlerExceptions_AreContained)
{
    auto handle = router->subscribe(COORDINATE, [](const ActivityMessage&)
    {
        throw runtime_error("handler failure");
    });

    ASSERT_TRUE(router->route(chatFor(COORDINATE)));
};

TEST_F(ActivityRouterTest, Reissue_ReplacesDroppedSubscription)
{
    auto handle = router->subscribe(COORDINATE, [](const ActivityMessage&) {});

    EXPECT_CALL(*mockPool, unsubscribe(_)).Times(0);

    ASSERT_TRUE(router->reissue("sub-1"));
    ASSERT_EQ(router->subscriptionIdFor(COORDINATE), "sub-2");
    ASSERT_FALSE(router->reissue("sub-1"));
    ASSERT_FALSE(router->reissue("unknown"));

    Mock::VerifyAndClearExpectations(mockPool.get());
};

TEST_F(ActivityRouterTest, Heartbeat_ReissuesSubscriptions_AfterSilence)
{
    auto handle = router->subscribe(COORDINATE, [](const ActivityMessage&) {});
    router->startHeartbeat();

    scheduler->advance(chrono::seconds(15));
    ASSERT_TRUE(router->isHealthy());

    scheduler->advance(chrono::seconds(5));
    ASSERT_FALSE(router->isHealthy());
    ASSERT_EQ(router->reconnectDelay(), chrono::seconds(1));

    EXPECT_CALL(*mockPool, unsubscribe("sub-1")).Times(1);
    scheduler->advance(chrono::seconds(1));

    ASSERT_EQ(router->subscriptionIdFor(COORDINATE), "sub-2");
    ASSERT_EQ(router->reconnectDelay(), chrono::seconds(2));

    EXPECT_CALL(*mockPool, unsubscribe("sub-2")).Times(1);
    scheduler->advance(chrono::seconds(2));

    ASSERT_EQ(router->subscriptionIdFor(COORDINATE), "sub-3");
    ASSERT_EQ(router->reconnectDelay(), chrono::seconds(4));

    ASSERT_TRUE(router->route(chatFor(COORDINATE)));
    ASSERT_TRUE(router->isHealthy());
    ASSERT_EQ(router->reconnectDelay(), chrono::seconds(1));

    Mock::VerifyAndClearExpectations(mockPool.get());
    router->stopHeartbeat();
};

TEST_F(ActivityRouterTest, Heartbeat_IgnoresSilence_WithoutSubscriptions)
{
    router->startHeartbeat();

    scheduler->advance(chrono::minutes(1));

    ASSERT_TRUE(router->isHealthy());
    router->stopHeartbeat();
};

TEST_F(ActivityRouterTest, Cancel_WaitsForDeliveryInProgress)
{
    promise<void> entered;
    promise<void> release;
    shared_future<void> released = release.get_future().share();
    auto handle = router->subscribe(COORDINATE, [&entered, released](const ActivityMessage&)
    {
        entered.set_value();
        released.wait();
    });

    thread routing([this]() { router->route(chatFor(COORDINATE)); });
    entered.get_future().wait();

    atomic<bool> cancelReturned(false);
    thread cancelling([&handle, &cancelReturned]()
    {
        handle.cancel();
        cancelReturned = true;
    });

    this_thread::sleep_for(chrono::milliseconds(50));
    EXPECT_FALSE(cancelReturned);

    release.set_value();
    cancelling.join();
    routing.join();

    ASSERT_TRUE(cancelReturned);
    ASSERT_FALSE(router->route(chatFor(COORDINATE)));
};

TEST_F(ActivityRouterTest, Cancel_StopsDelivery_WhileRoutingConcurrently)
{
    atomic<bool> cancelled(false);
    atomic<int> deliveredCount(0);
    atomic<int> deliveredAfterCancel(0);
    auto handle = router->subscribe(COORDINATE, [&](const ActivityMessage&)
    {
        if (cancelled)
        {
            deliveredAfterCancel++;
        }
        deliveredCount++;
        this_thread::sleep_for(chrono::microseconds(100));
    });

    atomic<bool> stopRouting(false);
    vector<thread> routers;
    for (int i = 0; i < 4; i++)
    {
        routers.emplace_back([this, &stopRouting]()
        {
            while (!stopRouting)
            {
                router->route(chatFor(COORDINATE));
            }
        });
    }

    while (deliveredCount < 20)
    {
        this_thread::sleep_for(chrono::milliseconds(1));
    }

    handle.cancel();
    cancelled = true;

    this_thread::sleep_for(chrono::milliseconds(20));
    stopRouting = true;
    for (auto& routing : routers)
    {
        routing.join();
    }

    ASSERT_EQ(deliveredAfterCancel, 0);
    ASSERT_EQ(router->activeSubscriptionCount(), 0);
};

TEST_F(ActivityRouterTest, Cancel_FromInsideHandler_StopsFurtherDelivery)
{
    int deliveredCount = 0;
    ActivitySubscription handle;
    handle = router->subscribe(COORDINATE, [&handle, &deliveredCount](const ActivityMessage&)
    {
        deliveredCount++;
        handle.cancel();
    });

    ASSERT_TRUE(router->route(chatFor(COORDINATE, "first")));
    ASSERT_FALSE(router->route(chatFor(COORDINATE, "second")));

    ASSERT_EQ(deliveredCount, 1);
    ASSERT_FALSE(handle.isActive());
    ASSERT_EQ(router->activeSubscriptionCount(), 0);
};

TEST_F(ActivityRouterTest, Reconnect_Stops_WhenAllSubscriptionsAreCancelled)
{
    auto handle = router->subscribe(COORDINATE, [](const ActivityMessage&) {});

    clock->advance(chrono::seconds(16));
    router->checkHealth();
    ASSERT_FALSE(router->isHealthy());
    ASSERT_EQ(scheduler->pendingCount(), 1);

    handle.cancel();

    EXPECT_CALL(*mockPool, subscribe(_, _, _)).Times(0);
    scheduler->advance(chrono::seconds(1));
    Mock::VerifyAndClearExpectations(mockPool.get());

    ASSERT_TRUE(router->isHealthy());
    ASSERT_EQ(router->reconnectDelay(), chrono::seconds(1));
    ASSERT_EQ(scheduler->pendingCount(), 0);
};
} // namespace nostrcast_test
