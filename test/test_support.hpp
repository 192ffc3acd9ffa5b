#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "nostrcast/client/web_socket_client.hpp"
#include "nostrcast/cryptography/signature_verifier.hpp"
#include "nostrcast/data/data.hpp"
#include "nostrcast/service/connection_pool.hpp"
#include "nostrcast/signer/signer.hpp"
#include "nostrcast/util/clock.hpp"
#include "nostrcast/util/scheduler.hpp"

namespace nostrcast_test
{
class MockWebSocketClient : public nostrcast::client::IWebSocketClient
{
public:
    MOCK_METHOD(void, start, (), (override));
    MOCK_METHOD(void, stop, (), (override));
    MOCK_METHOD(void, openConnection, (std::string uri), (override));
    MOCK_METHOD(bool, isConnected, (std::string uri), (override));
    MOCK_METHOD((std::tuple<std::string, bool>), send, (std::string message, std::string uri), (override));
    MOCK_METHOD(
        (std::tuple<std::string, bool>),
        send,
        (std::string message, std::string uri, std::function<void(const std::string&)> messageHandler),
        (override));
    MOCK_METHOD(void, receive, (std::string uri, std::function<void(const std::string&)> messageHandler), (override));
    MOCK_METHOD(void, onConnectionLost, (std::function<void(const std::string&)> handler), (override));
    MOCK_METHOD(void, closeConnection, (std::string uri), (override));
};

class MockConnectionPool : public nostrcast::service::IConnectionPool
{
public:
    MOCK_METHOD(std::vector<std::string>, connect, (), (override));
    MOCK_METHOD(void, disconnect, (), (override));
    MOCK_METHOD(std::vector<std::string>, openRelayConnections, (std::vector<std::string> relays), (override));
    MOCK_METHOD(void, closeRelayConnections, (std::vector<std::string> relays), (override));
    MOCK_METHOD(
        std::string,
        subscribe,
        (const nostrcast::data::Filters& filters,
         const std::string& purpose,
         nostrcast::service::SubscriptionOptions options),
        (override));
    MOCK_METHOD(void, unsubscribe, (const std::string& subscriptionId), (override));
    MOCK_METHOD(
        (std::tuple<std::vector<std::string>, std::vector<std::string>>),
        publishEvent,
        (std::shared_ptr<nostrcast::data::Event> event),
        (override));
    MOCK_METHOD(void, setEventHandler, (nostrcast::service::EventHandler handler), (override));
    MOCK_METHOD(void, setEoseHandler, (nostrcast::service::EoseHandler handler), (override));
    MOCK_METHOD(void, setAcceptanceHandler, (nostrcast::service::AcceptanceHandler handler), (override));
    MOCK_METHOD(void, setResubscribeHandler, (nostrcast::service::ResubscribeHandler handler), (override));
};

/**
 * @brief A clock that only moves when told to.
 */
class ManualClock : public nostrcast::util::IClock
{
public:
    explicit ManualClock(std::chrono::system_clock::time_point start = std::chrono::system_clock::from_time_t(1700000000))
    : _now(start)
    {
    };

    std::chrono::system_clock::time_point now() const override
    {
        std::lock_guard<std::mutex> lock(this->_mutex);
        return this->_now;
    };

    void advance(std::chrono::system_clock::duration duration)
    {
        std::lock_guard<std::mutex> lock(this->_mutex);
        this->_now += duration;
    };

private:
    mutable std::mutex _mutex;
    std::chrono::system_clock::time_point _now;
};

/**
 * @brief A scheduler whose tasks run on the calling thread when `advance` passes their due time.
 * @remark When given a clock, `advance` moves the clock forward together with the scheduler.
 */
class ManualScheduler : public nostrcast::util::IScheduler
{
public:
    explicit ManualScheduler(std::shared_ptr<ManualClock> clock = nullptr) : _clock(clock) {};

    TaskId schedule(std::chrono::milliseconds delay, std::function<void()> task) override
    {
        std::lock_guard<std::mutex> lock(this->_mutex);
        TaskId taskId = this->_nextTaskId++;
        this->_tasks[{ this->_elapsed + delay, taskId }] = task;
        return taskId;
    };

    bool cancel(TaskId taskId) override
    {
        std::lock_guard<std::mutex> lock(this->_mutex);
        for (auto it = this->_tasks.begin(); it != this->_tasks.end(); ++it)
        {
            if (it->first.second == taskId)
            {
                this->_tasks.erase(it);
                return true;
            }
        }
        return false;
    };

    /**
     * @brief Moves time forward, running every task that falls due in order.
     */
    void advance(std::chrono::milliseconds duration)
    {
        std::chrono::milliseconds target;
        {
            std::lock_guard<std::mutex> lock(this->_mutex);
            target = this->_elapsed + duration;
        }

        while (true)
        {
            std::function<void()> task;
            {
                std::lock_guard<std::mutex> lock(this->_mutex);
                auto it = this->_tasks.begin();
                if (it == this->_tasks.end() || it->first.first > target)
                {
                    break;
                }
                this->_moveTo(it->first.first);
                task = it->second;
                this->_tasks.erase(it);
            }
            task();
        }

        std::lock_guard<std::mutex> lock(this->_mutex);
        this->_moveTo(target);
    };

    size_t pendingCount()
    {
        std::lock_guard<std::mutex> lock(this->_mutex);
        return this->_tasks.size();
    };

    /**
     * @returns The delay from now until the earliest pending task, or -1 ms if none is pending.
     */
    std::chrono::milliseconds nextDelay()
    {
        std::lock_guard<std::mutex> lock(this->_mutex);
        if (this->_tasks.empty())
        {
            return std::chrono::milliseconds(-1);
        }
        return this->_tasks.begin()->first.first - this->_elapsed;
    };

private:
    std::mutex _mutex;
    std::shared_ptr<ManualClock> _clock;
    std::map<std::pair<std::chrono::milliseconds, TaskId>, std::function<void()>> _tasks;
    std::chrono::milliseconds _elapsed = std::chrono::milliseconds(0);
    TaskId _nextTaskId = 1;

    void _moveTo(std::chrono::milliseconds time)
    {
        if (time <= this->_elapsed)
        {
            return;
        }
        if (this->_clock != nullptr)
        {
            this->_clock->advance(time - this->_elapsed);
        }
        this->_elapsed = time;
    };
};

/**
 * @brief A signature verifier that accepts or rejects every signature.
 */
class FakeVerifier : public nostrcast::cryptography::ISignatureVerifier
{
public:
    explicit FakeVerifier(bool accepts = true) : accepts(accepts) {};

    bool verify(const std::string&, const std::string&, const std::string&) const override
    {
        return this->accepts;
    };

    bool accepts;
};

/**
 * @brief A local signer with a fixed key and a transparent cipher.
 * @remark Ciphertexts are the plaintext behind a `fake:` prefix, so tests can read requests and
 * forge responses.
 */
class FakeLocalSigner : public nostrcast::signer::ILocalSigner
{
public:
    inline static const std::string PUBKEY = "c0ffee00c0ffee00c0ffee00c0ffee00c0ffee00c0ffee00c0ffee00c0ffee00";

    std::string publicKey() const override { return PUBKEY; };

    void sign(std::shared_ptr<nostrcast::data::Event> event) override
    {
        event->pubkey = PUBKEY;
        event->id = event->computeId();
        event->sig = std::string(128, '0');
    };

    std::string encrypt(const std::string& plaintext, const std::string& peerPubkey) override
    {
        if (this->failEncryption)
        {
            return "";
        }
        return "fake:" + plaintext;
    };

    std::string decrypt(const std::string& payload, const std::string& peerPubkey) override
    {
        if (payload.rfind("fake:", 0) != 0)
        {
            return "";
        }
        return payload.substr(5);
    };

    bool failEncryption = false;
};

/**
 * @brief Builds an event with a correct ID and a placeholder signature.
 */
inline std::shared_ptr<nostrcast::data::Event> makeEvent(
    int kind,
    const std::string& pubkey,
    std::vector<std::vector<std::string>> tags,
    const std::string& content,
    std::time_t createdAt = 1700000000)
{
    auto event = std::make_shared<nostrcast::data::Event>();
    event->kind = kind;
    event->pubkey = pubkey;
    event->tags = std::move(tags);
    event->content = content;
    event->createdAt = createdAt;
    event->id = event->computeId();
    event->sig = std::string(128, 'a');
    return event;
};
} // namespace nostrcast_test
