#include <algorithm>

#include <plog/Log.h>

#include "nostrcast/service/profile_cache.hpp"
#include "nostrcast/util/encoding.hpp"

using namespace nostrcast::data;
using namespace nostrcast::service;
using namespace nostrcast::util;
using namespace std;

ProfileCache::ProfileCache(
    shared_ptr<IClock> clock,
    shared_ptr<IScheduler> scheduler,
    shared_ptr<IConnectionPool> pool,
    ProfileCacheConfig config)
: _clock(clock),
  _scheduler(scheduler),
  _pool(pool),
  _config(config),
  _rateLimiter(clock, config.maxRequestsPerWindow, config.rateWindow)
{
};

ProfileCache::~ProfileCache()
{
    lock_guard<mutex> lock(this->_pendingMutex);
    for (const auto& [taskKey, taskId] : this->_tasks)
    {
        this->_scheduler->cancel(taskId);
    }
    this->_tasks.clear();
};

optional<ProfileCacheEntry> ProfileCache::get(const string& pubkey)
{
    auto key = toLower(pubkey);
    auto now = this->_clock->now();

    lock_guard<mutex> lock(this->_cacheMutex);
    auto it = this->_entries.find(key);
    if (it == this->_entries.end())
    {
        return nullopt;
    }

    if (now - it->second.insertedAt >= this->_config.ttl)
    {
        this->_entries.erase(it);
        return nullopt;
    }

    it->second.lastAccessed = now;
    return it->second;
};

void ProfileCache::put(const string& pubkey, Profile profile)
{
    auto key = toLower(pubkey);
    auto now = this->_clock->now();
    profile.pubkey = key;

    {
        lock_guard<mutex> lock(this->_cacheMutex);
        this->_entries[key] = ProfileCacheEntry{ move(profile), now, now };
        this->_evict(key, now);
    }

    lock_guard<mutex> lock(this->_pendingMutex);
    this->_pending.erase(key);
};

void ProfileCache::requestLookup(const string& pubkey)
{
    auto claimed = this->_claimLookups({ pubkey });
    if (claimed.empty())
    {
        return;
    }

    this->_issueWhenAllowed(claimed);
};

void ProfileCache::requestLookups(const vector<string>& pubkeys)
{
    auto claimed = this->_claimLookups(pubkeys);
    if (claimed.empty())
    {
        return;
    }

    size_t batchSize = max<size_t>(this->_config.batchSize, 1);
    size_t chunkCount = (claimed.size() + batchSize - 1) / batchSize;
    PLOG_DEBUG << "Requesting " << claimed.size() << " profiles in " << chunkCount << " chunks.";

    for (size_t i = 0; i < chunkCount; i++)
    {
        auto first = claimed.begin() + i * batchSize;
        auto last = claimed.begin() + min(claimed.size(), (i + 1) * batchSize);
        vector<string> chunk(first, last);

        if (i == 0)
        {
            this->_issueWhenAllowed(chunk);
            continue;
        }

        lock_guard<mutex> lock(this->_pendingMutex);
        this->_scheduleLocked(this->_config.interChunkDelay * static_cast<int>(i), [this, chunk]()
        {
            this->_issueWhenAllowed(chunk);
        });
    }
};

bool ProfileCache::isPending(const string& pubkey)
{
    lock_guard<mutex> lock(this->_pendingMutex);
    return this->_pending.find(toLower(pubkey)) != this->_pending.end();
};

size_t ProfileCache::size()
{
    lock_guard<mutex> lock(this->_cacheMutex);
    return this->_entries.size();
};

#pragma region Private Helpers

bool ProfileCache::_isCached(const string& key)
{
    auto now = this->_clock->now();

    lock_guard<mutex> lock(this->_cacheMutex);
    auto it = this->_entries.find(key);
    return it != this->_entries.end() && now - it->second.insertedAt < this->_config.ttl;
};

vector<string> ProfileCache::_claimLookups(const vector<string>& pubkeys)
{
    vector<string> uncached;
    for (const string& pubkey : pubkeys)
    {
        auto key = toLower(pubkey);
        if (!isHex(key, 64))
        {
            PLOG_DEBUG << "Skipping profile lookup for malformed pubkey " << pubkey;
            continue;
        }
        if (!this->_isCached(key) && find(uncached.begin(), uncached.end(), key) == uncached.end())
        {
            uncached.push_back(key);
        }
    }

    vector<string> claimed;
    lock_guard<mutex> lock(this->_pendingMutex);
    for (const string& key : uncached)
    {
        if (this->_pending.find(key) != this->_pending.end())
        {
            continue;
        }

        // The pending mark expires whether or not the profile ever arrives.
        uint64_t taskKey = this->_nextTaskKey;
        this->_pending[key] = taskKey;
        this->_scheduleLocked(this->_config.pendingWindow, [this, key, taskKey]()
        {
            lock_guard<mutex> lock(this->_pendingMutex);
            auto it = this->_pending.find(key);
            if (it != this->_pending.end() && it->second == taskKey)
            {
                this->_pending.erase(it);
            }
        });
        claimed.push_back(key);
    }

    return claimed;
};

void ProfileCache::_evict(const string& insertedKey, chrono::system_clock::time_point now)
{
    for (auto it = this->_entries.begin(); it != this->_entries.end();)
    {
        if (it->first != insertedKey && now - it->second.insertedAt >= this->_config.ttl)
        {
            it = this->_entries.erase(it);
        }
        else
        {
            ++it;
        }
    }

    if (this->_entries.size() <= this->_config.capacity)
    {
        return;
    }

    size_t evictionCount = max<size_t>(this->_config.capacity / 5, 1);

    vector<pair<chrono::system_clock::time_point, string>> candidates;
    candidates.reserve(this->_entries.size());
    for (const auto& [key, entry] : this->_entries)
    {
        if (key != insertedKey)
        {
            candidates.push_back(make_pair(entry.lastAccessed, key));
        }
    }

    evictionCount = min(evictionCount, candidates.size());
    partial_sort(candidates.begin(), candidates.begin() + evictionCount, candidates.end());
    for (size_t i = 0; i < evictionCount; i++)
    {
        this->_entries.erase(candidates[i].second);
    }

    PLOG_DEBUG << "Evicted " << evictionCount << " least recently used profiles.";
};

void ProfileCache::_issueWhenAllowed(vector<string> pubkeys)
{
    auto delay = this->_rateLimiter.acquire();
    if (delay.count() == 0)
    {
        this->_sendLookup(pubkeys);
        return;
    }

    PLOG_VERBOSE << "Deferring profile lookup by " << delay.count() << "ms.";
    lock_guard<mutex> lock(this->_pendingMutex);
    this->_scheduleLocked(delay, [this, pubkeys]()
    {
        this->_sendLookup(pubkeys);
    });
};

void ProfileCache::_sendLookup(const vector<string>& pubkeys)
{
    Filters filters;
    filters.authors = pubkeys;
    filters.kinds = { kind::METADATA };
    filters.limit = static_cast<int>(pubkeys.size());

    SubscriptionOptions options;
    options.closeOnEose = true;

    this->_pool->subscribe(filters, "profile lookup", options);
};

uint64_t ProfileCache::_scheduleLocked(chrono::milliseconds delay, function<void()> task)
{
    uint64_t taskKey = this->_nextTaskKey++;
    this->_tasks[taskKey] = this->_scheduler->schedule(delay, [this, taskKey, task]()
    {
        {
            lock_guard<mutex> lock(this->_pendingMutex);
            this->_tasks.erase(taskKey);
        }
        task();
    });

    return taskKey;
};

#pragma endregion
