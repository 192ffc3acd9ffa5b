#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "nostrcast/data/domain.hpp"
#include "nostrcast/service/connection_pool.hpp"
#include "nostrcast/util/clock.hpp"
#include "nostrcast/util/rate_limiter.hpp"
#include "nostrcast/util/scheduler.hpp"

namespace nostrcast
{
namespace service
{
struct ProfileCacheConfig
{
    size_t capacity = 500;
    std::chrono::seconds ttl = std::chrono::hours(24);
    std::chrono::milliseconds pendingWindow = std::chrono::seconds(30); ///< How long a lookup suppresses repeats.
    size_t maxRequestsPerWindow = 10;
    std::chrono::milliseconds rateWindow = std::chrono::seconds(1);
    size_t batchSize = 30;
    std::chrono::milliseconds interChunkDelay = std::chrono::milliseconds(200);
};

struct ProfileCacheEntry
{
    data::Profile profile;
    std::chrono::system_clock::time_point insertedAt;
    std::chrono::system_clock::time_point lastAccessed;
};

/**
 * @brief Caches user profiles with TTL expiry and LRU eviction, and fetches missing profiles
 * from relays with deduplicated, rate-limited lookups.
 * @remark Pubkeys are case-insensitive.  The cache and the pending-lookup set are guarded by
 * separate mutexes that are never held together.
 */
class ProfileCache
{
public:
    ProfileCache(
        std::shared_ptr<util::IClock> clock,
        std::shared_ptr<util::IScheduler> scheduler,
        std::shared_ptr<IConnectionPool> pool,
        ProfileCacheConfig config = ProfileCacheConfig());

    ~ProfileCache();

    ProfileCache(const ProfileCache&) = delete;

    ProfileCache& operator=(const ProfileCache&) = delete;

    /**
     * @brief Looks up a cached profile and marks it as recently used.
     * @returns The entry, or nothing if it is absent or older than the TTL.  Expired entries are
     * removed.
     */
    std::optional<ProfileCacheEntry> get(const std::string& pubkey);

    /**
     * @brief Inserts or replaces a profile, then evicts expired entries and, if the cache is
     * still over capacity, the least recently used fifth of its capacity.
     * @remark The entry being inserted is never evicted.  Any pending lookup for the pubkey is
     * cleared.
     */
    void put(const std::string& pubkey, data::Profile profile);

    /**
     * @brief Requests a profile from relays unless it is cached or already being fetched.
     * @remark Requests over the rate limit are deferred, not dropped.
     */
    void requestLookup(const std::string& pubkey);

    /**
     * @brief Requests many profiles at once, in chunks of `batchSize` pubkeys per subscription
     * spaced by `interChunkDelay`.
     */
    void requestLookups(const std::vector<std::string>& pubkeys);

    /**
     * @brief Indicates whether a lookup for the pubkey is in flight.
     */
    bool isPending(const std::string& pubkey);

    size_t size();

private:
    std::shared_ptr<util::IClock> _clock;
    std::shared_ptr<util::IScheduler> _scheduler;
    std::shared_ptr<IConnectionPool> _pool;
    ProfileCacheConfig _config;
    util::SlidingWindowRateLimiter _rateLimiter;

    std::mutex _cacheMutex;
    std::unordered_map<std::string, ProfileCacheEntry> _entries;

    ///< Guards the pending set and the scheduled task table.
    std::mutex _pendingMutex;
    ///< Maps each pending pubkey to the key of the task that will clear it.
    std::unordered_map<std::string, uint64_t> _pending;
    std::unordered_map<uint64_t, util::IScheduler::TaskId> _tasks;
    uint64_t _nextTaskKey = 1;

    bool _isCached(const std::string& pubkey);

    /**
     * @brief Keeps the pubkeys that are neither cached nor pending, and marks them pending.
     */
    std::vector<std::string> _claimLookups(const std::vector<std::string>& pubkeys);

    void _evict(const std::string& insertedKey, std::chrono::system_clock::time_point now);

    /**
     * @brief Sends the lookup now if the rate limiter allows, or schedules it for the reserved
     * slot.
     */
    void _issueWhenAllowed(std::vector<std::string> pubkeys);

    void _sendLookup(const std::vector<std::string>& pubkeys);

    /**
     * @brief Schedules a task whose ID is tracked so that destruction cancels it.
     * @remark Must be called with `_pendingMutex` held.
     */
    uint64_t _scheduleLocked(std::chrono::milliseconds delay, std::function<void()> task);
};
} // namespace service
} // namespace nostrcast
