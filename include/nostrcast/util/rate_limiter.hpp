#pragma once

#include <chrono>
#include <deque>
#include <memory>
#include <mutex>

#include "nostrcast/util/clock.hpp"

namespace nostrcast
{
namespace util
{
/**
 * @brief A sliding-window rate limiter that reserves future slots instead of rejecting.
 * @remark At most `maxRequests` slots fall within any window of length `window`.  When the
 * window is full, `acquire` reserves the earliest free slot and returns how long the caller
 * must wait before using it.
 */
class SlidingWindowRateLimiter
{
public:
    SlidingWindowRateLimiter(
        std::shared_ptr<IClock> clock,
        size_t maxRequests,
        std::chrono::milliseconds window);

    /**
     * @brief Reserves a slot.
     * @returns Zero if the request may proceed immediately, otherwise the delay until the
     * reserved slot opens.
     */
    std::chrono::milliseconds acquire();

    /**
     * @brief The number of slots reserved within the current window, including deferred ones.
     */
    size_t reservedSlots();

private:
    std::shared_ptr<IClock> _clock;
    size_t _maxRequests;
    std::chrono::milliseconds _window;

    std::mutex _mutex;
    std::deque<std::chrono::system_clock::time_point> _slots;

    void _prune(std::chrono::system_clock::time_point now);
};
} // namespace util
} // namespace nostrcast
