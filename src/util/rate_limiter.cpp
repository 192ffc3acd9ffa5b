#include <algorithm>

#include "nostrcast/util/rate_limiter.hpp"

using namespace nostrcast::util;
using namespace std;

SlidingWindowRateLimiter::SlidingWindowRateLimiter(
    shared_ptr<IClock> clock,
    size_t maxRequests,
    chrono::milliseconds window)
: _clock(clock), _maxRequests(max<size_t>(maxRequests, 1)), _window(window) { };

chrono::milliseconds SlidingWindowRateLimiter::acquire()
{
    auto now = this->_clock->now();

    lock_guard<mutex> lock(this->_mutex);
    this->_prune(now);

    // Slots stay in ascending order so deferred requests keep their place in line.
    auto slot = this->_slots.empty() ? now : max(now, this->_slots.back());
    if (this->_slots.size() >= this->_maxRequests)
    {
        // The new slot opens one window after the slot `maxRequests` positions back.
        auto anchor = this->_slots[this->_slots.size() - this->_maxRequests];
        slot = max(slot, anchor + this->_window);
    }
    this->_slots.push_back(slot);

    return chrono::ceil<chrono::milliseconds>(slot - now);
};

size_t SlidingWindowRateLimiter::reservedSlots()
{
    auto now = this->_clock->now();

    lock_guard<mutex> lock(this->_mutex);
    this->_prune(now);
    return this->_slots.size();
};

void SlidingWindowRateLimiter::_prune(chrono::system_clock::time_point now)
{
    while (!this->_slots.empty() && this->_slots.front() <= now - this->_window)
    {
        this->_slots.pop_front();
    }
};
