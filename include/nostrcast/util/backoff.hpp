#pragma once

#include <chrono>

namespace nostrcast
{
namespace util
{
/**
 * @brief Tracks a reconnection delay that doubles after each failed attempt, up to a cap.
 * @remark Not thread-safe; owners guard it with their own lock.
 */
class ExponentialBackoff
{
public:
    ExponentialBackoff(std::chrono::milliseconds initialDelay, std::chrono::milliseconds maxDelay);

    /**
     * @brief The delay to wait before the next attempt.
     */
    std::chrono::milliseconds delay() const;

    /**
     * @brief Doubles the delay, clamped to the maximum.
     * @returns The new delay.
     */
    std::chrono::milliseconds increase();

    /**
     * @brief Restores the initial delay.
     */
    void reset();

    std::chrono::milliseconds initialDelay() const;

    std::chrono::milliseconds maxDelay() const;

private:
    std::chrono::milliseconds _initialDelay;
    std::chrono::milliseconds _maxDelay;
    std::chrono::milliseconds _delay;
};
} // namespace util
} // namespace nostrcast
