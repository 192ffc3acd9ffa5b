#pragma once

#include <chrono>

namespace nostrcast
{
namespace util
{
/**
 * @brief A source of wall-clock time.
 * @remark Components take an `IClock` rather than reading the system clock directly so that
 * TTLs, silence thresholds, and timestamps can be driven deterministically in tests.
 */
class IClock
{
public:
    virtual ~IClock() = default;

    virtual std::chrono::system_clock::time_point now() const = 0;
};

class SystemClock : public IClock
{
public:
    std::chrono::system_clock::time_point now() const override
    {
        return std::chrono::system_clock::now();
    };
};
} // namespace util
} // namespace nostrcast
