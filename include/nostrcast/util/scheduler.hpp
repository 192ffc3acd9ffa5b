#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <utility>

namespace nostrcast
{
namespace util
{
/**
 * @brief An interface for running deferred tasks.
 */
class IScheduler
{
public:
    typedef uint64_t TaskId;

    virtual ~IScheduler() = default;

    /**
     * @brief Schedules a task to run once after the given delay.
     * @returns An ID that may be passed to `cancel`.
     */
    virtual TaskId schedule(std::chrono::milliseconds delay, std::function<void()> task) = 0;

    /**
     * @brief Cancels a scheduled task.
     * @returns True if the task was removed before it started running, false if it has already
     * run, is running, or was never scheduled.
     */
    virtual bool cancel(TaskId taskId) = 0;
};

/**
 * @brief An `IScheduler` that runs tasks on a single background thread, in due-time order.
 */
class ThreadScheduler : public IScheduler
{
public:
    ThreadScheduler();

    ~ThreadScheduler();

    ThreadScheduler(const ThreadScheduler&) = delete;

    ThreadScheduler& operator=(const ThreadScheduler&) = delete;

    TaskId schedule(std::chrono::milliseconds delay, std::function<void()> task) override;

    bool cancel(TaskId taskId) override;

    /**
     * @brief Stops the worker thread.  Tasks that have not yet run are discarded.
     */
    void stop();

private:
    typedef std::pair<std::chrono::steady_clock::time_point, TaskId> TaskKey;

    std::mutex _mutex;
    std::condition_variable _condition;
    std::map<TaskKey, std::function<void()>> _tasks;
    std::unordered_map<TaskId, std::chrono::steady_clock::time_point> _dueTimes;
    TaskId _nextTaskId = 1;
    bool _isStopping = false;
    std::thread _worker;

    void _run();
};
} // namespace util
} // namespace nostrcast
