#include <stdexcept>

#include <plog/Log.h>

#include "nostrcast/util/scheduler.hpp"

using namespace nostrcast::util;
using namespace std;

ThreadScheduler::ThreadScheduler()
{
    this->_worker = thread([this]() { this->_run(); });
};

ThreadScheduler::~ThreadScheduler()
{
    this->stop();
};

IScheduler::TaskId ThreadScheduler::schedule(chrono::milliseconds delay, function<void()> task)
{
    auto due = chrono::steady_clock::now() + delay;

    lock_guard<mutex> lock(this->_mutex);
    TaskId taskId = this->_nextTaskId++;
    this->_tasks[make_pair(due, taskId)] = move(task);
    this->_dueTimes[taskId] = due;
    this->_condition.notify_one();

    return taskId;
};

bool ThreadScheduler::cancel(TaskId taskId)
{
    lock_guard<mutex> lock(this->_mutex);
    auto it = this->_dueTimes.find(taskId);
    if (it == this->_dueTimes.end())
    {
        return false;
    }

    this->_tasks.erase(make_pair(it->second, taskId));
    this->_dueTimes.erase(it);

    return true;
};

void ThreadScheduler::stop()
{
    unique_lock<mutex> lock(this->_mutex);
    if (this->_isStopping)
    {
        return;
    }
    this->_isStopping = true;
    this->_tasks.clear();
    this->_dueTimes.clear();
    lock.unlock();

    this->_condition.notify_all();
    if (this->_worker.joinable() && this->_worker.get_id() != this_thread::get_id())
    {
        this->_worker.join();
    }
    else if (this->_worker.joinable())
    {
        // A task asked the scheduler to stop from its own thread.
        this->_worker.detach();
    }
};

void ThreadScheduler::_run()
{
    unique_lock<mutex> lock(this->_mutex);
    while (!this->_isStopping)
    {
        if (this->_tasks.empty())
        {
            this->_condition.wait(lock);
            continue;
        }

        auto next = this->_tasks.begin();
        auto due = next->first.first;
        if (chrono::steady_clock::now() < due)
        {
            this->_condition.wait_until(lock, due);
            continue;
        }

        function<void()> task = move(next->second);
        this->_dueTimes.erase(next->first.second);
        this->_tasks.erase(next);

        // Tasks run unlocked so they may schedule or cancel other tasks.
        lock.unlock();
        try
        {
            task();
        }
        catch (const exception& e)
        {
            PLOG_ERROR << "Scheduled task failed: " << e.what();
        }
        lock.lock();
    }
};
