#pragma once

#include <map>
#include <vector>
#include "../audio/phi/DeferredTaskScheduler.h"

/**
    Deterministic scheduler for tests: time only moves when advance() is
    called. With keepCancelledTasks set, cancelled tasks are kept aside so a
    test can run them late, as a timer that fired during cancellation would.
*/
class ManualTaskScheduler : public DeferredTaskScheduler
{
public:
    TaskId scheduleOnce (double delaySeconds, Task task) override
    {
        const TaskId id = nextId++;
        tasks[id] = { now + delaySeconds, std::move (task) };
        lastDelay = delaySeconds;
        return id;
    }

    bool cancel (TaskId id) override
    {
        auto it = tasks.find (id);
        if (it == tasks.end())
            return false;

        if (keepCancelledTasks)
            cancelledTasks.push_back (std::move (it->second.task));

        tasks.erase (it);
        return true;
    }

    bool isPending (TaskId id) const override { return tasks.find (id) != tasks.end(); }

    /** Moves time forward and runs every task that has come due, earliest first. */
    void advance (double seconds)
    {
        now += seconds;

        for (;;)
        {
            auto due = tasks.end();
            for (auto it = tasks.begin(); it != tasks.end(); ++it)
                if (it->second.dueTime <= now + 1.0e-9 && (due == tasks.end() || it->second.dueTime < due->second.dueTime))
                    due = it;

            if (due == tasks.end())
                break;

            auto task = std::move (due->second.task);
            tasks.erase (due);
            task();
        }
    }

    void runCancelledTasks()
    {
        auto late = std::move (cancelledTasks);
        cancelledTasks.clear();

        for (auto& task : late)
            task();
    }

    int getNumPending() const { return (int) tasks.size(); }
    double getLastDelay() const { return lastDelay; }
    double getNow() const { return now; }

    bool keepCancelledTasks { false };

private:
    struct Scheduled
    {
        double dueTime { 0.0 };
        Task task;
    };

    std::map<TaskId, Scheduled> tasks;
    std::vector<Task> cancelledTasks;
    TaskId nextId { 1 };
    double now { 0.0 };
    double lastDelay { 0.0 };
};
