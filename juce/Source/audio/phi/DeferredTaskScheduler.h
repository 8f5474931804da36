#pragma once

#include <juce_events/juce_events.h>
#include <functional>
#include <map>
#include <memory>

/**
    Runs single-shot tasks after a delay. A cancelled task is guaranteed not
    to run.
*/
class DeferredTaskScheduler
{
public:
    using TaskId = juce::uint64;
    using Task = std::function<void()>;

    virtual ~DeferredTaskScheduler() = default;

    /** @returns a non-zero id that identifies the task until it runs or is cancelled */
    virtual TaskId scheduleOnce (double delaySeconds, Task task) = 0;

    /** @returns true if the task was still pending and has now been dropped */
    virtual bool cancel (TaskId id) = 0;

    virtual bool isPending (TaskId id) const = 0;
};

/**
    One-shot juce::Timers on the message thread. Must be used from the
    message thread only.
*/
class TimerTaskScheduler : public DeferredTaskScheduler
{
public:
    TimerTaskScheduler() = default;
    ~TimerTaskScheduler() override;

    TaskId scheduleOnce (double delaySeconds, Task task) override;
    bool cancel (TaskId id) override;
    bool isPending (TaskId id) const override;

    int getNumPendingTasks() const { return (int) pending.size(); }

    /** The next timer interval for a wait of remainingMs. Waits longer than
        a juce::Timer can express are split and the timer is re-armed.
    */
    static int getNextIntervalMs (double remainingMs);

private:
    class OneShotTimer : public juce::Timer
    {
    public:
        OneShotTimer (TimerTaskScheduler& ownerToUse, TaskId idToUse, Task taskToRun, double delayMs)
            : owner (ownerToUse), id (idToUse), task (std::move (taskToRun)), remainingMs (delayMs) {}

        ~OneShotTimer() override { stopTimer(); }

        void arm();
        void timerCallback() override;

    private:
        TimerTaskScheduler& owner;
        const TaskId id;
        Task task;
        double remainingMs { 0.0 };
        int armedMs { 0 };
    };

    void fire (TaskId id, Task task);

    std::map<TaskId, std::unique_ptr<OneShotTimer>> pending;
    TaskId nextId { 1 };

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR (TimerTaskScheduler)
};
