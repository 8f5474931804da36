#include "DeferredTaskScheduler.h"
#include <cmath>
#include <limits>

TimerTaskScheduler::~TimerTaskScheduler()
{
    pending.clear();
}

int TimerTaskScheduler::getNextIntervalMs (double remainingMs)
{
    if (! std::isfinite (remainingMs) || remainingMs <= 1.0)
        return 1;

    constexpr double maxIntervalMs = (double) std::numeric_limits<int>::max();
    return (int) std::llround (juce::jmin (remainingMs, maxIntervalMs));
}

DeferredTaskScheduler::TaskId TimerTaskScheduler::scheduleOnce (double delaySeconds, Task task)
{
    const TaskId id = nextId++;
    const double delayMs = std::isfinite (delaySeconds) ? juce::jmax (0.0, delaySeconds * 1000.0) : 0.0;

    auto timer = std::make_unique<OneShotTimer> (*this, id, std::move (task), delayMs);
    timer->arm();
    pending[id] = std::move (timer);
    return id;
}

bool TimerTaskScheduler::cancel (TaskId id)
{
    auto it = pending.find (id);
    if (it == pending.end())
        return false;

    pending.erase (it);
    return true;
}

bool TimerTaskScheduler::isPending (TaskId id) const
{
    return pending.find (id) != pending.end();
}

void TimerTaskScheduler::OneShotTimer::arm()
{
    armedMs = getNextIntervalMs (remainingMs);
    startTimer (armedMs);
}

void TimerTaskScheduler::OneShotTimer::timerCallback()
{
    stopTimer();
    remainingMs -= (double) armedMs;

    // Long waits are served in int-sized pieces
    if (remainingMs >= 1.0)
    {
        arm();
        return;
    }

    // fire() deletes this timer, so nothing may touch members afterwards
    owner.fire (id, std::move (task));
}

void TimerTaskScheduler::fire (TaskId id, Task task)
{
    pending.erase (id);

    if (task)
        task();
}
