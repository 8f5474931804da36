#include "ParamAutomation.h"
#include <algorithm>

ParamAutomation::ParamAutomation (float initialDefault)
    : defaultValue (initialDefault)
{
}

void ParamAutomation::setDefaultValue (float newDefault)
{
    const juce::SpinLock::ScopedLockType guard (lock);
    defaultValue = newDefault;
}

float ParamAutomation::getDefaultValue() const
{
    const juce::SpinLock::ScopedLockType guard (lock);
    return defaultValue;
}

void ParamAutomation::setValueAtTime (float value, double time)
{
    insertEvent ({ Event::Type::setValue, juce::jmax (0.0, time), value });
}

void ParamAutomation::linearRampToValueAtTime (float value, double endTime)
{
    insertEvent ({ Event::Type::linearRamp, juce::jmax (0.0, endTime), value });
}

void ParamAutomation::cancelScheduledValues (double cancelTime)
{
    const juce::SpinLock::ScopedLockType guard (lock);
    events.erase (std::remove_if (events.begin(), events.end(),
                                  [cancelTime] (const Event& e) { return e.time >= cancelTime; }),
                  events.end());
}

float ParamAutomation::getValueAtTime (double time) const
{
    const juce::SpinLock::ScopedLockType guard (lock);
    return evaluate (time);
}

void ParamAutomation::fillValues (double startTime, double sampleRate, float* dest, int numSamples) const
{
    jassert (sampleRate > 0.0);
    const juce::SpinLock::ScopedLockType guard (lock);

    if (events.empty())
    {
        std::fill (dest, dest + numSamples, defaultValue);
        return;
    }

    for (int i = 0; i < numSamples; ++i)
        dest[i] = evaluate (startTime + (double) i / sampleRate);
}

std::vector<ParamAutomation::Event> ParamAutomation::getEvents() const
{
    const juce::SpinLock::ScopedLockType guard (lock);
    return events;
}

int ParamAutomation::getNumEvents() const
{
    const juce::SpinLock::ScopedLockType guard (lock);
    return (int) events.size();
}

void ParamAutomation::insertEvent (const Event& event)
{
    const juce::SpinLock::ScopedLockType guard (lock);

    // Equal times keep insertion order
    auto pos = std::upper_bound (events.begin(), events.end(), event.time,
                                 [] (double t, const Event& e) { return t < e.time; });
    events.insert (pos, event);
}

float ParamAutomation::evaluate (double time) const
{
    if (events.empty() || time < events.front().time)
    {
        // A leading ramp starts from the default value at t = 0
        if (! events.empty() && events.front().type == Event::Type::linearRamp && events.front().time > 0.0)
        {
            const auto& first = events.front();
            const double alpha = juce::jlimit (0.0, 1.0, time / first.time);
            return defaultValue + (float) alpha * (first.value - defaultValue);
        }
        return defaultValue;
    }

    for (size_t i = 0; i + 1 < events.size(); ++i)
    {
        const auto& current = events[i];
        const auto& next = events[i + 1];

        if (time >= next.time)
            continue;

        if (next.type == Event::Type::linearRamp && next.time > current.time)
        {
            const double alpha = (time - current.time) / (next.time - current.time);
            return current.value + (float) alpha * (next.value - current.value);
        }

        return current.value;
    }

    return events.back().value;
}
