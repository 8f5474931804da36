#pragma once

#include <juce_core/juce_core.h>
#include <vector>

/**
    A time-indexed automation lane for one scalar control.

    Events are kept sorted by time. Between a point and a following linear
    ramp the value is interpolated, otherwise it holds the last point. Before
    the first event the lane reports its default value.

    Writers (message thread) and the renderer (audio thread) share the lane
    through a SpinLock; the renderer takes it once per block via fillValues().
*/
class ParamAutomation
{
public:
    struct Event
    {
        enum class Type { setValue, linearRamp };

        Type type { Type::setValue };
        double time { 0.0 };
        float value { 0.0f };
    };

    explicit ParamAutomation (float defaultValue = 0.0f);

    /** Sets the value used before any event is reached. */
    void setDefaultValue (float newDefault);
    float getDefaultValue() const;

    void setValueAtTime (float value, double time);
    void linearRampToValueAtTime (float value, double endTime);

    /** Removes every event scheduled at or after cancelTime. */
    void cancelScheduledValues (double cancelTime);

    float getValueAtTime (double time) const;

    /** Writes numSamples values starting at startTime, one per sample period. */
    void fillValues (double startTime, double sampleRate, float* dest, int numSamples) const;

    std::vector<Event> getEvents() const;
    int getNumEvents() const;

private:
    void insertEvent (const Event& event);
    float evaluate (double time) const;

    mutable juce::SpinLock lock;
    std::vector<Event> events;
    float defaultValue { 0.0f };

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR (ParamAutomation)
};
