#include <juce_core/juce_core.h>
#include "../audio/graph/ParamAutomation.h"

class ParamAutomationTests : public juce::UnitTest
{
public:
    ParamAutomationTests() : UnitTest("ParamAutomation Tests", "Graph") {}

    void runTest() override
    {
        runTestDefaultValue();
        runTestHoldAndRamp();
        runTestLeadingRamp();
        runTestCancel();
        runTestFillValues();
    }

private:
    void runTestDefaultValue()
    {
        beginTest("Default value before first event");

        ParamAutomation lane (440.0f);
        expectEquals(lane.getValueAtTime(0.0), 440.0f);
        expectEquals(lane.getNumEvents(), 0);

        lane.setValueAtTime(220.0f, 1.0);
        expectEquals(lane.getValueAtTime(0.5), 440.0f);
        expectEquals(lane.getValueAtTime(1.0), 220.0f);
        expectEquals(lane.getValueAtTime(10.0), 220.0f);
    }

    void runTestHoldAndRamp()
    {
        beginTest("Set values hold, ramps interpolate");

        ParamAutomation lane;
        lane.setValueAtTime(0.0f, 1.0);
        lane.linearRampToValueAtTime(1.0f, 2.0);
        lane.linearRampToValueAtTime(0.5f, 4.0);
        lane.setValueAtTime(0.25f, 5.0);

        expectWithinAbsoluteError(lane.getValueAtTime(1.5), 0.5f, 1.0e-5f);
        expectWithinAbsoluteError(lane.getValueAtTime(2.0), 1.0f, 1.0e-5f);
        expectWithinAbsoluteError(lane.getValueAtTime(3.0), 0.75f, 1.0e-5f);

        // No ramp into the point at 5.0, so 4..5 holds
        expectWithinAbsoluteError(lane.getValueAtTime(4.9), 0.5f, 1.0e-5f);
        expectWithinAbsoluteError(lane.getValueAtTime(6.0), 0.25f, 1.0e-5f);

        // Events are kept sorted whatever order they arrive in
        ParamAutomation unordered;
        unordered.setValueAtTime(3.0f, 3.0);
        unordered.setValueAtTime(1.0f, 1.0);
        const auto events = unordered.getEvents();
        expectEquals((int) events.size(), 2);
        expectEquals(events[0].time, 1.0);
        expectEquals(events[1].time, 3.0);
    }

    void runTestLeadingRamp()
    {
        beginTest("Ramp without a preceding point starts from the default");

        ParamAutomation lane (1.0f);
        lane.linearRampToValueAtTime(0.0f, 2.0);
        expectWithinAbsoluteError(lane.getValueAtTime(1.0), 0.5f, 1.0e-5f);
        expectWithinAbsoluteError(lane.getValueAtTime(3.0), 0.0f, 1.0e-5f);
    }

    void runTestCancel()
    {
        beginTest("Cancel removes events at or after the time");

        ParamAutomation lane;
        lane.setValueAtTime(0.0f, 0.0);
        lane.linearRampToValueAtTime(1.0f, 1.0);
        lane.linearRampToValueAtTime(0.0f, 2.0);
        expectEquals(lane.getNumEvents(), 3);

        lane.cancelScheduledValues(1.0);
        expectEquals(lane.getNumEvents(), 1);
        expectEquals(lane.getValueAtTime(5.0), 0.0f);

        lane.cancelScheduledValues(0.0);
        expectEquals(lane.getNumEvents(), 0);
    }

    void runTestFillValues()
    {
        beginTest("Block fill matches point evaluation");

        ParamAutomation lane;
        lane.setValueAtTime(0.0f, 0.0);
        lane.linearRampToValueAtTime(1.0f, 0.01);

        constexpr int numSamples = 64;
        constexpr double sampleRate = 4800.0;
        float values[numSamples] {};
        lane.fillValues(0.0, sampleRate, values, numSamples);

        for (int i = 0; i < numSamples; ++i)
            expectWithinAbsoluteError(values[i], lane.getValueAtTime(i / sampleRate), 1.0e-5f);

        expectWithinAbsoluteError(values[24], 0.5f, 1.0e-4f);
        expectEquals(values[numSamples - 1], 1.0f);
    }
};

static ParamAutomationTests paramAutomationTests;
