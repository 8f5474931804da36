#include <juce_audio_processors/juce_audio_processors.h>
#include "../audio/modules/ModuleProcessor.h"
#include "../audio/modules/SineOscillatorModuleProcessor.h"
#include "../audio/modules/AutomatedGainModuleProcessor.h"
#include "../audio/modules/LowShelfModuleProcessor.h"

/**
    Unit tests for the ModuleProcessor base class and the voice modules.

    Covers bus layouts, the sample clock, and each module's processing
    outside of a graph.
*/
class ModuleProcessorTests : public juce::UnitTest
{
public:
    ModuleProcessorTests() : UnitTest("ModuleProcessor Tests", "Audio") {}

    void runTest() override
    {
        runTestBusConfiguration();
        runTestSampleClock();
        runTestOscillatorGate();
        runTestFrequencyModulation();
        runTestGain();
        runTestLowShelf();
    }

private:
    static constexpr double sampleRate = 48000.0;
    static constexpr int blockSize = 256;

    void runTestBusConfiguration()
    {
        beginTest("Bus Configuration");

        SampleClock clock;
        SineOscillatorModuleProcessor osc (clock);
        AutomatedGainModuleProcessor gain (clock);
        LowShelfModuleProcessor shelf (clock);

        expectEquals(osc.getBusCount(true), 1);
        expectEquals(osc.getBusCount(false), 1);
        expectEquals(osc.getTotalNumInputChannels(), 1);    // Freq mod
        expectEquals(osc.getTotalNumOutputChannels(), 1);

        expectEquals(gain.getTotalNumInputChannels(), 2);   // Audio + gain mod
        expectEquals(gain.getTotalNumOutputChannels(), 1);

        expectEquals(shelf.getTotalNumInputChannels(), 1);
        expectEquals(shelf.getTotalNumOutputChannels(), 2);

        expectEquals(osc.getAudioInputLabel(0), juce::String("Freq Mod"));
        expectEquals(gain.getAudioInputLabel(1), juce::String("Gain Mod"));
        expectEquals(shelf.getAudioOutputLabel(1), juce::String("Out R"));

        auto* cutoff = shelf.getAPVTS().getParameter(LowShelfModuleProcessor::paramIdCutoff);
        expect(cutoff != nullptr);
        expectWithinAbsoluteError(shelf.getAPVTS().getRawParameterValue(LowShelfModuleProcessor::paramIdCutoff)->load(),
                                  120.0f, 0.5f);
    }

    void runTestSampleClock()
    {
        beginTest("Sample Clock");

        SampleClock clock;
        clock.sampleRate.store(sampleRate);
        expectEquals(clock.getTimeSeconds(), 0.0);

        clock.advance(24000);
        expectWithinAbsoluteError(clock.getTimeSeconds(), 0.5, 1.0e-12);

        clock.reset();
        expectEquals(clock.getTimeSeconds(), 0.0);
    }

    void runTestOscillatorGate()
    {
        beginTest("Oscillator is silent outside its start/stop window");

        SampleClock clock;
        clock.sampleRate.store(sampleRate);
        SineOscillatorModuleProcessor osc (clock);
        osc.prepareToPlay(sampleRate, blockSize);
        osc.getFrequencyAutomation().setValueAtTime(1000.0f, 0.0);

        juce::AudioBuffer<float> buffer (1, blockSize);
        juce::MidiBuffer midi;

        buffer.clear();
        osc.processBlock(buffer, midi);
        expect(! osc.hasStartScheduled());
        expectEquals(buffer.getMagnitude(0, 0, blockSize), 0.0f);

        osc.scheduleStart(0.0);
        buffer.clear();
        osc.processBlock(buffer, midi);
        expect(buffer.getMagnitude(0, 0, blockSize) > 0.5f);
        expect(osc.getOutputChannelValue(0) > 0.5f);

        clock.advance(blockSize);
        osc.scheduleStop(clock.getTimeSeconds());
        buffer.clear();
        osc.processBlock(buffer, midi);
        expectEquals(buffer.getMagnitude(0, 0, blockSize), 0.0f);
    }

    void runTestFrequencyModulation()
    {
        beginTest("Frequency input is summed onto the automated frequency");

        SampleClock clock;
        clock.sampleRate.store(sampleRate);
        SineOscillatorModuleProcessor osc (clock);
        osc.prepareToPlay(sampleRate, blockSize);
        osc.getFrequencyAutomation().setValueAtTime(0.0f, 0.0);
        osc.scheduleStart(0.0);

        // 0 Hz holds the phase still; a 1 kHz offset on the input makes it move
        juce::AudioBuffer<float> buffer (1, blockSize);
        juce::MidiBuffer midi;
        buffer.clear();
        osc.processBlock(buffer, midi);
        expectWithinAbsoluteError(buffer.getMagnitude(0, 0, blockSize), 0.0f, 1.0e-4f);

        for (int i = 0; i < blockSize; ++i)
            buffer.setSample(0, i, 1000.0f);
        osc.processBlock(buffer, midi);
        expect(buffer.getMagnitude(0, 0, blockSize) > 0.5f);
    }

    void runTestGain()
    {
        beginTest("Gain applies automation plus modulation");

        SampleClock clock;
        clock.sampleRate.store(sampleRate);
        AutomatedGainModuleProcessor gain (clock);
        gain.prepareToPlay(sampleRate, blockSize);
        gain.getGainAutomation().setValueAtTime(0.5f, 0.0);

        juce::AudioBuffer<float> buffer (2, blockSize);
        juce::MidiBuffer midi;
        buffer.clear();
        for (int i = 0; i < blockSize; ++i)
            buffer.setSample(0, i, 1.0f);

        gain.processBlock(buffer, midi);
        expectWithinAbsoluteError(buffer.getSample(0, 10), 0.5f, 1.0e-6f);

        for (int i = 0; i < blockSize; ++i)
        {
            buffer.setSample(0, i, 1.0f);
            buffer.setSample(1, i, 0.25f);
        }

        gain.processBlock(buffer, midi);
        expectWithinAbsoluteError(buffer.getSample(0, 10), 0.75f, 1.0e-6f);
    }

    void runTestLowShelf()
    {
        beginTest("Low shelf mirrors the mono bus to stereo");

        SampleClock clock;
        LowShelfModuleProcessor shelf (clock);
        shelf.prepareToPlay(sampleRate, blockSize);

        juce::AudioBuffer<float> buffer (2, blockSize);
        juce::MidiBuffer midi;
        buffer.clear();
        for (int i = 0; i < blockSize; ++i)
            buffer.setSample(0, i, (float) std::sin(2.0 * juce::MathConstants<double>::pi * 1000.0 * i / sampleRate));

        shelf.processBlock(buffer, midi);

        for (int i = 0; i < blockSize; ++i)
            expectEquals(buffer.getSample(1, i), buffer.getSample(0, i));

        // A flat shelf leaves a 1 kHz tone at its level
        expectWithinAbsoluteError(buffer.getMagnitude(0, blockSize / 2, blockSize / 2), 1.0f, 0.05f);
    }
};

// Register the test
static ModuleProcessorTests moduleProcessorTests;
