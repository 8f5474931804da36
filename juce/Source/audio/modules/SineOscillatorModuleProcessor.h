#pragma once

#include "ModuleProcessor.h"
#include "../graph/ParamAutomation.h"
#include <juce_dsp/juce_dsp.h>
#include <atomic>
#include <limits>
#include <vector>

/**
    Sine generator driven by a frequency automation lane.

    Input channel 0 carries frequency modulation in Hz and is summed onto
    the automated frequency. Output is silent outside [start, stop).
*/
class SineOscillatorModuleProcessor : public ModuleProcessor
{
public:
    explicit SineOscillatorModuleProcessor (const SampleClock& clockToUse);
    ~SineOscillatorModuleProcessor() override = default;

    const juce::String getName() const override { return "sine_osc"; }

    void prepareToPlay (double sampleRate, int samplesPerBlock) override;
    void releaseResources() override {}
    void processBlock (juce::AudioBuffer<float>&, juce::MidiBuffer&) override;

    ParamAutomation& getFrequencyAutomation() { return frequency; }

    void scheduleStart (double when);
    void scheduleStop (double when);
    bool hasStartScheduled() const;

    juce::String getAudioInputLabel (int channel) const override
    {
        return channel == 0 ? juce::String ("Freq Mod") : ModuleProcessor::getAudioInputLabel (channel);
    }

    juce::String getAudioOutputLabel (int channel) const override
    {
        return channel == 0 ? juce::String ("Out") : ModuleProcessor::getAudioOutputLabel (channel);
    }

private:
    ParamAutomation frequency { 440.0f };
    juce::dsp::Oscillator<float> oscillator;
    std::vector<float> frequencyValues;
    double sampleRate { 48000.0 };

    std::atomic<double> startTime { std::numeric_limits<double>::infinity() };
    std::atomic<double> stopTime { std::numeric_limits<double>::infinity() };

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR (SineOscillatorModuleProcessor)
};
