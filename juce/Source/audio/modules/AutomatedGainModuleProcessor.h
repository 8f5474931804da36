#pragma once

#include "ModuleProcessor.h"
#include "../graph/ParamAutomation.h"
#include <vector>

/**
    Mono amplitude stage: out = in * (gain + gain mod).

    Inputs: ch0 audio, ch1 gain modulation.
*/
class AutomatedGainModuleProcessor : public ModuleProcessor
{
public:
    explicit AutomatedGainModuleProcessor (const SampleClock& clockToUse);
    ~AutomatedGainModuleProcessor() override = default;

    const juce::String getName() const override { return "gain"; }

    void prepareToPlay (double sampleRate, int samplesPerBlock) override;
    void releaseResources() override {}
    void processBlock (juce::AudioBuffer<float>&, juce::MidiBuffer&) override;

    ParamAutomation& getGainAutomation() { return gain; }

    juce::String getAudioInputLabel (int channel) const override
    {
        switch (channel)
        {
            case 0: return "In";
            case 1: return "Gain Mod";
            default: return ModuleProcessor::getAudioInputLabel (channel);
        }
    }

private:
    ParamAutomation gain { 1.0f };
    std::vector<float> gainValues;
    double sampleRate { 48000.0 };

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR (AutomatedGainModuleProcessor)
};
