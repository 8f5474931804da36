#pragma once

#include "ModuleProcessor.h"
#include <juce_dsp/juce_dsp.h>
#include <atomic>

/**
    Output stage of the synthesis graph: a low-shelf EQ on the summed mono
    voice bus, duplicated to a stereo output.
*/
class LowShelfModuleProcessor : public ModuleProcessor
{
public:
    // Parameter IDs
    static constexpr auto paramIdCutoff = "cutoff";
    static constexpr auto paramIdGainDb = "gain_db";
    static constexpr auto paramIdQ      = "q";

    explicit LowShelfModuleProcessor (const SampleClock& clockToUse);
    ~LowShelfModuleProcessor() override = default;

    const juce::String getName() const override { return "low_shelf"; }

    void prepareToPlay (double sampleRate, int samplesPerBlock) override;
    void releaseResources() override {}
    void processBlock (juce::AudioBuffer<float>&, juce::MidiBuffer&) override;

    juce::AudioProcessorValueTreeState& getAPVTS() { return apvts; }

    juce::String getAudioOutputLabel (int channel) const override
    {
        switch (channel)
        {
            case 0: return "Out L";
            case 1: return "Out R";
            default: return ModuleProcessor::getAudioOutputLabel (channel);
        }
    }

private:
    static juce::AudioProcessorValueTreeState::ParameterLayout createParameterLayout();
    void updateCoefficients (float cutoff, float gainDb, float q);

    juce::AudioProcessorValueTreeState apvts;
    juce::dsp::IIR::Filter<float> filter;
    double sampleRate { 48000.0 };

    // Cached parameter pointers
    std::atomic<float>* cutoffParam { nullptr };
    std::atomic<float>* gainDbParam { nullptr };
    std::atomic<float>* qParam      { nullptr };

    // Values the current coefficients were built from
    float activeCutoff { -1.0f };
    float activeGainDb { 0.0f };
    float activeQ { 0.0f };

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR (LowShelfModuleProcessor)
};
