#include "AutomatedGainModuleProcessor.h"

AutomatedGainModuleProcessor::AutomatedGainModuleProcessor (const SampleClock& clockToUse)
    : ModuleProcessor (BusesProperties()
                        .withInput ("Inputs", juce::AudioChannelSet::discreteChannels (2), true) // ch0: In, ch1: Gain Mod
                        .withOutput ("Output", juce::AudioChannelSet::mono(), true),
                       clockToUse)
{
    lastOutputValues.push_back (std::make_unique<std::atomic<float>> (0.0f));
}

void AutomatedGainModuleProcessor::prepareToPlay (double sr, int samplesPerBlock)
{
    sampleRate = sr;
    gainValues.assign ((size_t) juce::jmax (1, samplesPerBlock), 0.0f);
}

void AutomatedGainModuleProcessor::processBlock (juce::AudioBuffer<float>& buffer, juce::MidiBuffer& midi)
{
    juce::ignoreUnused (midi);

    auto inBus = getBusBuffer (buffer, true, 0);
    auto outBus = getBusBuffer (buffer, false, 0);
    const float* audioIn = inBus.getNumChannels() > 0 ? inBus.getReadPointer (0) : nullptr;
    const float* gainCV  = inBus.getNumChannels() > 1 ? inBus.getReadPointer (1) : nullptr;

    const int numSamples = buffer.getNumSamples();
    if ((int) gainValues.size() < numSamples)
        gainValues.resize ((size_t) numSamples);

    gain.fillValues (clock.getTimeSeconds(), sampleRate, gainValues.data(), numSamples);

    for (int i = 0; i < numSamples; ++i)
    {
        const float in = audioIn != nullptr ? audioIn[i] : 0.0f;
        const float g = gainValues[(size_t) i] + (gainCV != nullptr ? gainCV[i] : 0.0f);
        outBus.setSample (0, i, in * g);
    }

    updateOutputTelemetry (buffer);
}
