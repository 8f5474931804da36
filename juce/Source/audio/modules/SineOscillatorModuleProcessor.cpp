#include "SineOscillatorModuleProcessor.h"
#include <cmath>

SineOscillatorModuleProcessor::SineOscillatorModuleProcessor (const SampleClock& clockToUse)
    : ModuleProcessor (BusesProperties()
                        .withInput ("Inputs", juce::AudioChannelSet::discreteChannels (1), true) // ch0: Freq Mod
                        .withOutput ("Output", juce::AudioChannelSet::mono(), true),
                       clockToUse)
{
    lastOutputValues.push_back (std::make_unique<std::atomic<float>> (0.0f));

    oscillator.initialise ([] (float x) { return std::sin (x); }, 128);
}

void SineOscillatorModuleProcessor::prepareToPlay (double sr, int samplesPerBlock)
{
    sampleRate = sr;
    juce::dsp::ProcessSpec spec { sampleRate, (juce::uint32) samplesPerBlock, 1 };
    oscillator.prepare (spec);
    frequencyValues.assign ((size_t) juce::jmax (1, samplesPerBlock), 0.0f);
}

void SineOscillatorModuleProcessor::scheduleStart (double when)
{
    startTime.store (juce::jmax (0.0, when));
}

void SineOscillatorModuleProcessor::scheduleStop (double when)
{
    stopTime.store (juce::jmax (0.0, when));
}

bool SineOscillatorModuleProcessor::hasStartScheduled() const
{
    return std::isfinite (startTime.load());
}

void SineOscillatorModuleProcessor::processBlock (juce::AudioBuffer<float>& buffer, juce::MidiBuffer& midi)
{
    juce::ignoreUnused (midi);

    auto inBus = getBusBuffer (buffer, true, 0);
    auto outBus = getBusBuffer (buffer, false, 0);
    const float* freqCV = inBus.getNumChannels() > 0 ? inBus.getReadPointer (0) : nullptr;

    const int numSamples = buffer.getNumSamples();
    if ((int) frequencyValues.size() < numSamples)
        frequencyValues.resize ((size_t) numSamples);

    const double blockStart = clock.getTimeSeconds();
    frequency.fillValues (blockStart, sampleRate, frequencyValues.data(), numSamples);

    const double startAt = startTime.load();
    const double stopAt = stopTime.load();
    const float nyquist = (float) (sampleRate * 0.5);

    for (int i = 0; i < numSamples; ++i)
    {
        // Modulation shares channel 0 with the output, read it first
        const float mod = freqCV != nullptr ? freqCV[i] : 0.0f;
        const double t = blockStart + (double) i / sampleRate;

        if (t < startAt || t >= stopAt)
        {
            outBus.setSample (0, i, 0.0f);
            continue;
        }

        const float freq = juce::jlimit (0.0f, nyquist, frequencyValues[(size_t) i] + mod);
        oscillator.setFrequency (freq, true);
        outBus.setSample (0, i, oscillator.processSample (0.0f));
    }

    updateOutputTelemetry (buffer);
}
