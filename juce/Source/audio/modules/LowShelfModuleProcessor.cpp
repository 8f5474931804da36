#include "LowShelfModuleProcessor.h"
#include "../../config/PhiConfig.h"

LowShelfModuleProcessor::LowShelfModuleProcessor (const SampleClock& clockToUse)
    : ModuleProcessor (BusesProperties()
                        .withInput ("Input", juce::AudioChannelSet::mono(), true)
                        .withOutput ("Output", juce::AudioChannelSet::stereo(), true),
                       clockToUse),
      apvts (*this, nullptr, "LowShelfParams", createParameterLayout())
{
    cutoffParam = apvts.getRawParameterValue (paramIdCutoff);
    gainDbParam = apvts.getRawParameterValue (paramIdGainDb);
    qParam = apvts.getRawParameterValue (paramIdQ);

    lastOutputValues.push_back (std::make_unique<std::atomic<float>> (0.0f)); // Out L
    lastOutputValues.push_back (std::make_unique<std::atomic<float>> (0.0f)); // Out R
}

juce::AudioProcessorValueTreeState::ParameterLayout LowShelfModuleProcessor::createParameterLayout()
{
    std::vector<std::unique_ptr<juce::RangedAudioParameter>> params;

    params.push_back (std::make_unique<juce::AudioParameterFloat> (
        paramIdCutoff, "Cutoff",
        juce::NormalisableRange<float> (20.0f, 2000.0f, 1.0f, 0.3f), PhiConfig::kLowShelfCutoffHz));

    params.push_back (std::make_unique<juce::AudioParameterFloat> (
        paramIdGainDb, "Shelf Gain",
        juce::NormalisableRange<float> (-24.0f, 24.0f, 0.1f), PhiConfig::kLowShelfGainDb));

    params.push_back (std::make_unique<juce::AudioParameterFloat> (
        paramIdQ, "Q",
        juce::NormalisableRange<float> (0.1f, 10.0f, 0.01f), PhiConfig::kLowShelfQ));

    return { params.begin(), params.end() };
}

void LowShelfModuleProcessor::prepareToPlay (double sr, int samplesPerBlock)
{
    sampleRate = sr;
    juce::dsp::ProcessSpec spec { sampleRate, (juce::uint32) samplesPerBlock, 1 };

    activeCutoff = -1.0f;
    updateCoefficients (cutoffParam->load(), gainDbParam->load(), qParam->load());
    filter.prepare (spec);
    filter.reset();
}

void LowShelfModuleProcessor::updateCoefficients (float cutoff, float gainDb, float q)
{
    if (cutoff == activeCutoff && gainDb == activeGainDb && q == activeQ)
        return;

    const float safeCutoff = juce::jlimit (20.0f, (float) (sampleRate * 0.45), cutoff);
    filter.coefficients = juce::dsp::IIR::Coefficients<float>::makeLowShelf (
        sampleRate, safeCutoff, q, juce::Decibels::decibelsToGain (gainDb));

    activeCutoff = cutoff;
    activeGainDb = gainDb;
    activeQ = q;
}

void LowShelfModuleProcessor::processBlock (juce::AudioBuffer<float>& buffer, juce::MidiBuffer& midi)
{
    juce::ignoreUnused (midi);

    auto outBus = getBusBuffer (buffer, false, 0);
    const int numSamples = buffer.getNumSamples();

    updateCoefficients (cutoffParam->load(), gainDbParam->load(), qParam->load());

    // Mono input arrives on channel 0; filter in place, then mirror to the right
    auto* samples = outBus.getWritePointer (0);
    for (int i = 0; i < numSamples; ++i)
        samples[i] = filter.processSample (samples[i]);

    if (outBus.getNumChannels() > 1)
        outBus.copyFrom (1, 0, outBus, 0, 0, numSamples);

    updateOutputTelemetry (buffer);
}
