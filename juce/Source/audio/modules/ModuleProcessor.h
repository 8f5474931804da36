#pragma once

#include <juce_audio_processors/juce_audio_processors.h>
#include <atomic>
#include <memory>
#include <vector>

// Rendering clock shared by every module of one engine. The engine advances
// it once per block after the graph has rendered.
struct SampleClock
{
    std::atomic<juce::int64> samplePosition { 0 };
    std::atomic<double> sampleRate { 48000.0 };

    double getTimeSeconds() const
    {
        const double sr = sampleRate.load();
        return sr > 0.0 ? (double) samplePosition.load() / sr : 0.0;
    }

    void advance (int numSamples) { samplePosition.fetch_add (numSamples); }
    void reset() { samplePosition.store (0); }
};

/**
    Base class for the processors that make up a synthesis graph.

    Modules are timestamped against the owning engine's SampleClock so that
    automation lanes written in engine seconds line up with what is rendered.
*/
class ModuleProcessor : public juce::AudioProcessor
{
public:
    ModuleProcessor (const BusesProperties& ioLayouts, const SampleClock& clockToUse)
        : juce::AudioProcessor (ioLayouts), clock (clockToUse) {}
    ~ModuleProcessor() override = default;

    // Peak magnitude of the last rendered block, per output channel
    virtual float getOutputChannelValue (int channel) const
    {
        if (juce::isPositiveAndBelow (channel, (int) lastOutputValues.size()) && lastOutputValues[(size_t) channel])
            return lastOutputValues[(size_t) channel]->load();
        return 0.0f;
    }

    void updateOutputTelemetry (const juce::AudioBuffer<float>& buffer)
    {
        const int numChannels = juce::jmin (buffer.getNumChannels(), (int) lastOutputValues.size());
        for (int ch = 0; ch < numChannels; ++ch)
        {
            if (lastOutputValues[(size_t) ch])
            {
                const float peak = buffer.getMagnitude (ch, 0, buffer.getNumSamples());
                lastOutputValues[(size_t) ch]->store (peak, std::memory_order_relaxed);
            }
        }
    }

    virtual juce::String getAudioInputLabel (int channel) const
    {
        return juce::String ("In ") + juce::String (channel + 1);
    }

    virtual juce::String getAudioOutputLabel (int channel) const
    {
        return juce::String ("Out ") + juce::String (channel + 1);
    }

    // Stable ID assigned by the engine when the node is created
    void setLogicalId (juce::uint32 id) { storedLogicalId = id; }
    juce::uint32 getLogicalId() const { return storedLogicalId; }

    /** Bus layout summary used by the engine's topology dump. */
    juce::String getConnectionDiagnostics() const;

    //==============================================================================
    // Default implementations for the pure virtuals to reduce boilerplate
    // in concrete module classes.
    //==============================================================================
    const juce::String getName() const override { return "Module"; }
    bool acceptsMidi() const override { return false; }
    bool producesMidi() const override { return false; }
    double getTailLengthSeconds() const override { return 0.0; }
    juce::AudioProcessorEditor* createEditor() override { return nullptr; }
    bool hasEditor() const override { return false; }
    int getNumPrograms() override { return 1; }
    int getCurrentProgram() override { return 0; }
    void setCurrentProgram (int) override {}
    const juce::String getProgramName (int) override { return {}; }
    void changeProgramName (int, const juce::String&) override {}
    void getStateInformation (juce::MemoryBlock&) override {}
    void setStateInformation (const void*, int) override {}

protected:
    const SampleClock& clock;

    // Thread-safe storage for last known output values
    std::vector<std::unique_ptr<std::atomic<float>>> lastOutputValues;

    juce::uint32 storedLogicalId { 0 };

private:
    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR (ModuleProcessor)
};
