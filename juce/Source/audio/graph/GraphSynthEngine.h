#pragma once

#include <juce_audio_processors/juce_audio_processors.h>
#include <atomic>
#include <map>
#include <memory>
#include "SynthEngine.h"
#include "../modules/ModuleProcessor.h"

class LowShelfModuleProcessor;

/**
    SynthEngine backed by a juce::AudioProcessorGraph.

    Voices are module nodes inside the internal graph; every voice ends in
    the low-shelf output stage, which feeds the graph's stereo output.
    Mutations are batched with UpdateKind::none and take effect on
    commitChanges().
*/
class GraphSynthEngine : public juce::AudioProcessor,
                         public SynthEngine
{
public:
    using Node = juce::AudioProcessorGraph::Node;
    using NodeID = juce::AudioProcessorGraph::NodeID;

    GraphSynthEngine();
    ~GraphSynthEngine() override;

    //==============================================================================
    void prepareToPlay (double sampleRate, int samplesPerBlock) override;
    void releaseResources() override;
    void processBlock (juce::AudioBuffer<float>&, juce::MidiBuffer&) override;

    const juce::String getName() const override { return "Phi Synth Engine"; }
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

    //==============================================================================
    double getCurrentTime() const override;
    bool hasOutputStage() const override;
    SynthNode& getOutputStage() override;
    void ensureProcessingChain() override;
    std::shared_ptr<OscillatorNode> createOscillator() override;
    std::shared_ptr<GainNode> createGain() override;
    void commitChanges() override;

    //==============================================================================
    // Graph plumbing used by the node handles
    bool connect (const NodeID& sourceNodeID, int sourceChannel, const NodeID& destNodeID, int destChannel);
    void disconnectOutgoing (const NodeID& sourceNodeID);
    void removeModule (const NodeID& nodeID);

    // Introspection
    int getNumModules() const;
    int getNumConnections() const;
    bool isConnected (const NodeID& sourceNodeID, const NodeID& destNodeID, int destChannel) const;
    ModuleProcessor* getModuleForNode (const NodeID& nodeID) const;
    NodeID getOutputStageNodeID() const { return lowShelfNode != nullptr ? lowShelfNode->nodeID : NodeID{}; }
    NodeID getOutputNodeID() const { return audioOutputNode != nullptr ? audioOutputNode->nodeID : NodeID{}; }
    LowShelfModuleProcessor* getOutputStageProcessor() const;
    juce::String getConnectionDiagnostics() const;
    void logGraphTopology() const;

private:
    Node::Ptr addModuleNode (std::unique_ptr<ModuleProcessor> processor);

    // The internal graph holding every voice
    std::unique_ptr<juce::AudioProcessorGraph> internalGraph;

    Node::Ptr audioOutputNode;
    Node::Ptr lowShelfNode;
    std::unique_ptr<SynthNode> outputStage;

    SampleClock clock;
    std::atomic<bool> prepared { false };

    mutable juce::CriticalSection moduleLock;
    std::map<juce::uint32, Node::Ptr> modules; // keyed by NodeID.uid
    juce::uint32 nextLogicalId { 1 };

    JUCE_DECLARE_WEAK_REFERENCEABLE (GraphSynthEngine)
    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR (GraphSynthEngine)
};
