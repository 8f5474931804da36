#include "GraphSynthEngine.h"
#include "../modules/SineOscillatorModuleProcessor.h"
#include "../modules/AutomatedGainModuleProcessor.h"
#include "../modules/LowShelfModuleProcessor.h"
#include "../../config/PhiConfig.h"

namespace
{
    using NodeID = GraphSynthEngine::NodeID;

    // Implemented by every handle that can be the destination of a connection
    class GraphNodeTarget
    {
    public:
        virtual ~GraphNodeTarget() = default;
        virtual NodeID getNodeID() const = 0;
        virtual int getInputChannel (NodeInput input) const = 0;
    };

    juce::String describeInput (NodeInput input)
    {
        switch (input)
        {
            case NodeInput::audio:     return "audio";
            case NodeInput::frequency: return "frequency";
            case NodeInput::gain:      return "gain";
        }
        return "unknown";
    }

    template <typename Base>
    class GraphNodeHandle : public Base,
                            public GraphNodeTarget
    {
    public:
        GraphNodeHandle (GraphSynthEngine& owner, GraphSynthEngine::Node::Ptr nodeToUse)
            : engine (&owner), node (std::move (nodeToUse)) {}

        NodeID getNodeID() const override { return node->nodeID; }

        void connect (SynthNode& destination, NodeInput input) override
        {
            auto* owner = engine.get();
            auto* target = dynamic_cast<GraphNodeTarget*> (&destination);
            const int destChannel = target != nullptr ? target->getInputChannel (input) : -1;

            if (owner == nullptr || released || destChannel < 0)
            {
                juce::Logger::writeToLog ("[GraphEngine][WARN] Rejected connection from node " + juce::String (node->nodeID.uid)
                                          + " to a " + describeInput (input) + " input");
                jassertfalse;
                return;
            }

            const bool ok = owner->connect (node->nodeID, 0, target->getNodeID(), destChannel);
            jassert (ok);
            juce::ignoreUnused (ok);
        }

        void disconnect() override
        {
            if (auto* owner = engine.get())
                if (! released)
                    owner->disconnectOutgoing (node->nodeID);
        }

        void release() noexcept override
        {
            if (released)
                return;

            released = true;
            aboutToRelease();

            if (auto* owner = engine.get())
            {
                owner->disconnectOutgoing (node->nodeID);
                owner->removeModule (node->nodeID);
            }
        }

        bool isReleased() const noexcept override { return released; }

    protected:
        virtual void aboutToRelease() {}

        juce::WeakReference<GraphSynthEngine> engine;
        GraphSynthEngine::Node::Ptr node;   // keeps the processor alive after removal
        bool released { false };
    };

    class GraphOscillatorHandle : public GraphNodeHandle<OscillatorNode>
    {
    public:
        GraphOscillatorHandle (GraphSynthEngine& owner, GraphSynthEngine::Node::Ptr nodeToUse, SineOscillatorModuleProcessor& proc)
            : GraphNodeHandle (owner, std::move (nodeToUse)), processor (proc) {}

        ParamAutomation& frequency() override { return processor.getFrequencyAutomation(); }

        void start (double when) override { processor.scheduleStart (when); }
        void stop (double when) override { processor.scheduleStop (when); }
        bool hasStarted() const override { return processor.hasStartScheduled(); }

        int getInputChannel (NodeInput input) const override
        {
            return input == NodeInput::frequency ? 0 : -1;
        }

    private:
        void aboutToRelease() override
        {
            if (hasStarted())
                processor.scheduleStop (0.0);
        }

        SineOscillatorModuleProcessor& processor;
    };

    class GraphGainHandle : public GraphNodeHandle<GainNode>
    {
    public:
        GraphGainHandle (GraphSynthEngine& owner, GraphSynthEngine::Node::Ptr nodeToUse, AutomatedGainModuleProcessor& proc)
            : GraphNodeHandle (owner, std::move (nodeToUse)), processor (proc) {}

        ParamAutomation& gain() override { return processor.getGainAutomation(); }

        int getInputChannel (NodeInput input) const override
        {
            switch (input)
            {
                case NodeInput::audio: return 0;
                case NodeInput::gain:  return 1;
                case NodeInput::frequency: break;
            }
            return -1;
        }

    private:
        AutomatedGainModuleProcessor& processor;
    };

    // Owned by the engine for its whole life; voices only ever connect into it
    class OutputStageHandle : public GraphNodeHandle<SynthNode>
    {
    public:
        using GraphNodeHandle::GraphNodeHandle;

        int getInputChannel (NodeInput input) const override
        {
            return input == NodeInput::audio ? 0 : -1;
        }

        void release() noexcept override {}
    };
}

GraphSynthEngine::GraphSynthEngine()
    : juce::AudioProcessor (BusesProperties()
                            .withOutput ("Output", juce::AudioChannelSet::stereo(), true))
{
    internalGraph = std::make_unique<juce::AudioProcessorGraph>();

    // The output node takes its channel count from the graph when it is added
    internalGraph->setPlayConfigDetails (0, 2, PhiConfig::kFallbackSampleRate, PhiConfig::kFallbackBlockSize);

    using IOProcessor = juce::AudioProcessorGraph::AudioGraphIOProcessor;
    audioOutputNode = internalGraph->addNode (std::make_unique<IOProcessor> (IOProcessor::audioOutputNode));

    lowShelfNode = internalGraph->addNode (std::make_unique<LowShelfModuleProcessor> (clock));
    outputStage = std::make_unique<OutputStageHandle> (*this, lowShelfNode);

    ensureProcessingChain();
    internalGraph->rebuild();
    juce::Logger::writeToLog ("[GraphEngine] Initialized output stage with nodeID: " + juce::String (lowShelfNode->nodeID.uid));
}

GraphSynthEngine::~GraphSynthEngine()
{
    masterReference.clear();
    outputStage.reset();
    modules.clear();
}

void GraphSynthEngine::prepareToPlay (double sampleRate, int samplesPerBlock)
{
    clock.sampleRate.store (sampleRate);
    internalGraph->setPlayConfigDetails (getTotalNumInputChannels(), getTotalNumOutputChannels(), sampleRate, samplesPerBlock);
    internalGraph->prepareToPlay (sampleRate, samplesPerBlock);
    prepared.store (true);

    juce::Logger::writeToLog ("[GraphEngine] Prepared at " + juce::String (sampleRate, 0) + " Hz, block " + juce::String (samplesPerBlock));
}

void GraphSynthEngine::releaseResources()
{
    prepared.store (false);
    internalGraph->releaseResources();
}

void GraphSynthEngine::processBlock (juce::AudioBuffer<float>& buffer, juce::MidiBuffer& midiMessages)
{
    const juce::ScopedNoDenormals noDenormals;

    buffer.clear();
    internalGraph->processBlock (buffer, midiMessages);

    // Modules stamped this block against the old position
    clock.advance (buffer.getNumSamples());
}

double GraphSynthEngine::getCurrentTime() const
{
    return clock.getTimeSeconds();
}

bool GraphSynthEngine::hasOutputStage() const
{
    return prepared.load() && lowShelfNode != nullptr;
}

SynthNode& GraphSynthEngine::getOutputStage()
{
    jassert (outputStage != nullptr);
    return *outputStage;
}

void GraphSynthEngine::ensureProcessingChain()
{
    if (lowShelfNode == nullptr || audioOutputNode == nullptr)
        return;

    for (int channel = 0; channel < 2; ++channel)
    {
        if (! isConnected (lowShelfNode->nodeID, audioOutputNode->nodeID, channel))
        {
            if (connect (lowShelfNode->nodeID, channel, audioOutputNode->nodeID, channel))
                juce::Logger::writeToLog ("[GraphEngine] Linked output stage channel " + juce::String (channel) + " to device");
        }
    }
}

std::shared_ptr<OscillatorNode> GraphSynthEngine::createOscillator()
{
    auto processor = std::make_unique<SineOscillatorModuleProcessor> (clock);
    auto& oscillator = *processor;
    auto node = addModuleNode (std::move (processor));
    return std::make_shared<GraphOscillatorHandle> (*this, node, oscillator);
}

std::shared_ptr<GainNode> GraphSynthEngine::createGain()
{
    auto processor = std::make_unique<AutomatedGainModuleProcessor> (clock);
    auto& gain = *processor;
    auto node = addModuleNode (std::move (processor));
    return std::make_shared<GraphGainHandle> (*this, node, gain);
}

GraphSynthEngine::Node::Ptr GraphSynthEngine::addModuleNode (std::unique_ptr<ModuleProcessor> processor)
{
    const juce::ScopedLock lock (moduleLock);

    processor->setLogicalId (nextLogicalId++);
    auto node = internalGraph->addNode (std::move (processor), {}, juce::AudioProcessorGraph::UpdateKind::none);
    jassert (node != nullptr);

    modules[(juce::uint32) node->nodeID.uid] = node;
    return node;
}

void GraphSynthEngine::commitChanges()
{
    const juce::ScopedLock lock (moduleLock);
    internalGraph->rebuild();

    juce::Logger::writeToLog ("[GraphEngine] Committed topology: " + juce::String ((int) modules.size()) + " modules, "
                              + juce::String (getNumConnections()) + " connections");
}

bool GraphSynthEngine::connect (const NodeID& sourceNodeID, int sourceChannel, const NodeID& destNodeID, int destChannel)
{
    const juce::ScopedLock lock (moduleLock);

    for (const auto& existing : internalGraph->getConnections())
    {
        if (existing.source.nodeID == sourceNodeID
            && existing.source.channelIndex == sourceChannel
            && existing.destination.nodeID == destNodeID
            && existing.destination.channelIndex == destChannel)
            return true;
    }

    juce::AudioProcessorGraph::Connection connection {
        { sourceNodeID, sourceChannel },
        { destNodeID, destChannel }
    };

    const bool ok = internalGraph->addConnection (connection, juce::AudioProcessorGraph::UpdateKind::none);
    if (! ok)
    {
        juce::Logger::writeToLog ("[GraphEngine][WARN] Failed to connect [" + juce::String (sourceNodeID.uid) + ":" + juce::String (sourceChannel)
                                  + "] -> [" + juce::String (destNodeID.uid) + ":" + juce::String (destChannel) + "]");
    }
    return ok;
}

void GraphSynthEngine::disconnectOutgoing (const NodeID& sourceNodeID)
{
    const juce::ScopedLock lock (moduleLock);

    for (const auto& connection : internalGraph->getConnections())
        if (connection.source.nodeID == sourceNodeID)
            internalGraph->removeConnection (connection, juce::AudioProcessorGraph::UpdateKind::none);
}

void GraphSynthEngine::removeModule (const NodeID& nodeID)
{
    if (nodeID.uid == 0)
        return;

    const juce::ScopedLock lock (moduleLock);

    // The output stage belongs to the engine
    if (lowShelfNode != nullptr && nodeID == lowShelfNode->nodeID)
        return;

    internalGraph->removeNode (nodeID, juce::AudioProcessorGraph::UpdateKind::none);
    modules.erase ((juce::uint32) nodeID.uid);
}

int GraphSynthEngine::getNumModules() const
{
    const juce::ScopedLock lock (moduleLock);
    return (int) modules.size();
}

int GraphSynthEngine::getNumConnections() const
{
    return (int) internalGraph->getConnections().size();
}

bool GraphSynthEngine::isConnected (const NodeID& sourceNodeID, const NodeID& destNodeID, int destChannel) const
{
    for (const auto& connection : internalGraph->getConnections())
        if (connection.source.nodeID == sourceNodeID
            && connection.destination.nodeID == destNodeID
            && connection.destination.channelIndex == destChannel)
            return true;

    return false;
}

ModuleProcessor* GraphSynthEngine::getModuleForNode (const NodeID& nodeID) const
{
    const juce::ScopedLock lock (moduleLock);

    auto it = modules.find ((juce::uint32) nodeID.uid);
    if (it == modules.end())
        return nullptr;

    return dynamic_cast<ModuleProcessor*> (it->second->getProcessor());
}

LowShelfModuleProcessor* GraphSynthEngine::getOutputStageProcessor() const
{
    return lowShelfNode != nullptr ? dynamic_cast<LowShelfModuleProcessor*> (lowShelfNode->getProcessor()) : nullptr;
}

juce::String GraphSynthEngine::getConnectionDiagnostics() const
{
    juce::String result = "=== GRAPH CONNECTIONS ===\n";

    for (const auto& connection : internalGraph->getConnections())
    {
        auto describe = [this] (NodeID id) -> juce::String
        {
            if (audioOutputNode != nullptr && id == audioOutputNode->nodeID)
                return "output";
            if (auto* node = internalGraph->getNodeForId (id))
                return node->getProcessor()->getName() + "#" + juce::String (id.uid);
            return "?#" + juce::String (id.uid);
        };

        result << describe (connection.source.nodeID) << ":" << connection.source.channelIndex
               << " -> " << describe (connection.destination.nodeID) << ":" << connection.destination.channelIndex << "\n";
    }

    return result;
}

void GraphSynthEngine::logGraphTopology() const
{
    juce::Logger::writeToLog ("=== PHI GRAPH TOPOLOGY ===");

    {
        const juce::ScopedLock lock (moduleLock);
        for (const auto& kv : modules)
            if (auto* module = dynamic_cast<ModuleProcessor*> (kv.second->getProcessor()))
                juce::Logger::writeToLog (module->getConnectionDiagnostics().trimEnd());
    }

    if (auto* shelf = getOutputStageProcessor())
        juce::Logger::writeToLog (shelf->getConnectionDiagnostics().trimEnd());

    juce::Logger::writeToLog (getConnectionDiagnostics().trimEnd());
}
