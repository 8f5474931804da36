#pragma once

#include <algorithm>
#include <memory>
#include <vector>
#include "../audio/graph/SynthEngine.h"

/**
    SynthEngine test double. Nodes are plain objects; every connection,
    release and commit is recorded so tests can inspect the topology a
    mode built and what teardown did to it.
*/
class RecordingSynthEngine : public SynthEngine
{
public:
    struct Connection
    {
        const SynthNode* source { nullptr };
        const SynthNode* destination { nullptr };
        NodeInput input { NodeInput::audio };
    };

    template <typename Base>
    class RecordingNode : public Base
    {
    public:
        explicit RecordingNode (RecordingSynthEngine& ownerToUse) : owner (ownerToUse) {}

        void connect (SynthNode& destination, NodeInput input) override
        {
            jassert (! released);
            owner.connections.push_back ({ this, &destination, input });
        }

        void disconnect() override
        {
            owner.removeConnectionsFrom (this);
        }

        void release() noexcept override
        {
            if (released)
                return;

            released = true;
            aboutToRelease();
            owner.removeConnectionsFrom (this);
            owner.removeConnectionsInto (this);
            ++owner.numReleased;
        }

        bool isReleased() const noexcept override { return released; }

    protected:
        virtual void aboutToRelease() {}

        RecordingSynthEngine& owner;
        bool released { false };
    };

    class Oscillator : public RecordingNode<OscillatorNode>
    {
    public:
        using RecordingNode::RecordingNode;

        ParamAutomation& frequency() override { return frequencyLane; }

        void start (double when) override { startTime = when; }
        void stop (double when) override { stopTime = when; }
        bool hasStarted() const override { return startTime >= 0.0; }

        double startTime { -1.0 };
        double stopTime { -1.0 };

    private:
        void aboutToRelease() override
        {
            if (hasStarted())
                stop (owner.getCurrentTime());
        }

        ParamAutomation frequencyLane { 440.0f };
    };

    class Gain : public RecordingNode<GainNode>
    {
    public:
        using RecordingNode::RecordingNode;

        ParamAutomation& gain() override { return gainLane; }

    private:
        ParamAutomation gainLane { 1.0f };
    };

    class OutputStage : public RecordingNode<SynthNode>
    {
    public:
        using RecordingNode::RecordingNode;
    };

    RecordingSynthEngine() : outputStage (*this) {}

    //==============================================================================
    double getCurrentTime() const override { return currentTime; }
    bool hasOutputStage() const override { return outputStagePresent; }
    SynthNode& getOutputStage() override { return outputStage; }
    void ensureProcessingChain() override { ++numEnsureCalls; }
    void commitChanges() override { ++numCommits; }

    std::shared_ptr<OscillatorNode> createOscillator() override
    {
        auto node = std::make_shared<Oscillator> (*this);
        oscillators.push_back (node);
        ++numCreated;
        return node;
    }

    std::shared_ptr<GainNode> createGain() override
    {
        auto node = std::make_shared<Gain> (*this);
        gains.push_back (node);
        ++numCreated;
        return node;
    }

    //==============================================================================
    int getNumLiveNodes() const { return numCreated - numReleased; }

    int countLive (const std::vector<std::weak_ptr<Oscillator>>& list) const
    {
        return (int) std::count_if (list.begin(), list.end(), [] (const std::weak_ptr<Oscillator>& w)
        {
            auto node = w.lock();
            return node != nullptr && ! node->isReleased();
        });
    }

    int getNumLiveOscillators() const { return countLive (oscillators); }

    bool isConnected (const SynthNode& source, const SynthNode& destination, NodeInput input) const
    {
        return std::any_of (connections.begin(), connections.end(), [&] (const Connection& c)
        {
            return c.source == &source && c.destination == &destination && c.input == input;
        });
    }

    int countConnectionsInto (const SynthNode& destination, NodeInput input) const
    {
        return (int) std::count_if (connections.begin(), connections.end(), [&] (const Connection& c)
        {
            return c.destination == &destination && c.input == input;
        });
    }

    void removeConnectionsFrom (const SynthNode* node)
    {
        connections.erase (std::remove_if (connections.begin(), connections.end(),
                                           [node] (const Connection& c) { return c.source == node; }),
                           connections.end());
    }

    void removeConnectionsInto (const SynthNode* node)
    {
        connections.erase (std::remove_if (connections.begin(), connections.end(),
                                           [node] (const Connection& c) { return c.destination == node; }),
                           connections.end());
    }

    double currentTime { 0.0 };
    bool outputStagePresent { true };
    int numCommits { 0 };
    int numEnsureCalls { 0 };
    int numCreated { 0 };
    int numReleased { 0 };

    OutputStage outputStage;
    std::vector<Connection> connections;
    std::vector<std::weak_ptr<Oscillator>> oscillators;
    std::vector<std::weak_ptr<Gain>> gains;
};
