#pragma once

#include <memory>
#include <vector>
#include "../graph/SynthEngine.h"

/**
    Every node created by the current synthesis run, in creation order.

    Generators and auxiliary nodes (gains) are tracked separately so teardown
    can silence the generators before the rest of the chain goes away.
*/
class PhiNodeRegistry
{
public:
    PhiNodeRegistry() = default;
    ~PhiNodeRegistry();

    /** Appends the oscillator and hands it back, for inline construction. */
    std::shared_ptr<OscillatorNode> registerOscillator (std::shared_ptr<OscillatorNode> oscillator);

    template <typename NodeType>
    std::shared_ptr<NodeType> registerAuxNode (std::shared_ptr<NodeType> node)
    {
        jassert (node != nullptr);
        auxNodes.push_back (node);
        return node;
    }

    /** Releases all generators, then all auxiliary nodes, and forgets them. */
    void releaseAll() noexcept;

    int getNumOscillators() const { return (int) oscillators.size(); }
    int getNumAuxNodes() const { return (int) auxNodes.size(); }
    bool isEmpty() const { return oscillators.empty() && auxNodes.empty(); }

private:
    std::vector<std::shared_ptr<OscillatorNode>> oscillators;
    std::vector<std::shared_ptr<SynthNode>> auxNodes;

    JUCE_DECLARE_NON_COPYABLE (PhiNodeRegistry)
};
