#include "PhiNodeRegistry.h"

PhiNodeRegistry::~PhiNodeRegistry()
{
    releaseAll();
}

std::shared_ptr<OscillatorNode> PhiNodeRegistry::registerOscillator (std::shared_ptr<OscillatorNode> oscillator)
{
    jassert (oscillator != nullptr);
    oscillators.push_back (oscillator);
    return oscillator;
}

void PhiNodeRegistry::releaseAll() noexcept
{
    for (auto& oscillator : oscillators)
        if (oscillator != nullptr)
            oscillator->release();

    for (auto& node : auxNodes)
        if (node != nullptr)
            node->release();

    oscillators.clear();
    auxNodes.clear();
}
