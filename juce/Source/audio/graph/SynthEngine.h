#pragma once

#include <juce_core/juce_core.h>
#include <memory>
#include "ParamAutomation.h"

/** Which input of a destination node a connection feeds. */
enum class NodeInput
{
    audio,      // the signal path
    frequency,  // summed onto an oscillator's frequency, in Hz
    gain        // summed onto a gain node's gain
};

/**
    A handle to one node owned by a SynthEngine.

    release() stops the node if it can be stopped, drops its connections and
    removes it from the engine. It is idempotent: releasing twice, or
    releasing a generator that never started, does nothing.
*/
class SynthNode
{
public:
    virtual ~SynthNode() = default;

    virtual void connect (SynthNode& destination, NodeInput input = NodeInput::audio) = 0;

    /** Removes every outgoing connection of this node. */
    virtual void disconnect() = 0;

    virtual void release() noexcept = 0;
    virtual bool isReleased() const noexcept = 0;
};

/** A sine generator with a schedulable frequency. */
class OscillatorNode : public SynthNode
{
public:
    virtual ParamAutomation& frequency() = 0;

    virtual void start (double when) = 0;
    virtual void stop (double when) = 0;
    virtual bool hasStarted() const = 0;
};

/** An amplitude stage: output = input * gain. */
class GainNode : public SynthNode
{
public:
    virtual ParamAutomation& gain() = 0;

    /** Per-voice amplitude applied when an envelope is scheduled on this node. */
    void setEnvelopeScale (float newScale) { envelopeScale = newScale; }
    float getEnvelopeScale() const { return envelopeScale; }

private:
    float envelopeScale { 1.0f };
};

/**
    The rendering engine the synthesis modes build their voices in.

    Mutations are batched: node creation and connections take effect on the
    renderer after commitChanges().
*/
class SynthEngine
{
public:
    virtual ~SynthEngine() = default;

    /** Seconds of audio rendered so far. */
    virtual double getCurrentTime() const = 0;

    /** True once the output stage every voice feeds into exists. */
    virtual bool hasOutputStage() const = 0;
    virtual SynthNode& getOutputStage() = 0;

    /** Restores any missing link between the output stage and the device. */
    virtual void ensureProcessingChain() = 0;

    virtual std::shared_ptr<OscillatorNode> createOscillator() = 0;
    virtual std::shared_ptr<GainNode> createGain() = 0;

    virtual void commitChanges() = 0;
};
