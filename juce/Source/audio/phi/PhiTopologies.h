#pragma once

#include <juce_core/juce_core.h>
#include <optional>
#include <vector>
#include "PhiMath.h"
#include "SynthParams.h"
#include "PhiNodeRegistry.h"
#include "../graph/SynthEngine.h"

enum class PhiMode
{
    tone,
    am,
    fm,
    intervalStack,
    harmonicStack
};

/** One generator with its envelope stage. */
struct PhiVoice
{
    double frequency { 0.0 };
    float amplitudeScale { 0.0f };
    std::shared_ptr<OscillatorNode> oscillator;
    std::shared_ptr<GainNode> envelopeGain;
};

/** What a builder produced. */
struct PhiBuildResult
{
    double runDuration { 0.0 };
    std::vector<PhiVoice> voices;
};

/** Everything a builder needs to wire voices into the engine. */
struct PhiBuildContext
{
    SynthEngine& engine;
    PhiNodeRegistry& registry;
    double now { 0.0 };
};

using PhiTopologyBuilder = PhiBuildResult (*) (const SynthParams&, PhiBuildContext&);

/** A row of the mode table. */
struct PhiModeInfo
{
    PhiMode mode;
    const char* id;
    const char* label;               // UTF-8
    double defaultRangeMultiplier;   // default range is [base, base * multiplier]
    int numGenerators;               // oscillators a run of this mode registers
    PhiTopologyBuilder build;
};

namespace PhiTopologies
{
    const std::vector<PhiModeInfo>& getModeTable();

    /** Exact id match first, then case-insensitive. */
    const PhiModeInfo* findMode (const juce::String& modeId);
    const PhiModeInfo& getModeInfo (PhiMode mode);

    juce::String getLabel (PhiMode mode);

    /** Builder parameters after defaults have been substituted. */
    struct Resolved
    {
        double base { 0.0 };
        FrequencyRange range;
        double duration { 0.0 };
        DriveCurve curve { DriveCurve::linear };
    };

    Resolved resolve (const SynthParams& params, double defaultRangeMultiplier);

    PhiBuildResult buildTone (const SynthParams& params, PhiBuildContext& context);
    PhiBuildResult buildAm (const SynthParams& params, PhiBuildContext& context);
    PhiBuildResult buildFm (const SynthParams& params, PhiBuildContext& context);
    PhiBuildResult buildIntervalStack (const SynthParams& params, PhiBuildContext& context);
    PhiBuildResult buildHarmonicStack (const SynthParams& params, PhiBuildContext& context);
}
