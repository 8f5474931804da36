#pragma once

#include <juce_core/juce_core.h>
#include <optional>
#include "../../config/PhiConfig.h"

struct FrequencyRange
{
    double low { 0.0 };
    double high { 0.0 };

    bool isFinite() const;

    /** "lo-hi", e.g. "220-440". */
    juce::String toString() const;

    /** Parses "lo-hi"; both bounds must be positive numbers. */
    static std::optional<FrequencyRange> fromString (const juce::String& text);
};

/** The parameters one synthesis run is built from. */
struct SynthParams
{
    double baseFreq { PhiConfig::kDefaultBaseFrequency };
    double duration { PhiConfig::kDefaultDurationSeconds };
    juce::String driveCurve { PhiConfig::kDefaultDriveCurve };
    std::optional<FrequencyRange> freqRange;

    /** Object form used for diagnostics and the parameter state snapshot. */
    juce::var toVar() const;
};
