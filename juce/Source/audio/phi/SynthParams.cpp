#include "SynthParams.h"
#include "PhiMath.h"
#include <cmath>

bool FrequencyRange::isFinite() const
{
    return std::isfinite (low) && std::isfinite (high);
}

juce::String FrequencyRange::toString() const
{
    return PhiMath::formatNumber (low) + "-" + PhiMath::formatNumber (high);
}

std::optional<FrequencyRange> FrequencyRange::fromString (const juce::String& text)
{
    const auto trimmed = text.trim();
    const int split = trimmed.indexOfChar (1, '-');
    if (split <= 0)
        return std::nullopt;

    const auto lowText = trimmed.substring (0, split).trim();
    const auto highText = trimmed.substring (split + 1).trim();
    if (! lowText.containsOnly ("0123456789.") || ! highText.containsOnly ("0123456789."))
        return std::nullopt;

    FrequencyRange range { lowText.getDoubleValue(), highText.getDoubleValue() };
    if (range.low <= 0.0 || range.high <= 0.0)
        return std::nullopt;

    return range;
}

juce::var SynthParams::toVar() const
{
    auto* object = new juce::DynamicObject();
    object->setProperty ("baseFreq", baseFreq);
    object->setProperty ("duration", duration);
    object->setProperty ("driveCurve", driveCurve);

    if (freqRange.has_value())
    {
        juce::Array<juce::var> range;
        range.add (freqRange->low);
        range.add (freqRange->high);
        object->setProperty ("freqRange", range);
    }
    else
    {
        object->setProperty ("freqRange", juce::var());
    }

    return juce::var (object);
}
