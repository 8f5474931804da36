#include "PhiMath.h"
#include <cmath>

namespace PhiMath
{
    DriveCurve parseDriveCurve (const juce::String& name)
    {
        const auto key = name.trim().toLowerCase();

        if (key == "linear")                        return DriveCurve::linear;
        if (key == "exponential" || key == "exp")   return DriveCurve::exponential;
        if (key == "logarithmic" || key == "log")   return DriveCurve::logarithmic;
        if (key == "s-curve" || key == "scurve")    return DriveCurve::sCurve;
        if (key == "phi")                           return DriveCurve::phi;

        if (key.isNotEmpty())
            juce::Logger::writeToLog ("[PhiMath][WARN] Unknown drive curve '" + name + "', using linear");

        return DriveCurve::linear;
    }

    juce::String getDriveCurveName (DriveCurve curve)
    {
        switch (curve)
        {
            case DriveCurve::linear:      return "linear";
            case DriveCurve::exponential: return "exponential";
            case DriveCurve::logarithmic: return "logarithmic";
            case DriveCurve::sCurve:      return "s-curve";
            case DriveCurve::phi:         return "phi";
        }

        jassertfalse;
        return "linear";
    }

    double mapDriveCurve (DriveCurve curve, double position)
    {
        const double x = std::isfinite (position) ? juce::jlimit (0.0, 1.0, position) : 0.0;

        switch (curve)
        {
            case DriveCurve::linear:      return x;
            case DriveCurve::exponential: return x * x;
            case DriveCurve::logarithmic: return std::log10 (1.0 + 9.0 * x);
            case DriveCurve::sCurve:      return x * x * (3.0 - 2.0 * x);
            case DriveCurve::phi:         return std::pow (x, 1.0 / PHI);
        }

        jassertfalse;
        return x;
    }

    double clampToRange (double value, double low, double high)
    {
        if (low > high)
            std::swap (low, high);

        return juce::jmax (low, juce::jmin (high, value));
    }

    double positiveOr (double value, double fallback)
    {
        return (std::isfinite (value) && value > 0.0) ? value : fallback;
    }

    juce::String formatNumber (double value)
    {
        if (! std::isfinite (value))
            return "N/A";

        if (value == std::floor (value) && std::abs (value) < 1.0e15)
            return juce::String ((juce::int64) value);

        // Up to six decimals, trailing zeros trimmed
        auto text = juce::String (value, 6);
        while (text.endsWithChar ('0'))
            text = text.dropLastCharacters (1);
        if (text.endsWithChar ('.'))
            text = text.dropLastCharacters (1);
        return text;
    }
}
