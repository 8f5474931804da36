#pragma once

#include <juce_core/juce_core.h>

/** Golden ratio (1 + sqrt 5) / 2 */
inline constexpr double PHI = 1.6180339887498948482;

/**
    Named amplitude shaping curves. Every curve maps [0, 1] onto [0, 1],
    is monotonically increasing and passes through (0, 0) and (1, 1).
*/
enum class DriveCurve
{
    linear,
    exponential,
    logarithmic,
    sCurve,
    phi
};

namespace PhiMath
{
    /** Parses a curve name case-insensitively ("s-curve" and "scurve" both
        name the S curve). Unknown names log a warning and give linear.
    */
    DriveCurve parseDriveCurve (const juce::String& name);

    juce::String getDriveCurveName (DriveCurve curve);

    /** Evaluates a curve; the position is clamped into [0, 1] first. */
    double mapDriveCurve (DriveCurve curve, double position);

    /** Clamps value into [low, high]. Bounds given in the wrong order are
        swapped, values never wrap.
    */
    double clampToRange (double value, double low, double high);

    /** Returns value if it is finite and strictly positive, fallback otherwise. */
    double positiveOr (double value, double fallback);

    /** Formats a number the short way: "220", "2.5", "355.9". */
    juce::String formatNumber (double value);
}
