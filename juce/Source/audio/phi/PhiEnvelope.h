#pragma once

#include "PhiMath.h"
#include "../graph/SynthEngine.h"

/** The breakpoints of one attack/sustain/release envelope, in engine seconds. */
struct EnvelopeSpec
{
    double duration { 0.0 };
    double attack { 0.0 };
    double sustainTime { 0.0 };
    double peakLevel { 0.0 };
    double sustainLevel { 0.0 };

    double start { 0.0 };
    double attackEnd { 0.0 };
    double sustainEnd { 0.0 };
    double releaseEnd { 0.0 };
};

namespace PhiEnvelope
{
    /**
        Computes the envelope for a run.

        @param durationSeconds  run length; non-finite or non-positive values give 3 s
        @param curve            shapes the peak (curve at 1) and sustain (curve at 0.5) levels
        @param scale            per-voice amplitude multiplier
        @param startTime        when the attack begins
    */
    EnvelopeSpec compute (double durationSeconds, DriveCurve curve, double scale, double startTime);

    /**
        Schedules the envelope on the node's gain, scaled by its envelope scale.

        Anything already scheduled from the start time onward is cancelled,
        so applying twice leaves only the second envelope. The start is never
        earlier than the engine's current time.

        @returns the envelope that was scheduled
    */
    EnvelopeSpec apply (GainNode& node, double durationSeconds, DriveCurve curve,
                        double nowTime, const SynthEngine& clock);
}
