#include "PhiEnvelope.h"
#include "../../config/PhiConfig.h"

namespace PhiEnvelope
{
    EnvelopeSpec compute (double durationSeconds, DriveCurve curve, double scale, double startTime)
    {
        EnvelopeSpec spec;
        spec.duration = PhiMath::positiveOr (durationSeconds, PhiConfig::kDefaultDurationSeconds);
        spec.attack = juce::jlimit (PhiConfig::kMinAttackSeconds,
                                    PhiConfig::kMaxAttackSeconds,
                                    spec.duration * PhiConfig::kAttackFraction);
        spec.sustainTime = juce::jmax (spec.duration - 2.0 * spec.attack, 0.0);

        spec.peakLevel = PhiMath::mapDriveCurve (curve, 1.0) * scale;
        spec.sustainLevel = PhiMath::mapDriveCurve (curve, 0.5) * scale;

        spec.start = startTime;
        spec.attackEnd = startTime + spec.attack;
        spec.sustainEnd = spec.attackEnd + spec.sustainTime;
        spec.releaseEnd = startTime + spec.duration;
        return spec;
    }

    EnvelopeSpec apply (GainNode& node, double durationSeconds, DriveCurve curve,
                        double nowTime, const SynthEngine& clock)
    {
        const double start = juce::jmax (nowTime, clock.getCurrentTime());
        const auto spec = compute (durationSeconds, curve, node.getEnvelopeScale(), start);

        auto& gain = node.gain();
        gain.cancelScheduledValues (spec.start);
        gain.setValueAtTime (0.0f, spec.start);
        gain.linearRampToValueAtTime ((float) spec.peakLevel, spec.attackEnd);

        if (spec.sustainTime > 0.0)
            gain.linearRampToValueAtTime ((float) spec.sustainLevel, spec.sustainEnd);

        gain.linearRampToValueAtTime (0.0f, spec.releaseEnd);
        return spec;
    }
}
