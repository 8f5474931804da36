#include "PhiTopologies.h"
#include "PhiEnvelope.h"
#include <cmath>

namespace
{
    std::shared_ptr<OscillatorNode> createSine (PhiBuildContext& context, double frequency)
    {
        auto oscillator = context.registry.registerOscillator (context.engine.createOscillator());
        oscillator->frequency().setValueAtTime ((float) frequency, context.now);
        return oscillator;
    }

    std::shared_ptr<GainNode> createEnvelopeGain (PhiBuildContext& context,
                                                  const PhiTopologies::Resolved& resolved,
                                                  float scale)
    {
        auto gain = context.registry.registerAuxNode (context.engine.createGain());
        gain->setEnvelopeScale (scale);
        PhiEnvelope::apply (*gain, resolved.duration, resolved.curve, context.now, context.engine);
        return gain;
    }

    std::shared_ptr<GainNode> createDepthGain (PhiBuildContext& context, double depth)
    {
        auto gain = context.registry.registerAuxNode (context.engine.createGain());
        gain->gain().setValueAtTime ((float) depth, context.now);
        return gain;
    }

    // osc -> envelope gain -> output stage, started at now
    PhiVoice createEnvelopedVoice (PhiBuildContext& context,
                                   const PhiTopologies::Resolved& resolved,
                                   double frequency,
                                   float scale)
    {
        PhiVoice voice;
        voice.frequency = frequency;
        voice.amplitudeScale = scale;
        voice.oscillator = createSine (context, frequency);
        voice.envelopeGain = createEnvelopeGain (context, resolved, scale);

        voice.oscillator->connect (*voice.envelopeGain);
        voice.envelopeGain->connect (context.engine.getOutputStage());
        voice.oscillator->start (context.now);
        return voice;
    }

    /** Shared by AM and FM: a modulator summed onto the carrier's frequency. */
    PhiBuildResult buildModulatedPair (const PhiTopologies::Resolved& resolved,
                                       PhiBuildContext& context,
                                       double modulatorRatio,
                                       double carrierCurvePosition,
                                       double depthCurvePosition,
                                       double depthFactor,
                                       bool depthFollowsModulator)
    {
        const double carrierFreq = PhiMath::clampToRange (resolved.base, resolved.range.low, resolved.range.high);
        const double modFreq = PhiMath::clampToRange (resolved.base * modulatorRatio, resolved.range.low, resolved.range.high);

        PhiVoice carrier;
        carrier.frequency = carrierFreq;
        carrier.amplitudeScale = (float) (PhiMath::mapDriveCurve (resolved.curve, carrierCurvePosition) * 0.6);
        carrier.oscillator = createSine (context, carrierFreq);

        auto modulator = createSine (context, modFreq);

        carrier.envelopeGain = createEnvelopeGain (context, resolved, carrier.amplitudeScale);

        const double depth = PhiMath::mapDriveCurve (resolved.curve, depthCurvePosition)
                               * (depthFollowsModulator ? modFreq : carrierFreq)
                               * depthFactor;
        auto depthGain = createDepthGain (context, depth);

        modulator->connect (*depthGain);
        depthGain->connect (*carrier.oscillator, NodeInput::frequency);

        carrier.oscillator->connect (*carrier.envelopeGain);
        carrier.envelopeGain->connect (context.engine.getOutputStage());

        carrier.oscillator->start (context.now);
        modulator->start (context.now);

        // The modulator's gain stage is its depth gain, scaled by the depth curve
        PhiVoice modulatorVoice;
        modulatorVoice.frequency = modFreq;
        modulatorVoice.amplitudeScale = (float) PhiMath::mapDriveCurve (resolved.curve, depthCurvePosition);
        modulatorVoice.oscillator = modulator;
        modulatorVoice.envelopeGain = depthGain;

        PhiBuildResult result;
        result.runDuration = resolved.duration;
        result.voices.push_back (carrier);
        result.voices.push_back (modulatorVoice);
        return result;
    }
}

namespace PhiTopologies
{
    const std::vector<PhiModeInfo>& getModeTable()
    {
        static const std::vector<PhiModeInfo> table
        {
            { PhiMode::tone,          "phi_tone",     "\xce\xa6 Tone",           PHI,             1, &buildTone },
            { PhiMode::am,            "phi_AM",       "\xce\xa6 AM",             PHI,             2, &buildAm },
            { PhiMode::fm,            "phi_FM",       "\xce\xa6 FM",             PHI,             2, &buildFm },
            { PhiMode::intervalStack, "phi_interval", "\xce\xa6 Interval Stack", PHI * PHI * PHI, 4, &buildIntervalStack },
            { PhiMode::harmonicStack, "phi_harmonic", "\xce\xa6 Harmonic",       8.0,             8, &buildHarmonicStack },
        };
        return table;
    }

    const PhiModeInfo* findMode (const juce::String& modeId)
    {
        const auto& table = getModeTable();

        for (const auto& info : table)
            if (modeId == info.id)
                return &info;

        for (const auto& info : table)
            if (modeId.equalsIgnoreCase (info.id))
                return &info;

        return nullptr;
    }

    const PhiModeInfo& getModeInfo (PhiMode mode)
    {
        for (const auto& info : getModeTable())
            if (info.mode == mode)
                return info;

        jassertfalse;
        return getModeTable().front();
    }

    juce::String getLabel (PhiMode mode)
    {
        return juce::String (juce::CharPointer_UTF8 (getModeInfo (mode).label));
    }

    Resolved resolve (const SynthParams& params, double defaultRangeMultiplier)
    {
        Resolved resolved;
        resolved.base = PhiMath::positiveOr (params.baseFreq, PhiConfig::kDefaultBaseFrequency);
        resolved.duration = PhiMath::positiveOr (params.duration, PhiConfig::kDefaultDurationSeconds);
        resolved.curve = PhiMath::parseDriveCurve (params.driveCurve);

        if (params.freqRange.has_value() && params.freqRange->isFinite())
            resolved.range = *params.freqRange;
        else
            resolved.range = { resolved.base, resolved.base * defaultRangeMultiplier };

        return resolved;
    }

    PhiBuildResult buildTone (const SynthParams& params, PhiBuildContext& context)
    {
        const auto resolved = resolve (params, getModeInfo (PhiMode::tone).defaultRangeMultiplier);
        const double freq = PhiMath::clampToRange (resolved.base * PHI, resolved.range.low, resolved.range.high);

        PhiBuildResult result;
        result.runDuration = resolved.duration;
        result.voices.push_back (createEnvelopedVoice (context, resolved, freq, 0.6f));
        return result;
    }

    PhiBuildResult buildAm (const SynthParams& params, PhiBuildContext& context)
    {
        const auto resolved = resolve (params, getModeInfo (PhiMode::am).defaultRangeMultiplier);
        return buildModulatedPair (resolved, context, 1.0 / PHI, 0.8, 0.6, 0.25, false);
    }

    PhiBuildResult buildFm (const SynthParams& params, PhiBuildContext& context)
    {
        const auto resolved = resolve (params, getModeInfo (PhiMode::fm).defaultRangeMultiplier);
        return buildModulatedPair (resolved, context, PHI, 0.9, 0.7, 0.35, true);
    }

    PhiBuildResult buildIntervalStack (const SynthParams& params, PhiBuildContext& context)
    {
        const auto resolved = resolve (params, getModeInfo (PhiMode::intervalStack).defaultRangeMultiplier);
        constexpr int numIntervals = 4;

        PhiBuildResult result;
        result.runDuration = resolved.duration;

        for (int i = 0; i < numIntervals; ++i)
        {
            const double freq = PhiMath::clampToRange (resolved.base * std::pow (PHI, (double) i),
                                                       resolved.range.low, resolved.range.high);
            const auto scale = (float) (PhiMath::mapDriveCurve (resolved.curve, (double) (i + 1) / numIntervals) * 0.4);
            result.voices.push_back (createEnvelopedVoice (context, resolved, freq, scale));
        }

        return result;
    }

    PhiBuildResult buildHarmonicStack (const SynthParams& params, PhiBuildContext& context)
    {
        const auto resolved = resolve (params, getModeInfo (PhiMode::harmonicStack).defaultRangeMultiplier);

        PhiBuildResult result;
        result.runDuration = resolved.duration;

        for (int harmonic = 1; harmonic <= 8; ++harmonic)
        {
            const double freq = PhiMath::clampToRange (resolved.base * harmonic, resolved.range.low, resolved.range.high);
            const double phiWeight = 1.0 / std::pow (PHI, (double) (harmonic - 1));
            const auto scale = (float) (PhiMath::mapDriveCurve (resolved.curve, 1.0 / harmonic) * phiWeight * 0.5);
            result.voices.push_back (createEnvelopedVoice (context, resolved, freq, scale));
        }

        return result;
    }
}
