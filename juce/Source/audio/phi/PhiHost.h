#pragma once

#include <juce_core/juce_core.h>
#include "SynthParams.h"

/**
    Everything the synthesis controller needs from the surrounding
    application: the live parameter source, the status line, the stop and
    restore controls, alerts, and the editable parameter fields.
*/
class PhiHost
{
public:
    enum class ParamField
    {
        baseFreq,
        duration,
        driveCurve,
        freqRange
    };

    virtual ~PhiHost() = default;

    /** Current parameter values. Read fresh on every run. */
    virtual SynthParams getParams() = 0;

    virtual void setStatusText (const juce::String& text) = 0;
    virtual void setStopEnabled (bool shouldBeEnabled) = 0;
    virtual void setRestoreEnabled (bool shouldBeEnabled) = 0;
    virtual void setAudioPlaying (bool isPlaying) = 0;
    virtual void showAlert (const juce::String& message) = 0;

    /** Parameter fields may be missing; writes to a missing field are skipped. */
    virtual bool hasParamField (ParamField field) const = 0;
    virtual void writeParamField (ParamField field, const juce::String& text) = 0;
};
