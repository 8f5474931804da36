#pragma once

#include <juce_core/juce_core.h>
#include <functional>
#include "../audio/phi/PhiHost.h"

/**
    PhiHost for the command-line launcher. Parameters come from the command
    line, status and alerts go to the log and the console, and the
    parameter fields are the in-memory parameter set itself.
*/
class ConsolePhiHost : public PhiHost
{
public:
    explicit ConsolePhiHost (const SynthParams& initialParams);

    SynthParams getParams() override { return params; }
    void setParams (const SynthParams& newParams) { params = newParams; }

    void setStatusText (const juce::String& text) override;
    void setStopEnabled (bool shouldBeEnabled) override { stopEnabled = shouldBeEnabled; }
    void setRestoreEnabled (bool shouldBeEnabled) override { restoreEnabled = shouldBeEnabled; }
    void setAudioPlaying (bool isPlaying) override;
    void showAlert (const juce::String& message) override;

    bool hasParamField (ParamField) const override { return true; }
    void writeParamField (ParamField field, const juce::String& text) override;

    const juce::String& getStatusText() const { return statusText; }
    bool isAudioPlaying() const { return audioPlaying; }
    bool isStopEnabled() const { return stopEnabled; }
    bool isRestoreEnabled() const { return restoreEnabled; }

    // Called whenever the playing flag changes
    std::function<void (bool)> onPlayingChanged;

private:
    SynthParams params;
    juce::String statusText;
    bool audioPlaying { false };
    bool stopEnabled { false };
    bool restoreEnabled { false };

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR (ConsolePhiHost)
};
