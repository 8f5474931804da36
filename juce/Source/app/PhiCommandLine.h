#pragma once

#include <juce_core/juce_core.h>
#include "../audio/phi/SynthParams.h"

/** What the launcher was asked to do. */
struct LaunchOptions
{
    juce::String mode { "phi_tone" };
    SynthParams params;
    bool listModes { false };
    bool diagnostic { false };
    juce::File csvLogFile;
    juce::File jsonLogFile;
};

namespace PhiCommandLine
{
    /**
        Parses the launcher's arguments into options.

        @returns a failed result naming the offending argument; options
                 keep whatever was parsed before it
    */
    juce::Result parse (const juce::String& commandLine, LaunchOptions& options);

    juce::String getUsage();
}
