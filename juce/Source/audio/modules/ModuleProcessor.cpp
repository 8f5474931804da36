#include "ModuleProcessor.h"

juce::String ModuleProcessor::getConnectionDiagnostics() const
{
    juce::String result;
    result << getName() << " (L-ID " << (int) storedLogicalId << ")\n";

    for (int bus = 0; bus < getBusCount (true); ++bus)
    {
        const int numChannels = getChannelCountOfBus (true, bus);
        result << "  Input Bus " << bus << ": \"" << getBus (true, bus)->getName() << "\" (";
        for (int ch = 0; ch < numChannels; ++ch)
            result << (ch > 0 ? ", " : "") << getAudioInputLabel (ch);
        result << ")\n";
    }

    for (int bus = 0; bus < getBusCount (false); ++bus)
    {
        const int numChannels = getChannelCountOfBus (false, bus);
        result << "  Output Bus " << bus << ": \"" << getBus (false, bus)->getName() << "\" (";
        for (int ch = 0; ch < numChannels; ++ch)
            result << (ch > 0 ? ", " : "") << getAudioOutputLabel (ch);
        result << ")\n";
    }

    return result;
}
