#include "ConsolePhiHost.h"
#include <iostream>

ConsolePhiHost::ConsolePhiHost (const SynthParams& initialParams)
    : params (initialParams)
{
}

void ConsolePhiHost::setStatusText (const juce::String& text)
{
    statusText = text;
    juce::Logger::writeToLog ("[PhiMatrix] Status: " + text);
    std::cout << text.toStdString() << std::endl;
}

void ConsolePhiHost::setAudioPlaying (bool isPlaying)
{
    if (audioPlaying == isPlaying)
        return;

    audioPlaying = isPlaying;

    if (onPlayingChanged)
        onPlayingChanged (isPlaying);
}

void ConsolePhiHost::showAlert (const juce::String& message)
{
    juce::Logger::writeToLog ("[PhiMatrix][ALERT] " + message);
    std::cerr << message.toStdString() << std::endl;
}

void ConsolePhiHost::writeParamField (ParamField field, const juce::String& text)
{
    switch (field)
    {
        case ParamField::baseFreq:   params.baseFreq = text.getDoubleValue(); break;
        case ParamField::duration:   params.duration = text.getDoubleValue(); break;
        case ParamField::driveCurve: params.driveCurve = text; break;
        case ParamField::freqRange:  params.freqRange = FrequencyRange::fromString (text); break;
    }
}
