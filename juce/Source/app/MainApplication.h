#pragma once

#include <juce_gui_basics/juce_gui_basics.h>
#include <juce_audio_devices/juce_audio_devices.h>
#include <juce_audio_utils/juce_audio_utils.h>
#include <memory>
#include "PhiCommandLine.h"
#include "ConsolePhiHost.h"
#include "../analysis/ParameterLog.h"
#include "../audio/graph/GraphSynthEngine.h"
#include "../audio/phi/DeferredTaskScheduler.h"
#include "../audio/phi/PhiSynthController.h"
#include "../utils/VersionInfo.h"

/**
    Windowless launcher: opens the default output device, plays one
    synthesis mode and quits when the run completes.
*/
class MainApplication : public juce::JUCEApplication
{
public:
    const juce::String getApplicationName() override { return VersionInfo::getApplicationName(); }
    const juce::String getApplicationVersion() override { return VersionInfo::getFullVersionString(); }
    bool moreThanOneInstanceAllowed() override { return true; }

    void initialise (const juce::String& commandLine) override;
    void shutdown() override;
    void systemRequestedQuit() override;
    void anotherInstanceStarted (const juce::String& commandLine) override;

private:
    void installFileLogger();
    bool openAudioDevice();
    void recordParameterOverrides();
    void exportParameterLog();
    void finishSession();

    std::unique_ptr<juce::FileLogger> fileLogger;
    LaunchOptions options;

    juce::AudioDeviceManager deviceManager;
    juce::AudioProcessorPlayer player;
    std::unique_ptr<GraphSynthEngine> engine;

    TimerTaskScheduler scheduler;
    std::unique_ptr<ConsolePhiHost> host;
    std::unique_ptr<PhiSynthController> controller;
    ParameterLog parameterLog;
    bool finishing { false };
};
