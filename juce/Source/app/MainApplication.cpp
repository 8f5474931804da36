#include "MainApplication.h"
#include "../config/PhiConfig.h"
#include <iostream>

void MainApplication::initialise (const juce::String& commandLine)
{
    installFileLogger();
    juce::Logger::writeToLog ("[PhiMatrix] " + VersionInfo::getBuildInfoString());

    const auto parsed = PhiCommandLine::parse (commandLine, options);
    if (parsed.failed())
    {
        juce::Logger::writeToLog ("[PhiMatrix][ERROR] " + parsed.getErrorMessage());
        std::cerr << parsed.getErrorMessage().toStdString() << "\n" << PhiCommandLine::getUsage().toStdString() << std::endl;
        setApplicationReturnValue (1);
        finishSession();
        return;
    }

    if (options.listModes)
    {
        for (const auto& info : PhiTopologies::getModeTable())
            std::cout << info.id << "\t" << info.label << std::endl;
        finishSession();
        return;
    }

    host = std::make_unique<ConsolePhiHost> (options.params);
    host->onPlayingChanged = [this] (bool isPlaying)
    {
        if (! isPlaying)
            finishSession();
    };

    controller = std::make_unique<PhiSynthController> (*host, scheduler);
    recordParameterOverrides();

    if (options.diagnostic)
        controller->diagnosticParamsLog();

    engine = std::make_unique<GraphSynthEngine>();
    if (openAudioDevice())
        controller->setEngine (engine.get());

    if (! controller->runPhiMode (options.mode))
    {
        setApplicationReturnValue (1);
        finishSession();
        return;
    }

    engine->logGraphTopology();
}

void MainApplication::shutdown()
{
    juce::Logger::writeToLog ("[PhiMatrix] Shutting down");

    if (controller != nullptr)
    {
        controller->stopPhiSynthesis();
        controller->setEngine (nullptr);
    }

    deviceManager.removeAudioCallback (&player);
    player.setProcessor (nullptr);
    deviceManager.closeAudioDevice();

    exportParameterLog();

    controller.reset();
    host.reset();
    engine.reset();

    juce::Logger::setCurrentLogger (nullptr);
    fileLogger.reset();
}

void MainApplication::systemRequestedQuit()
{
    quit();
}

void MainApplication::anotherInstanceStarted (const juce::String&)
{
}

void MainApplication::installFileLogger()
{
    auto logDir = juce::File::getCurrentWorkingDirectory().getChildFile (PhiConfig::kLogDirectoryName);
    const auto created = logDir.createDirectory();
    if (created.failed())
        return;

    fileLogger.reset (juce::FileLogger::createDateStampedLogger (logDir.getFullPathName(),
                                                                 PhiConfig::kLogFilePrefix,
                                                                 ".log",
                                                                 "[PhiMatrix] Logger started"));
    juce::Logger::setCurrentLogger (fileLogger.get());
    juce::Logger::writeToLog ("[PhiMatrix] Log file: " + (fileLogger != nullptr ? fileLogger->getLogFile().getFullPathName() : juce::String ("<none>")));
}

bool MainApplication::openAudioDevice()
{
    const auto error = deviceManager.initialiseWithDefaultDevices (0, 2);
    if (error.isNotEmpty() || deviceManager.getCurrentAudioDevice() == nullptr)
    {
        juce::Logger::writeToLog ("[PhiMatrix][WARN] No audio output available: "
                                  + (error.isNotEmpty() ? error : juce::String ("no device")));
        return false;
    }

    // Adding the callback prepares the engine for the open device
    player.setProcessor (engine.get());
    deviceManager.addAudioCallback (&player);

    if (auto* device = deviceManager.getCurrentAudioDevice())
        juce::Logger::writeToLog ("[PhiMatrix] Audio device: " + device->getName()
                                  + " @ " + juce::String (device->getCurrentSampleRate(), 0) + " Hz");
    return true;
}

void MainApplication::recordParameterOverrides()
{
    const SynthParams defaults;

    if (options.params.baseFreq != defaults.baseFreq)
        parameterLog.logParameterChange ("baseFreq", defaults.baseFreq, options.params.baseFreq);

    if (options.params.duration != defaults.duration)
        parameterLog.logParameterChange ("duration", defaults.duration, options.params.duration);

    if (options.params.freqRange.has_value())
    {
        parameterLog.logParameterChange ("rangeLow", defaults.baseFreq, options.params.freqRange->low);
        parameterLog.logParameterChange ("rangeHigh", defaults.baseFreq * PHI, options.params.freqRange->high);
    }
}

void MainApplication::exportParameterLog()
{
    auto report = [] (const juce::Result& result, const juce::File& file)
    {
        if (result.wasOk())
            juce::Logger::writeToLog ("[PhiMatrix] Exported parameter log to " + file.getFullPathName());
        else
            juce::Logger::writeToLog ("[PhiMatrix][WARN] Parameter log export failed: " + result.getErrorMessage());
    };

    for (const auto& line : parameterLog.getRecentDisplayLines())
        juce::Logger::writeToLog ("[ParamLog] " + line);

    if (options.csvLogFile != juce::File())
        report (parameterLog.exportCsv (options.csvLogFile), options.csvLogFile);

    if (options.jsonLogFile != juce::File())
        report (parameterLog.exportJson (options.jsonLogFile), options.jsonLogFile);
}

void MainApplication::finishSession()
{
    if (finishing)
        return;

    finishing = true;
    juce::MessageManager::callAsync ([] { juce::JUCEApplicationBase::quit(); });
}

START_JUCE_APPLICATION (MainApplication)
