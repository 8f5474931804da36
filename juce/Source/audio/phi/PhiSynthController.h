#pragma once

#include <juce_core/juce_core.h>
#include <optional>
#include <vector>
#include "PhiHost.h"
#include "PhiTopologies.h"
#include "PhiNodeRegistry.h"
#include "DeferredTaskScheduler.h"
#include "../graph/SynthEngine.h"

/** Snapshot returned by PhiSynthController::getPhiParamsState(). */
struct PhiParamsState
{
    SynthParams current;
    bool isPlaying { false };
    juce::String activeModeLabel;   // empty while idle
    int numOscillators { 0 };
    int numAuxNodes { 0 };
    std::optional<SynthParams> lastParams;

    juce::var toVar() const;
};

/**
    Dispatches the golden-ratio synthesis modes and owns the lifecycle of
    the single active run: build the voices, schedule the envelopes, stop
    automatically after the run's duration, tear everything down.

    All methods must be called from the message thread.
*/
class PhiSynthController
{
public:
    PhiSynthController (PhiHost& hostToUse, DeferredTaskScheduler& schedulerToUse);
    ~PhiSynthController();

    /** The engine may be absent until audio has been started. Switching
        engines stops the current run.
    */
    void setEngine (SynthEngine* engineToUse);
    SynthEngine* getEngine() const { return engine; }

    /**
        Starts a mode, replacing any run in progress.

        Without an engine or output stage the host is alerted; an unknown
        mode only logs a warning. Neither case changes any state.

        @returns true if a run was started
    */
    bool runPhiMode (const juce::String& modeId);

    /**
        Tears down every node of the current run and cancels its auto-stop.
        Leaves the host's playing flag and status text alone. Safe to call
        repeatedly or while idle.
    */
    void stopPhiSynthesis();

    /** Writes the last started run's parameters back into the host fields. */
    void restoreLastParams();

    /** Logs the host's current parameters and summarises them in the status line. */
    void diagnosticParamsLog();

    PhiParamsState getPhiParamsState();

    bool isRunning() const { return activeRun.mode.has_value(); }
    std::optional<PhiMode> getActiveMode() const { return activeRun.mode; }
    const std::vector<PhiVoice>& getActiveVoices() const { return activeRun.voices; }
    const PhiNodeRegistry& getRegistry() const { return activeRun.registry; }
    const std::optional<SynthParams>& getLastParams() const { return lastParams; }

    static juce::StringArray getModeIds();

private:
    struct ActiveRun
    {
        std::optional<PhiMode> mode;
        PhiNodeRegistry registry;
        std::vector<PhiVoice> voices;
        DeferredTaskScheduler::TaskId stopTask { 0 };
        juce::uint64 generation { 0 };
    };

    void handleRunComplete (juce::uint64 generation);
    void cancelPendingStop();

    PhiHost& host;
    DeferredTaskScheduler& scheduler;
    SynthEngine* engine { nullptr };

    ActiveRun activeRun;
    std::optional<SynthParams> lastParams;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR (PhiSynthController)
};
