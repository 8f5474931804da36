#include "PhiSynthController.h"
#include "PhiMath.h"
#include <cmath>

juce::var PhiParamsState::toVar() const
{
    auto* object = new juce::DynamicObject();
    object->setProperty ("params", current.toVar());
    object->setProperty ("isPlaying", isPlaying);
    object->setProperty ("activeMode", activeModeLabel);
    object->setProperty ("oscillators", numOscillators);
    object->setProperty ("auxNodes", numAuxNodes);
    object->setProperty ("lastParams", lastParams.has_value() ? lastParams->toVar() : juce::var());
    return juce::var (object);
}

PhiSynthController::PhiSynthController (PhiHost& hostToUse, DeferredTaskScheduler& schedulerToUse)
    : host (hostToUse), scheduler (schedulerToUse)
{
}

PhiSynthController::~PhiSynthController()
{
    stopPhiSynthesis();
}

void PhiSynthController::setEngine (SynthEngine* engineToUse)
{
    if (engine == engineToUse)
        return;

    stopPhiSynthesis();
    engine = engineToUse;
}

bool PhiSynthController::runPhiMode (const juce::String& modeId)
{
    if (engine == nullptr)
    {
        host.showAlert ("Please start audio first!");
        return false;
    }

    if (! engine->hasOutputStage())
    {
        host.showAlert ("Audio chain not ready.");
        return false;
    }

    const auto* info = PhiTopologies::findMode (modeId);
    if (info == nullptr)
    {
        juce::Logger::writeToLog ("[PhiSynth][WARN] Unknown phi mode: " + modeId);
        return false;
    }

    engine->ensureProcessingChain();
    stopPhiSynthesis();

    const auto params = host.getParams();
    PhiBuildContext context { *engine, activeRun.registry, engine->getCurrentTime() };
    auto result = info->build (params, context);
    engine->commitChanges();

    activeRun.mode = info->mode;
    activeRun.voices = std::move (result.voices);
    const auto generation = ++activeRun.generation;

    const auto label = PhiTopologies::getLabel (info->mode);
    const double runDuration = PhiMath::positiveOr (result.runDuration, PhiConfig::kDefaultDurationSeconds);

    host.setAudioPlaying (true);
    host.setStopEnabled (true);
    host.setStatusText ("Running " + label + " for " + juce::String (runDuration, 2) + "s");

    lastParams = params;
    host.setRestoreEnabled (true);

    activeRun.stopTask = scheduler.scheduleOnce (runDuration, [this, generation] { handleRunComplete (generation); });

    juce::Logger::writeToLog ("[PhiSynth] Started " + juce::String (info->id) + " with "
                              + juce::String (activeRun.registry.getNumOscillators()) + " oscillators, "
                              + juce::String (activeRun.registry.getNumAuxNodes()) + " aux nodes, "
                              + juce::String (runDuration, 2) + "s");
    return true;
}

void PhiSynthController::stopPhiSynthesis()
{
    cancelPendingStop();

    const bool hadNodes = ! activeRun.registry.isEmpty();
    activeRun.voices.clear();
    activeRun.registry.releaseAll();
    activeRun.mode.reset();

    if (hadNodes)
    {
        if (engine != nullptr)
            engine->commitChanges();

        juce::Logger::writeToLog ("[PhiSynth] Synthesis stopped, nodes released");
    }
}

void PhiSynthController::restoreLastParams()
{
    if (! lastParams.has_value())
        return;

    const auto& params = *lastParams;

    auto writeField = [this] (PhiHost::ParamField field, const juce::String& text)
    {
        if (host.hasParamField (field))
            host.writeParamField (field, text);
    };

    if (std::isfinite (params.baseFreq))
        writeField (PhiHost::ParamField::baseFreq, PhiMath::formatNumber (params.baseFreq));

    if (std::isfinite (params.duration))
        writeField (PhiHost::ParamField::duration, PhiMath::formatNumber (params.duration));

    if (params.driveCurve.isNotEmpty())
        writeField (PhiHost::ParamField::driveCurve, params.driveCurve);

    if (params.freqRange.has_value())
        writeField (PhiHost::ParamField::freqRange, params.freqRange->toString());

    host.setStatusText (juce::String (juce::CharPointer_UTF8 ("\xce\xa6 parameters restored")));
}

void PhiSynthController::diagnosticParamsLog()
{
    const auto params = host.getParams();
    juce::Logger::writeToLog ("[PhiSynth] Diagnostic params: " + juce::JSON::toString (params.toVar(), true));

    const auto range = (params.freqRange.has_value() && params.freqRange->isFinite())
                         ? params.freqRange->toString()
                         : juce::String ("N/A");
    const auto curve = params.driveCurve.isNotEmpty() ? params.driveCurve : juce::String ("N/A");

    juce::String status (juce::CharPointer_UTF8 ("Diagnostic \xe2\x86\x92 base: "));
    status << PhiMath::formatNumber (params.baseFreq) << " Hz"
           << " | curve: " << curve
           << " | range: " << range
           << " | duration: " << PhiMath::formatNumber (params.duration) << " s";

    host.setStatusText (status);
}

PhiParamsState PhiSynthController::getPhiParamsState()
{
    PhiParamsState state;
    state.current = host.getParams();
    state.isPlaying = isRunning();
    state.activeModeLabel = activeRun.mode.has_value() ? PhiTopologies::getLabel (*activeRun.mode) : juce::String();
    state.numOscillators = activeRun.registry.getNumOscillators();
    state.numAuxNodes = activeRun.registry.getNumAuxNodes();
    state.lastParams = lastParams;
    return state;
}

juce::StringArray PhiSynthController::getModeIds()
{
    juce::StringArray ids;
    for (const auto& info : PhiTopologies::getModeTable())
        ids.add (info.id);
    return ids;
}

void PhiSynthController::handleRunComplete (juce::uint64 generation)
{
    // A run that was replaced or stopped must not touch the current one
    if (generation != activeRun.generation || activeRun.stopTask == 0 || ! activeRun.mode.has_value())
    {
        juce::Logger::writeToLog ("[PhiSynth] Ignoring stale auto-stop for run " + juce::String ((juce::int64) generation));
        return;
    }

    activeRun.stopTask = 0;
    const auto label = PhiTopologies::getLabel (*activeRun.mode);

    stopPhiSynthesis();
    host.setAudioPlaying (false);
    host.setStatusText (label + " complete");

    juce::Logger::writeToLog ("[PhiSynth] " + label + " complete");
}

void PhiSynthController::cancelPendingStop()
{
    if (activeRun.stopTask == 0)
        return;

    const bool cancelled = scheduler.cancel (activeRun.stopTask);
    jassert (cancelled);
    juce::ignoreUnused (cancelled);
    activeRun.stopTask = 0;
}
