#include <juce_audio_processors/juce_audio_processors.h>
#include "../audio/graph/GraphSynthEngine.h"
#include "../audio/phi/PhiTopologies.h"

/**
    Tests for the graph-backed engine: output stage wiring, node lifetime,
    batched commits and actual rendering of a phi voice.
*/
class GraphSynthEngineTests : public juce::UnitTest
{
public:
    GraphSynthEngineTests() : UnitTest("GraphSynthEngine Tests", "Graph") {}

    void runTest() override
    {
        runTestOutputStage();
        runTestNodeLifetime();
        runTestModulationInput();
        runTestRendering();
    }

private:
    static constexpr double sampleRate = 48000.0;
    static constexpr int blockSize = 512;

    float renderBlocks(GraphSynthEngine& engine, int numBlocks)
    {
        juce::AudioBuffer<float> buffer (2, blockSize);
        juce::MidiBuffer midi;
        float peak = 0.0f;

        for (int b = 0; b < numBlocks; ++b)
        {
            engine.processBlock(buffer, midi);
            peak = juce::jmax(peak, buffer.getMagnitude(0, 0, blockSize), buffer.getMagnitude(1, 0, blockSize));
        }

        return peak;
    }

    void runTestOutputStage()
    {
        beginTest("Output stage is wired to the device and ready once prepared");

        GraphSynthEngine engine;
        expect(! engine.hasOutputStage());
        expect(engine.getOutputStageProcessor() != nullptr);

        const auto shelf = engine.getOutputStageNodeID();
        const auto output = engine.getOutputNodeID();
        expect(engine.isConnected(shelf, output, 0));
        expect(engine.isConnected(shelf, output, 1));
        expectEquals(engine.getNumConnections(), 2);

        // Repairing an intact chain adds nothing
        engine.ensureProcessingChain();
        expectEquals(engine.getNumConnections(), 2);

        engine.prepareToPlay(sampleRate, blockSize);
        expect(engine.hasOutputStage());
        expectEquals(engine.getCurrentTime(), 0.0);

        engine.releaseResources();
        expect(! engine.hasOutputStage());
    }

    void runTestNodeLifetime()
    {
        beginTest("Nodes join the graph and leave it on release");

        GraphSynthEngine engine;
        engine.prepareToPlay(sampleRate, blockSize);

        auto osc = engine.createOscillator();
        auto gain = engine.createGain();
        expectEquals(engine.getNumModules(), 2);

        osc->connect(*gain);
        gain->connect(engine.getOutputStage());
        expectEquals(engine.getNumConnections(), 4);

        // Duplicate links are ignored
        osc->connect(*gain);
        expectEquals(engine.getNumConnections(), 4);

        gain->disconnect();
        expectEquals(engine.getNumConnections(), 3);
        gain->connect(engine.getOutputStage());

        osc->start(0.0);
        osc->release();
        expect(osc->isReleased());
        expectEquals(engine.getNumModules(), 1);
        expectEquals(engine.getNumConnections(), 3);

        osc->release();
        expectEquals(engine.getNumModules(), 1);

        gain->release();
        expectEquals(engine.getNumModules(), 0);
        expectEquals(engine.getNumConnections(), 2);

        // The output stage is never removed by a voice
        engine.getOutputStage().release();
        expect(engine.getOutputStageProcessor() != nullptr);
        expectEquals(engine.getNumConnections(), 2);
        engine.commitChanges();
    }

    void runTestModulationInput()
    {
        beginTest("Depth gain drives the oscillator frequency input");

        GraphSynthEngine engine;
        engine.prepareToPlay(sampleRate, blockSize);

        auto carrier = engine.createOscillator();
        auto modulator = engine.createOscillator();
        auto depth = engine.createGain();

        modulator->connect(*depth);
        depth->connect(*carrier, NodeInput::frequency);
        expectEquals(engine.getNumConnections(), 4);

        PhiNodeRegistry registry;
        registry.registerOscillator(carrier);
        registry.registerOscillator(modulator);
        registry.registerAuxNode(depth);
        registry.releaseAll();

        expectEquals(engine.getNumModules(), 0);
        expectEquals(engine.getNumConnections(), 2);
    }

    void runTestRendering()
    {
        beginTest("A phi tone renders through the output stage and falls silent on release");

        GraphSynthEngine engine;
        engine.prepareToPlay(sampleRate, blockSize);

        PhiNodeRegistry registry;
        PhiBuildContext context { engine, registry, engine.getCurrentTime() };

        SynthParams params;
        params.baseFreq = 220.0;
        params.duration = 2.0;
        params.driveCurve = "linear";

        auto result = PhiTopologies::buildTone(params, context);
        engine.commitChanges();
        expectEquals(engine.getNumModules(), 2);

        const int numBlocks = 40;
        const float peak = renderBlocks(engine, numBlocks);
        expect(peak > 0.01f, "expected an audible tone, peak " + juce::String(peak));
        expect(peak <= 1.0f);
        expectWithinAbsoluteError(engine.getCurrentTime(), numBlocks * blockSize / sampleRate, 1.0e-9);

        result.voices.clear();
        registry.releaseAll();
        engine.commitChanges();
        expectEquals(engine.getNumModules(), 0);

        // Let the shelf filter settle, then expect silence
        renderBlocks(engine, 2);
        expectLessThan(renderBlocks(engine, 4), 1.0e-3f);
    }
};

static GraphSynthEngineTests graphSynthEngineTests;
