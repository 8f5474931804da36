#include <juce_core/juce_core.h>
#include "../app/PhiCommandLine.h"
#include "../app/ConsolePhiHost.h"

class PhiCommandLineTests : public juce::UnitTest
{
public:
    PhiCommandLineTests() : UnitTest("PhiCommandLine Tests", "App") {}

    void runTest() override
    {
        runTestDefaults();
        runTestFullCommandLine();
        runTestErrors();
        runTestConsoleHostFields();
    }

private:
    void runTestDefaults()
    {
        beginTest("Empty command line keeps defaults");

        LaunchOptions options;
        expect(PhiCommandLine::parse({}, options).wasOk());
        expectEquals(options.mode, juce::String("phi_tone"));
        expectEquals(options.params.baseFreq, 220.0);
        expectEquals(options.params.duration, 3.0);
        expectEquals(options.params.driveCurve, juce::String("linear"));
        expect(! options.params.freqRange.has_value());
        expect(! options.listModes);
        expect(! options.diagnostic);
        expect(options.csvLogFile == juce::File());
    }

    void runTestFullCommandLine()
    {
        beginTest("Every flag");

        LaunchOptions options;
        auto result = PhiCommandLine::parse("--mode phi_FM --base 330 --duration 1.5 --curve phi "
                                            "--range 200-800 --diagnostic --list-modes --log-csv \"out dir/log.csv\"",
                                            options);
        expect(result.wasOk(), result.getErrorMessage());
        expectEquals(options.mode, juce::String("phi_FM"));
        expectEquals(options.params.baseFreq, 330.0);
        expectEquals(options.params.duration, 1.5);
        expectEquals(options.params.driveCurve, juce::String("phi"));
        expect(options.params.freqRange.has_value());
        expectEquals(options.params.freqRange->high, 800.0);
        expect(options.diagnostic);
        expect(options.listModes);
        expectEquals(options.csvLogFile.getFileName(), juce::String("log.csv"));
        expectEquals(options.csvLogFile.getParentDirectory().getFileName(), juce::String("out dir"));
    }

    void runTestErrors()
    {
        beginTest("Bad arguments are reported");

        LaunchOptions options;
        auto unknown = PhiCommandLine::parse("--bogus", options);
        expect(unknown.failed());
        expectEquals(unknown.getErrorMessage(), juce::String("Unknown argument: --bogus"));

        expect(PhiCommandLine::parse("--base abc", options).failed());
        expect(PhiCommandLine::parse("--range 5", options).failed());
        expect(PhiCommandLine::parse("--mode", options).failed());
        expect(PhiCommandLine::parse("--duration", options).failed());
    }

    void runTestConsoleHostFields()
    {
        beginTest("Console host parses written fields");

        ConsolePhiHost host { SynthParams() };
        host.writeParamField(PhiHost::ParamField::baseFreq, "300");
        host.writeParamField(PhiHost::ParamField::duration, "2.5");
        host.writeParamField(PhiHost::ParamField::driveCurve, "s-curve");
        host.writeParamField(PhiHost::ParamField::freqRange, "200-800");

        const auto params = host.getParams();
        expectEquals(params.baseFreq, 300.0);
        expectEquals(params.duration, 2.5);
        expectEquals(params.driveCurve, juce::String("s-curve"));
        expect(params.freqRange.has_value());
        expectEquals(params.freqRange->low, 200.0);

        int playingChanges = 0;
        host.onPlayingChanged = [&playingChanges] (bool) { ++playingChanges; };
        host.setAudioPlaying(true);
        host.setAudioPlaying(true);
        host.setAudioPlaying(false);
        expectEquals(playingChanges, 2);
        expect(! host.isAudioPlaying());

        host.setStatusText("ready");
        expectEquals(host.getStatusText(), juce::String("ready"));
    }
};

static PhiCommandLineTests phiCommandLineTests;
