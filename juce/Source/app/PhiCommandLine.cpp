#include "PhiCommandLine.h"

namespace
{
    bool parseNumber (const juce::String& text, double& result)
    {
        const auto trimmed = text.trim();
        if (trimmed.isEmpty() || ! trimmed.containsOnly ("0123456789.-+eE"))
            return false;

        result = trimmed.getDoubleValue();
        return true;
    }

    juce::File resolveFile (const juce::String& path)
    {
        return juce::File::getCurrentWorkingDirectory().getChildFile (path);
    }
}

namespace PhiCommandLine
{
    juce::Result parse (const juce::String& commandLine, LaunchOptions& options)
    {
        juce::StringArray args;
        args.addTokens (commandLine, " ", "\"");
        args.removeEmptyStrings();

        for (int i = 0; i < args.size(); ++i)
        {
            const auto arg = args[i];
            const bool hasValue = i + 1 < args.size();
            const auto value = hasValue ? args[i + 1].unquoted() : juce::String();

            auto needsValue = [&arg, hasValue]
            {
                return hasValue ? juce::Result::ok() : juce::Result::fail ("Missing value for " + arg);
            };

            if (arg == "--mode" || arg == "--base" || arg == "--duration" || arg == "--curve"
                || arg == "--range" || arg == "--log-csv" || arg == "--log-json")
            {
                const auto check = needsValue();
                if (check.failed())
                    return check;
                ++i;
            }

            if (arg == "--mode")
            {
                options.mode = value;
            }
            else if (arg == "--base")
            {
                if (! parseNumber (value, options.params.baseFreq))
                    return juce::Result::fail ("Invalid base frequency: " + value);
            }
            else if (arg == "--duration")
            {
                if (! parseNumber (value, options.params.duration))
                    return juce::Result::fail ("Invalid duration: " + value);
            }
            else if (arg == "--curve")
            {
                options.params.driveCurve = value;
            }
            else if (arg == "--range")
            {
                options.params.freqRange = FrequencyRange::fromString (value);
                if (! options.params.freqRange.has_value())
                    return juce::Result::fail ("Invalid frequency range (expected lo-hi): " + value);
            }
            else if (arg == "--log-csv")
            {
                options.csvLogFile = resolveFile (value);
            }
            else if (arg == "--log-json")
            {
                options.jsonLogFile = resolveFile (value);
            }
            else if (arg == "--list-modes")
            {
                options.listModes = true;
            }
            else if (arg == "--diagnostic")
            {
                options.diagnostic = true;
            }
            else
            {
                return juce::Result::fail ("Unknown argument: " + arg);
            }
        }

        return juce::Result::ok();
    }

    juce::String getUsage()
    {
        return "Usage: PhiMatrix [--mode <id>] [--base <hz>] [--duration <s>] [--curve <name>]\n"
               "                 [--range <lo-hi>] [--diagnostic] [--list-modes]\n"
               "                 [--log-csv <file>] [--log-json <file>]\n"
               "Curves: linear, exponential, logarithmic, s-curve, phi";
    }
}
