#pragma once

#include <juce_core/juce_core.h>

/**
 * Centralized version information for Phi Matrix
 *
 * Single source of truth for the application name and version
 * reported by the launcher and written into the session log.
 */
class VersionInfo
{
public:
    // Application identity
    static constexpr const char* APPLICATION_NAME = "Phi Matrix";
    static constexpr const char* AUTHOR = "Phi Matrix Developers";

    // Version information
    static constexpr const char* VERSION = "0.9";
    static constexpr const char* VERSION_FULL = "0.9.0";
    static constexpr int         VERSION_MAJOR = 0;
    static constexpr int         VERSION_MINOR = 9;
    static constexpr int         VERSION_PATCH = 0;

    static constexpr const char* BUILD_TYPE = "Console Synthesis Build";

    static juce::String getVersionString() { return juce::String(VERSION); }
    static juce::String getFullVersionString() { return juce::String(VERSION_FULL); }
    static juce::String getApplicationName() { return juce::String(APPLICATION_NAME); }

    static juce::String getBuildInfoString()
    {
        return juce::String(APPLICATION_NAME) + " " + VERSION_FULL + " - " + BUILD_TYPE;
    }
};
