#pragma once

namespace PhiConfig
{
    // Fallbacks for malformed or missing parameters
    inline constexpr double kDefaultBaseFrequency = 220.0;
    inline constexpr double kDefaultDurationSeconds = 3.0;
    inline constexpr const char* kDefaultDriveCurve = "linear";

    // Envelope shape: attack is a fraction of the run, bounded on both sides
    inline constexpr double kAttackFraction = 0.2;
    inline constexpr double kMinAttackSeconds = 0.05;
    inline constexpr double kMaxAttackSeconds = 0.5;

    // Output stage (low shelf ahead of the device)
    inline constexpr float kLowShelfCutoffHz = 120.0f;
    inline constexpr float kLowShelfGainDb = 0.0f;
    inline constexpr float kLowShelfQ = 0.707f;

    // Used before the device reports its own configuration
    inline constexpr double kFallbackSampleRate = 48000.0;
    inline constexpr int kFallbackBlockSize = 512;

    // Logging
    inline constexpr const char* kLogDirectoryName = "logs";
    inline constexpr const char* kLogFilePrefix = "phimatrix";
    inline constexpr int kParameterLogDisplayLimit = 20;
}
