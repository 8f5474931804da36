#pragma once

#include <juce_core/juce_core.h>
#include "../config/PhiConfig.h"
#include <functional>
#include <vector>

/**
    Running record of parameter edits with a simple force/work model:
    force is the size of the change and each change does force * 0.1 work.

    Entries can be shown as display lines or exported to CSV and JSON.
*/
class ParameterLog
{
public:
    struct Entry
    {
        double elapsedSeconds { 0.0 };
        juce::String timestamp;     // HH:MM:SS, local time
        juce::String parameter;
        double oldValue { 0.0 };
        double newValue { 0.0 };
        double delta { 0.0 };
        double force { 0.0 };
        double work { 0.0 };
        double totalWork { 0.0 };
    };

    using Clock = std::function<juce::int64()>;

    /** @param clockToUse  wall clock in milliseconds; defaults to juce::Time::currentTimeMillis */
    explicit ParameterLog (Clock clockToUse = {});

    void logParameterChange (const juce::String& parameter, double oldValue, double newValue);
    void clear();

    const std::vector<Entry>& getEntries() const { return entries; }
    int getNumEntries() const { return (int) entries.size(); }
    double getTotalWork() const { return totalWork; }

    static bool isHighForce (const Entry& entry) { return entry.force > 1.0; }

    static juce::String formatEntry (const Entry& entry);

    /** The newest maxLines entries, oldest first, or a placeholder line when empty. */
    juce::StringArray getRecentDisplayLines (int maxLines = PhiConfig::kParameterLogDisplayLimit) const;

    juce::String getCountLabel() const;
    juce::String getWorkLabel() const;

    juce::String toCsv() const;
    juce::var toJson() const;

    /** Both fail with "No log data to export." when the log is empty. */
    juce::Result exportCsv (const juce::File& file) const;
    juce::Result exportJson (const juce::File& file) const;

    static constexpr const char* csvFileName = "cpwp_log.csv";
    static constexpr const char* jsonFileName = "cpwp_log.json";

private:
    static juce::String formatValue (double value) { return juce::String (value, 3); }

    Clock clock;
    juce::int64 startMillis { 0 };
    std::vector<Entry> entries;
    double totalWork { 0.0 };

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR (ParameterLog)
};
