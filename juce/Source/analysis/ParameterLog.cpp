#include "ParameterLog.h"
#include <cmath>

namespace
{
    constexpr double workPerUnitForce = 0.1;

    juce::Result writeFile (const juce::File& file, const juce::String& content)
    {
        const auto directory = file.getParentDirectory().createDirectory();
        if (directory.failed())
            return directory;

        if (! file.replaceWithText (content))
            return juce::Result::fail ("Could not write " + file.getFullPathName());

        return juce::Result::ok();
    }
}

ParameterLog::ParameterLog (Clock clockToUse)
    : clock (clockToUse ? std::move (clockToUse) : Clock ([] { return juce::Time::currentTimeMillis(); }))
{
    startMillis = clock();
}

void ParameterLog::logParameterChange (const juce::String& parameter, double oldValue, double newValue)
{
    const auto now = clock();

    Entry entry;
    entry.elapsedSeconds = (double) (now - startMillis) / 1000.0;
    entry.timestamp = juce::Time (now).formatted ("%H:%M:%S");
    entry.parameter = parameter;
    entry.oldValue = oldValue;
    entry.newValue = newValue;
    entry.delta = newValue - oldValue;
    entry.force = std::abs (entry.delta);
    entry.work = entry.force * workPerUnitForce;

    totalWork += entry.work;
    entry.totalWork = totalWork;

    entries.push_back (entry);
    juce::Logger::writeToLog ("[ParamLog] " + formatEntry (entry));
}

void ParameterLog::clear()
{
    entries.clear();
    totalWork = 0.0;
    startMillis = clock();
}

juce::String ParameterLog::formatEntry (const Entry& entry)
{
    juce::String line;
    line << "[" << entry.timestamp << " | +" << formatValue (entry.elapsedSeconds) << "s] "
         << entry.parameter.toUpperCase() << ": "
         << formatValue (entry.oldValue) << juce::String (juce::CharPointer_UTF8 (" \xe2\x86\x92 ")) << formatValue (entry.newValue)
         << juce::String (juce::CharPointer_UTF8 (" (\xce\x94=")) << formatValue (entry.delta)
         << ", F=" << formatValue (entry.force)
         << ", W=" << formatValue (entry.work) << ")";
    return line;
}

juce::StringArray ParameterLog::getRecentDisplayLines (int maxLines) const
{
    juce::StringArray lines;

    if (entries.empty())
    {
        lines.add ("Waiting for parameter changes...");
        return lines;
    }

    const int first = juce::jmax (0, (int) entries.size() - juce::jmax (0, maxLines));
    for (int i = first; i < (int) entries.size(); ++i)
        lines.add (formatEntry (entries[(size_t) i]));

    return lines;
}

juce::String ParameterLog::getCountLabel() const
{
    return juce::String ((int) entries.size()) + " events logged";
}

juce::String ParameterLog::getWorkLabel() const
{
    return "Total Work: " + juce::String (totalWork, 2);
}

juce::String ParameterLog::toCsv() const
{
    juce::StringArray rows;
    rows.add ("\"Timestamp\",\"ElapsedSeconds\",\"Parameter\",\"OldValue\",\"NewValue\",\"Delta\",\"Force\",\"Work\",\"TotalWork\"");

    for (const auto& entry : entries)
    {
        juce::StringArray cells;
        cells.add (entry.timestamp);
        cells.add (formatValue (entry.elapsedSeconds));
        cells.add (entry.parameter);
        for (auto value : { entry.oldValue, entry.newValue, entry.delta, entry.force, entry.work, entry.totalWork })
            cells.add (formatValue (value));

        for (auto& cell : cells)
            cell = cell.quoted();

        rows.add (cells.joinIntoString (","));
    }

    return rows.joinIntoString ("\n");
}

juce::var ParameterLog::toJson() const
{
    juce::Array<juce::var> list;

    for (const auto& entry : entries)
    {
        auto* object = new juce::DynamicObject();
        object->setProperty ("time", formatValue (entry.elapsedSeconds));
        object->setProperty ("timestamp", entry.timestamp);
        object->setProperty ("parameter", entry.parameter);
        object->setProperty ("oldValue", formatValue (entry.oldValue));
        object->setProperty ("newValue", formatValue (entry.newValue));
        object->setProperty ("delta", formatValue (entry.delta));
        object->setProperty ("force", formatValue (entry.force));
        object->setProperty ("work", formatValue (entry.work));
        object->setProperty ("totalWork", formatValue (entry.totalWork));
        list.add (juce::var (object));
    }

    return juce::var (list);
}

juce::Result ParameterLog::exportCsv (const juce::File& file) const
{
    if (entries.empty())
        return juce::Result::fail ("No log data to export.");

    return writeFile (file, toCsv());
}

juce::Result ParameterLog::exportJson (const juce::File& file) const
{
    if (entries.empty())
        return juce::Result::fail ("No log data to export.");

    return writeFile (file, juce::JSON::toString (toJson()));
}
