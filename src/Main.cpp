#include <juce_core/juce_core.h>

#include "edit/CircularDistanceSnapGrid.h"
#include "edit/TimingSnapProvider.h"
#include "graphics/theme/Theme.h"
#include "model/BeatDivisor.h"
#include "model/BeatmapDifficulty.h"
#include "model/EditorConfig.h"
#include "model/TempoMap.h"
#include "objects/RepeatPoint.h"

#include <iostream>
#include <optional>

namespace
{

// Playfield the probe grid is laid out in
constexpr float playfieldWidth = 512.0f;
constexpr float playfieldHeight = 384.0f;

juce::String positionalAfter (const juce::ArgumentList& args, const juce::String& option, int offset)
{
    int index = args.indexOfOption (option);
    if (index < 0 || index + offset >= args.size())
        juce::ConsoleApplication::fail (option + " is missing an argument");

    return args[index + offset].text;
}

void runSnap (const juce::ArgumentList& args)
{
    float x = positionalAfter (args, "--snap", 1).getFloatValue();
    float y = positionalAfter (args, "--snap", 2).getFloatValue();

    rs::EditorConfig config;
    if (args.containsOption ("--config"))
        config = rs::EditorConfig::loadFromFile (args.getExistingFileForOption ("--config"));

    if (args.containsOption ("--divisor"))
    {
        int divisor = args.getValueForOption ("--divisor").getIntValue();
        if (! rs::BeatDivisor::isPredefined (divisor))
            juce::ConsoleApplication::fail ("--divisor must be one of 1, 2, 3, 4, 6, 8, 12, 16");
        config.beatDivisor = divisor;
    }

    rs::TempoMap tempoMap;
    if (args.containsOption ("--bpm"))
    {
        double bpm = args.getValueForOption ("--bpm").getDoubleValue();
        if (bpm <= 0.0)
            juce::ConsoleApplication::fail ("--bpm must be positive");
        tempoMap.setTempo (bpm);
    }

    std::optional<double> endTime;
    if (args.containsOption ("--end"))
        endTime = args.getValueForOption ("--end").getDoubleValue();

    rs::BeatDivisor beatDivisor;
    config.applyTo (beatDivisor);

    rs::gfx::Theme theme;
    config.applyTo (theme);

    rs::BeatmapDifficulty difficulty;
    rs::edit::TimingSnapProvider provider (tempoMap, difficulty, beatDivisor);

    rs::edit::CircularDistanceSnapGrid grid (provider, beatDivisor, theme,
                                             { playfieldWidth * 0.5f, playfieldHeight * 0.5f },
                                             0.0, endTime);
    grid.setEndTimeTolerance (config.endTimeTolerance);
    grid.setBounds (0.0f, 0.0f, playfieldWidth, playfieldHeight);

    auto result = grid.getSnappedPosition ({ x, y });

    std::cout << "spacing " << grid.getDistanceSpacing() << "\n"
              << "interval " << grid.getIntervalDuration() << " ms\n"
              << "position " << result.position.x << " " << result.position.y << "\n"
              << "time " << result.time << " ms\n";
}

void runPreempt (const juce::ArgumentList& args)
{
    double basePreempt = positionalAfter (args, "--preempt", 1).getDoubleValue();
    double spanDuration = positionalAfter (args, "--preempt", 2).getDoubleValue();
    int repeatIndex = positionalAfter (args, "--preempt", 3).getIntValue();

    if (repeatIndex < 0 || spanDuration <= 0.0)
        juce::ConsoleApplication::fail ("span duration must be positive and the repeat index non-negative");

    std::cout << rs::objects::RepeatPoint::computeTimePreempt (basePreempt, spanDuration, repeatIndex)
              << "\n";
}

} // namespace

int main (int argc, char* argv[])
{
    juce::ConsoleApplication app;

    app.addHelpCommand ("--help|-h", "rhythmsnap: editor snapping probe", true);
    app.addVersionCommand ("--version|-v", "rhythmsnap 0.1.0");

    app.addCommand ({ "--snap",
                      "--snap <x> <y> [--bpm <bpm>] [--divisor <n>] [--end <ms>] [--config <file>]",
                      "Snaps a playfield position on a circular grid centred on the playfield",
                      "The grid starts at time 0 and is unbounded unless --end is given.",
                      runSnap });

    app.addCommand ({ "--preempt",
                      "--preempt <basePreempt> <spanDuration> <repeatIndex>",
                      "Prints the preempt of a slider repeat point",
                      "",
                      runPreempt });

    return app.findAndRunCommand (argc, argv);
}
