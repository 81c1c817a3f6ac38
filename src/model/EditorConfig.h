#pragma once
#include <juce_core/juce_core.h>
#include <yaml-cpp/yaml.h>
#include <map>
#include <optional>

namespace rs
{

class BeatDivisor;

namespace gfx
{
struct Theme;
}

// Editor snapping preferences, persisted as YAML:
//
//   editor:
//     beat_divisor: 4
//     snap:
//       end_time_tolerance_ms: 1.0
//     palette:
//       4: "ff66ccff"
//
struct EditorConfig
{
    // Absorbs start-time drift of objects snapped slightly before their nominal time
    static constexpr double defaultEndTimeTolerance = 1.0;

    int beatDivisor = 4;
    double endTimeTolerance = defaultEndTimeTolerance;

    // Divisor -> ARGB overrides for the theme palette
    std::map<int, juce::uint32> paletteOverrides;

    // Missing or malformed files leave the defaults in place
    static EditorConfig loadFromFile (const juce::File& file);
    bool saveToFile (const juce::File& file) const;

    static EditorConfig parse (const YAML::Node& root);
    YAML::Node emit() const;

    void applyTo (BeatDivisor& divisor) const;
    void applyTo (gfx::Theme& theme) const;

private:
    static juce::String colourToHex (juce::uint32 argb);
    static std::optional<juce::uint32> hexToColour (const juce::String& hex);
};

} // namespace rs
