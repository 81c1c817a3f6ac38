#include "EditorConfig.h"
#include "BeatDivisor.h"
#include "graphics/theme/Theme.h"
#include <iostream>

namespace rs
{

// --- Helpers ---

juce::String EditorConfig::colourToHex (juce::uint32 argb)
{
    return juce::String::toHexString (argb).paddedLeft ('0', 8);
}

std::optional<juce::uint32> EditorConfig::hexToColour (const juce::String& hex)
{
    auto digits = hex.trim().trimCharactersAtStart ("#");

    // RGB only: opaque
    if (digits.length() == 6)
        digits = "ff" + digits;

    if (digits.length() != 8 || ! digits.containsOnly ("0123456789abcdefABCDEF"))
        return std::nullopt;

    return static_cast<juce::uint32> (digits.getHexValue64());
}

// --- Load / save ---

EditorConfig EditorConfig::loadFromFile (const juce::File& file)
{
    if (! file.existsAsFile())
        return {};

    try
    {
        return parse (YAML::LoadFile (file.getFullPathName().toStdString()));
    }
    catch (const YAML::Exception& e)
    {
        std::cerr << "[EditorConfig] ignoring " << file.getFullPathName()
                  << ": " << e.what() << "\n";
    }

    return {};
}

bool EditorConfig::saveToFile (const juce::File& file) const
{
    file.getParentDirectory().createDirectory();

    YAML::Emitter emitter;
    emitter << emit();

    // Atomic write: write to .tmp, then move into place
    auto tmpFile = file.getSiblingFile (file.getFileName() + ".tmp");
    if (! tmpFile.replaceWithText (juce::String (emitter.c_str())))
        return false;

    return tmpFile.moveFileTo (file);
}

// --- Parse / emit ---

EditorConfig EditorConfig::parse (const YAML::Node& root)
{
    EditorConfig config;

    auto editor = root["editor"];
    if (! editor.IsDefined() || ! editor.IsMap())
        return config;

    if (editor["beat_divisor"])
    {
        int divisor = editor["beat_divisor"].as<int>();
        if (BeatDivisor::isPredefined (divisor))
            config.beatDivisor = divisor;
        else
            std::cerr << "[EditorConfig] beat_divisor " << divisor
                      << " is not one of 1, 2, 3, 4, 6, 8, 12, 16, using "
                      << config.beatDivisor << "\n";
    }

    if (auto snap = editor["snap"])
    {
        if (snap["end_time_tolerance_ms"])
        {
            double tolerance = snap["end_time_tolerance_ms"].as<double>();
            if (tolerance >= 0.0)
                config.endTimeTolerance = tolerance;
            else
                std::cerr << "[EditorConfig] negative end_time_tolerance_ms ignored\n";
        }
    }

    if (auto palette = editor["palette"])
    {
        if (palette.IsMap())
        {
            for (auto entry : palette)
            {
                int divisor = entry.first.as<int>();
                auto hex = juce::String (entry.second.as<std::string>());

                if (auto argb = hexToColour (hex))
                    config.paletteOverrides[divisor] = *argb;
                else
                    std::cerr << "[EditorConfig] skipping palette entry 1/" << divisor
                              << ": \"" << hex << "\" is not an RGB or ARGB hex colour\n";
            }
        }
    }

    return config;
}

YAML::Node EditorConfig::emit() const
{
    YAML::Node root;
    YAML::Node editor;

    editor["beat_divisor"] = beatDivisor;

    YAML::Node snap;
    snap["end_time_tolerance_ms"] = endTimeTolerance;
    editor["snap"] = snap;

    if (! paletteOverrides.empty())
    {
        YAML::Node palette;
        for (const auto& [divisor, argb] : paletteOverrides)
            palette[divisor] = colourToHex (argb).toStdString();
        editor["palette"] = palette;
    }

    root["editor"] = editor;
    return root;
}

// --- Apply ---

void EditorConfig::applyTo (BeatDivisor& divisor) const
{
    divisor.setValue (beatDivisor);
}

void EditorConfig::applyTo (gfx::Theme& theme) const
{
    for (const auto& [divisor, argb] : paletteOverrides)
    {
        if (auto* slot = theme.getDivisorSlot (divisor))
            *slot = gfx::Color::fromARGB (argb);
        else
            std::cerr << "[EditorConfig] no palette slot for 1/" << divisor << "\n";
    }
}

} // namespace rs
