// Tests for model/EditorConfig.h -- YAML parsing, persistence and application.

#include "model/EditorConfig.h"
#include "model/BeatDivisor.h"
#include "graphics/theme/Theme.h"

#include <gtest/gtest.h>

#include <string>

namespace rs
{
namespace
{

TEST (EditorConfigTest, DefaultsWhenSectionMissing)
{
    auto config = EditorConfig::parse (YAML::Load ("other: 1"));

    EXPECT_EQ (config.beatDivisor, 4);
    EXPECT_DOUBLE_EQ (config.endTimeTolerance, EditorConfig::defaultEndTimeTolerance);
    EXPECT_TRUE (config.paletteOverrides.empty());
}

TEST (EditorConfigTest, ParsesAllFields)
{
    auto config = EditorConfig::parse (YAML::Load (
        "editor:\n"
        "  beat_divisor: 12\n"
        "  snap:\n"
        "    end_time_tolerance_ms: 0.5\n"
        "  palette:\n"
        "    4: \"#80112233\"\n"
        "    2: \"445566\"\n"));

    EXPECT_EQ (config.beatDivisor, 12);
    EXPECT_DOUBLE_EQ (config.endTimeTolerance, 0.5);
    ASSERT_EQ (config.paletteOverrides.size(), 2u);
    EXPECT_EQ (config.paletteOverrides.at (4), 0x80112233u);
    EXPECT_EQ (config.paletteOverrides.at (2), 0xff445566u);
}

TEST (EditorConfigTest, OutOfRangeValuesKeepDefaults)
{
    auto config = EditorConfig::parse (YAML::Load (
        "editor:\n"
        "  beat_divisor: 0\n"
        "  snap:\n"
        "    end_time_tolerance_ms: -3\n"));

    EXPECT_EQ (config.beatDivisor, 4);
    EXPECT_DOUBLE_EQ (config.endTimeTolerance, EditorConfig::defaultEndTimeTolerance);
}

TEST (EditorConfigTest, UnknownDivisorKeepsDefault)
{
    for (const char* value : { "100000", "5", "32" })
    {
        auto config = EditorConfig::parse (YAML::Load (std::string ("editor:\n  beat_divisor: ") + value));
        EXPECT_EQ (config.beatDivisor, 4) << "beat_divisor " << value;
    }
}

TEST (EditorConfigTest, InvalidPaletteEntriesAreSkipped)
{
    auto config = EditorConfig::parse (YAML::Load (
        "editor:\n"
        "  palette:\n"
        "    1: \"zzzzzz\"\n"
        "    2: \"12345\"\n"
        "    3: \"#ff12345678\"\n"
        "    4: \"#00ff00\"\n"));

    ASSERT_EQ (config.paletteOverrides.size(), 1u);
    EXPECT_EQ (config.paletteOverrides.at (4), 0xff00ff00u);
}

TEST (EditorConfigTest, MissingFileGivesDefaults)
{
    auto file = juce::File::getSpecialLocation (juce::File::tempDirectory)
                    .getChildFile ("rhythmsnap-does-not-exist.yaml");
    file.deleteFile();

    auto config = EditorConfig::loadFromFile (file);
    EXPECT_EQ (config.beatDivisor, 4);
}

TEST (EditorConfigTest, MalformedFileGivesDefaults)
{
    juce::TemporaryFile tmp (".yaml");
    ASSERT_TRUE (tmp.getFile().replaceWithText ("editor:\n  beat_divisor: [unterminated\n"));

    auto config = EditorConfig::loadFromFile (tmp.getFile());
    EXPECT_EQ (config.beatDivisor, 4);
}

TEST (EditorConfigTest, SaveThenLoadKeepsValues)
{
    juce::TemporaryFile tmp (".yaml");

    EditorConfig config;
    config.beatDivisor = 6;
    config.endTimeTolerance = 2.5;
    config.paletteOverrides[8] = 0xff010203u;

    ASSERT_TRUE (config.saveToFile (tmp.getFile()));

    auto loaded = EditorConfig::loadFromFile (tmp.getFile());
    EXPECT_EQ (loaded.beatDivisor, 6);
    EXPECT_DOUBLE_EQ (loaded.endTimeTolerance, 2.5);
    EXPECT_EQ (loaded.paletteOverrides.at (8), 0xff010203u);
}

TEST (EditorConfigTest, AppliesToDivisorAndTheme)
{
    EditorConfig config;
    config.beatDivisor = 3;
    config.paletteOverrides[3] = 0xff00ff00u;
    config.paletteOverrides[5] = 0xff0000ffu;   // no slot, ignored

    BeatDivisor divisor;
    gfx::Theme theme;
    config.applyTo (divisor);
    config.applyTo (theme);

    EXPECT_EQ (divisor.getValue(), 3);
    EXPECT_EQ (theme.getColourForDivisor (3), gfx::Color (0, 255, 0));
    EXPECT_EQ (theme.getColourForDivisor (4), gfx::Theme::getDefault().divisorQuarter);
}

} // namespace
} // namespace rs
