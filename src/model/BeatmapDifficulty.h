#pragma once

namespace rs
{

// Resolved difficulty settings, as loaded by the beatmap layer
struct BeatmapDifficulty
{
    double approachRate = 5.0;
    double sliderMultiplier = 1.4;
};

} // namespace rs
