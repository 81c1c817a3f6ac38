#pragma once

#include "model/BeatmapDifficulty.h"

namespace rs
{
namespace objects
{

// Supplies how long before its start time an object has to appear
class DifficultyPreemptResolver
{
public:
    virtual ~DifficultyPreemptResolver() = default;
    virtual double getBasePreemptAt (double time, const BeatmapDifficulty& difficulty) const = 0;
};

// 1800 ms at approach rate 0, 1200 ms at 5, 450 ms at 10, linear in between
class ApproachRatePreemptResolver : public DifficultyPreemptResolver
{
public:
    static constexpr double preemptMin = 1800.0;
    static constexpr double preemptMid = 1200.0;
    static constexpr double preemptMax = 450.0;

    double getBasePreemptAt (double time, const BeatmapDifficulty& difficulty) const override;

    static double difficultyRange (double difficulty, double min, double mid, double max);
};

} // namespace objects
} // namespace rs
