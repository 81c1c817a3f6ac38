#include "DifficultyPreemptResolver.h"

namespace rs
{
namespace objects
{

double ApproachRatePreemptResolver::getBasePreemptAt (double, const BeatmapDifficulty& difficulty) const
{
    return difficultyRange (difficulty.approachRate, preemptMin, preemptMid, preemptMax);
}

double ApproachRatePreemptResolver::difficultyRange (double difficulty, double min, double mid, double max)
{
    if (difficulty > 5.0)
        return mid + (max - mid) * (difficulty - 5.0) / 5.0;
    if (difficulty < 5.0)
        return mid - (mid - min) * (5.0 - difficulty) / 5.0;
    return mid;
}

} // namespace objects
} // namespace rs
