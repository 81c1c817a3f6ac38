#pragma once

#include "edit/DistanceSnapProvider.h"
#include <cmath>

namespace rs
{
namespace test
{

// Linear provider: a fixed spacing and a fixed number of ms per unit distance.
// Counts spacing queries so tests can observe recomputation.
class FixedSnapProvider : public edit::DistanceSnapProvider
{
public:
    FixedSnapProvider (float spacingToUse, double msPerUnitToUse)
        : spacing (spacingToUse), msPerUnit (msPerUnitToUse) {}

    float getBeatSnapDistanceAt (double) const override
    {
        ++spacingQueries;
        return spacing;
    }

    float durationToDistance (double, double duration) const override
    {
        return static_cast<float> (duration / msPerUnit);
    }

    double distanceToDuration (double, float distance) const override
    {
        return distance * msPerUnit;
    }

    double getSnappedDurationFromDistance (double, float distance) const override
    {
        double interval = spacing * msPerUnit;
        return std::round (distance * msPerUnit / interval) * interval;
    }

    float spacing;
    double msPerUnit;
    mutable int spacingQueries = 0;
};

} // namespace test
} // namespace rs
