#include "CircularDistanceSnapGrid.h"
#include <algorithm>
#include <cmath>

namespace rs
{
namespace edit
{

CircularDistanceSnapGrid::CircularDistanceSnapGrid (const DistanceSnapProvider& provider,
                                                    BeatDivisor& divisor, const gfx::Theme& t,
                                                    gfx::Point centrePosition, double startMs,
                                                    std::optional<double> endMs)
    : DistanceSnapGrid (provider, divisor, t, centrePosition, startMs, endMs)
{
}

void CircularDistanceSnapGrid::createContent (gfx::Point centre)
{
    // Enough rings to reach the farthest corner of the bounds
    float dx = std::max (centre.x, getWidth() - centre.x);
    float dy = std::max (centre.y, getHeight() - centre.y);
    double maxDistance = std::sqrt (static_cast<double> (dx) * dx + static_cast<double> (dy) * dy);

    double ringsToCover = std::floor (maxDistance / distanceSpacing);
    int requiredRings = static_cast<int> (std::min (ringsToCover, static_cast<double> (maxIntervals)));

    for (int i = 0; i < requiredRings; ++i)
    {
        float radius = static_cast<float> (i + 1) * distanceSpacing;
        addTick (SnapTick::makeRing (i, centre, radius, theme.ringThickness, getColourForBeatIndex (i)));
    }
}

DistanceSnapGrid::SnapResult CircularDistanceSnapGrid::snapToGrid (gfx::Point position) const
{
    gfx::Point direction = position - startPosition;
    float distance = direction.length();

    // Also catches NaN input
    if (! (distance > 0.0f))
        return makeResult (startPosition, 0);

    // Any off-centre position lands on a ring, never back on the centre
    int radialCount = clampInterval (std::round (static_cast<double> (distance) / distanceSpacing), 1);

    gfx::Point snapped = startPosition + direction.normalised() * (static_cast<float> (radialCount) * distanceSpacing);
    return makeResult (snapped, radialCount);
}

} // namespace edit
} // namespace rs
