#include "LinearDistanceSnapGrid.h"
#include <cmath>
#include <stdexcept>

namespace rs
{
namespace edit
{

LinearDistanceSnapGrid::LinearDistanceSnapGrid (const DistanceSnapProvider& provider,
                                                BeatDivisor& divisor, const gfx::Theme& t,
                                                gfx::Point start, gfx::Point dir, double startMs,
                                                std::optional<double> endMs)
    : DistanceSnapGrid (provider, divisor, t, start, startMs, endMs),
      direction (checkedDirection (dir))
{
}

gfx::Point LinearDistanceSnapGrid::checkedDirection (gfx::Point d)
{
    if (! (d.length() > 0.0f))
        throw std::invalid_argument ("linear snap grid needs a non-zero direction");

    return d.normalised();
}

void LinearDistanceSnapGrid::createContent (gfx::Point start)
{
    const gfx::Rect localBounds (0, 0, getWidth(), getHeight());
    const gfx::Point normal (-direction.y, direction.x);
    const gfx::Point halfTick = normal * (theme.tickLength * 0.5f);

    for (int k = 1; k <= maxIntervals; ++k)
    {
        gfx::Point centre = start + direction * (static_cast<float> (k) * distanceSpacing);
        if (! localBounds.containsInclusive (centre))
            break;

        int beatIndex = k - 1;
        addTick (SnapTick::makeLine (beatIndex, centre - halfTick, centre + halfTick,
                                     theme.tickThickness, getColourForBeatIndex (beatIndex)));

        if (k == maxIntervals)
            break;
    }
}

DistanceSnapGrid::SnapResult LinearDistanceSnapGrid::snapToGrid (gfx::Point position) const
{
    // Positions behind the start clamp onto it
    float along = (position - startPosition).dot (direction);
    int k = clampInterval (std::round (static_cast<double> (along) / distanceSpacing), 0);

    gfx::Point snapped = startPosition + direction * (static_cast<float> (k) * distanceSpacing);
    return makeResult (snapped, k);
}

} // namespace edit
} // namespace rs
