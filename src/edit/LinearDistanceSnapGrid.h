#pragma once

#include "DistanceSnapGrid.h"

namespace rs
{
namespace edit
{

// Evenly spaced ticks along a ray leaving the start position
class LinearDistanceSnapGrid : public DistanceSnapGrid
{
public:
    // direction need not be normalised but must have a non-zero length
    LinearDistanceSnapGrid (const DistanceSnapProvider& snapProvider, BeatDivisor& beatDivisor,
                            const gfx::Theme& theme, gfx::Point startPosition, gfx::Point direction,
                            double startTime, std::optional<double> endTime = std::nullopt);

    gfx::Point getDirection() const { return direction; }

protected:
    void createContent (gfx::Point startPosition) override;
    SnapResult snapToGrid (gfx::Point position) const override;

private:
    static gfx::Point checkedDirection (gfx::Point d);

    const gfx::Point direction;
};

} // namespace edit
} // namespace rs
