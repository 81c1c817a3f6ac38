#pragma once

#include "DistanceSnapGrid.h"

namespace rs
{
namespace edit
{

// Concentric rings around the start position, one per interval
class CircularDistanceSnapGrid : public DistanceSnapGrid
{
public:
    CircularDistanceSnapGrid (const DistanceSnapProvider& snapProvider, BeatDivisor& beatDivisor,
                              const gfx::Theme& theme, gfx::Point centrePosition, double startTime,
                              std::optional<double> endTime = std::nullopt);

protected:
    void createContent (gfx::Point centrePosition) override;
    SnapResult snapToGrid (gfx::Point position) const override;
};

} // namespace edit
} // namespace rs
