#pragma once

#include "HitObject.h"

namespace rs
{
namespace objects
{

// Straight slider travelling from its position to endPosition and back, spanCount times in total.
// Span duration follows from the path length and the slider velocity at the start time.
class Slider : public HitObject
{
public:
    Slider (gfx::Point startPosition, gfx::Point endPosition, double startTime, int spanCount = 1);

    gfx::Point getEndPosition() const { return endPosition; }
    int getSpanCount() const { return spanCount; }
    int getRepeatCount() const { return spanCount - 1; }

    float getPathLength() const { return position.distanceTo (endPosition); }

    // Valid after applyDefaults()
    double getVelocity() const { return velocity; }
    double getSpanDuration() const { return spanDuration; }
    double getEndTime() const { return startTime + spanDuration * spanCount; }

protected:
    void applyDefaultsToSelf (const TempoMap& tempoMap, const BeatmapDifficulty& difficulty,
                              const DifficultyPreemptResolver& resolver) override;
    void createNestedObjects() override;

private:
    gfx::Point endPosition;
    int spanCount;

    double velocity = 0.0;      // distance per ms
    double spanDuration = 0.0;
};

} // namespace objects
} // namespace rs
