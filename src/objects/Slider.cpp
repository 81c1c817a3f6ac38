#include "Slider.h"
#include "RepeatPoint.h"
#include <stdexcept>

namespace rs
{
namespace objects
{

namespace
{
    // Distance covered in one beat at slider multiplier 1 and speed multiplier 1
    constexpr double baseScoringDistance = 100.0;
}

Slider::Slider (gfx::Point startPosition, gfx::Point end, double start, int spans)
    : endPosition (end), spanCount (spans)
{
    if (spans < 1)
        throw std::invalid_argument ("slider needs at least one span");

    position = startPosition;
    startTime = start;
}

void Slider::applyDefaultsToSelf (const TempoMap& tempoMap, const BeatmapDifficulty& difficulty,
                                  const DifficultyPreemptResolver& resolver)
{
    HitObject::applyDefaultsToSelf (tempoMap, difficulty, resolver);

    double scoringDistance = baseScoringDistance * difficulty.sliderMultiplier
                             * tempoMap.getSpeedMultiplierAt (startTime);

    velocity = scoringDistance / tempoMap.getBeatLengthAt (startTime);
    spanDuration = getPathLength() / velocity;
}

void Slider::createNestedObjects()
{
    for (int i = 0; i < getRepeatCount(); ++i)
    {
        auto repeat = std::make_unique<RepeatPoint> (i, spanDuration);
        repeat->setStartTime (startTime + spanDuration * (i + 1));

        // Even reversals happen at the far end, odd ones back at the head
        repeat->setPosition (i % 2 == 0 ? endPosition : position);

        addNested (std::move (repeat));
    }
}

} // namespace objects
} // namespace rs
