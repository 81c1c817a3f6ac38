#pragma once

#include "DistanceSnapProvider.h"
#include "model/BeatDivisor.h"
#include "model/BeatmapDifficulty.h"
#include "model/TempoMap.h"

namespace rs
{
namespace edit
{

// Snap distances derived from the tempo map, the slider velocity and the current divisor.
// One beat at speed multiplier 1 spans 100 * sliderMultiplier units.
class TimingSnapProvider : public DistanceSnapProvider
{
public:
    TimingSnapProvider (const TempoMap& tempoMap, const BeatmapDifficulty& difficulty,
                        const BeatDivisor& beatDivisor);

    float getBeatSnapDistanceAt (double referenceTime) const override;
    float durationToDistance (double referenceTime, double duration) const override;
    double distanceToDuration (double referenceTime, float distance) const override;
    double getSnappedDurationFromDistance (double referenceTime, float distance) const override;

private:
    // Length of one beat subdivision in ms
    double getSnapLengthAt (double referenceTime) const;

    const TempoMap& tempoMap;
    const BeatmapDifficulty& difficulty;
    const BeatDivisor& beatDivisor;
};

} // namespace edit
} // namespace rs
