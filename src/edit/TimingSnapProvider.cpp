#include "TimingSnapProvider.h"

namespace rs
{
namespace edit
{

TimingSnapProvider::TimingSnapProvider (const TempoMap& tm, const BeatmapDifficulty& diff,
                                        const BeatDivisor& divisor)
    : tempoMap (tm), difficulty (diff), beatDivisor (divisor)
{
}

double TimingSnapProvider::getSnapLengthAt (double referenceTime) const
{
    return tempoMap.getBeatLengthAt (referenceTime) / beatDivisor.getValue();
}

float TimingSnapProvider::getBeatSnapDistanceAt (double referenceTime) const
{
    double speed = tempoMap.getSpeedMultiplierAt (referenceTime);
    return static_cast<float> (100.0 * difficulty.sliderMultiplier * speed / beatDivisor.getValue());
}

float TimingSnapProvider::durationToDistance (double referenceTime, double duration) const
{
    return static_cast<float> (duration / getSnapLengthAt (referenceTime)
                               * getBeatSnapDistanceAt (referenceTime));
}

double TimingSnapProvider::distanceToDuration (double referenceTime, float distance) const
{
    return distance / getBeatSnapDistanceAt (referenceTime) * getSnapLengthAt (referenceTime);
}

double TimingSnapProvider::getSnappedDurationFromDistance (double referenceTime, float distance) const
{
    double unsnapped = referenceTime + distanceToDuration (referenceTime, distance);
    return tempoMap.snapTime (unsnapped, beatDivisor.getValue(), referenceTime) - referenceTime;
}

} // namespace edit
} // namespace rs
