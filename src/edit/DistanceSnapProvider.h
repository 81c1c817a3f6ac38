#pragma once

namespace rs
{
namespace edit
{

// Converts between spatial distance and musical duration around a reference time.
// Implementations are stateless with respect to the caller: equal inputs give equal outputs
// as long as the underlying timing and divisor are unchanged.
class DistanceSnapProvider
{
public:
    virtual ~DistanceSnapProvider() = default;

    // Distance covered by one beat subdivision at the reference time. Strictly positive.
    virtual float getBeatSnapDistanceAt (double referenceTime) const = 0;

    virtual float durationToDistance (double referenceTime, double duration) const = 0;

    // Strictly positive for a positive distance
    virtual double distanceToDuration (double referenceTime, float distance) const = 0;

    // Duration for a distance, snapped to the current beat subdivision
    virtual double getSnappedDurationFromDistance (double referenceTime, float distance) const = 0;
};

} // namespace edit
} // namespace rs
