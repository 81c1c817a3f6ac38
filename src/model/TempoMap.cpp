#include "TempoMap.h"
#include <algorithm>
#include <cmath>

namespace rs
{

TempoMap::TempoMap()
{
    points.push_back ({});
}

void TempoMap::setTempo (double bpm)
{
    jassert (bpm > 0.0);
    points.front().bpm = bpm;
}

void TempoMap::addTimingPoint (double time, double bpm, double speedMultiplier)
{
    jassert (bpm > 0.0);
    jassert (speedMultiplier > 0.0);

    auto it = std::lower_bound (points.begin(), points.end(), time,
        [] (const TimingPoint& p, double t) { return p.time < t; });

    if (it != points.end() && it->time == time)
    {
        it->bpm = bpm;
        it->speedMultiplier = speedMultiplier;
        return;
    }

    points.insert (it, { time, bpm, speedMultiplier });
}

void TempoMap::clear()
{
    points.clear();
    points.push_back ({});
}

const TempoMap::TimingPoint& TempoMap::getTimingPointAt (double time) const
{
    auto it = std::upper_bound (points.begin(), points.end(), time,
        [] (double t, const TimingPoint& p) { return t < p.time; });

    if (it == points.begin())
        return points.front();

    return *std::prev (it);
}

double TempoMap::getBeatLengthAt (double time) const
{
    return 60000.0 / getTimingPointAt (time).bpm;
}

double TempoMap::getSpeedMultiplierAt (double time) const
{
    return getTimingPointAt (time).speedMultiplier;
}

double TempoMap::snapTime (double time, int divisor, double referenceTime) const
{
    jassert (divisor >= 1);

    const auto& point = getTimingPointAt (referenceTime);
    double beatLength = 60000.0 / point.bpm / divisor;

    double beats = std::round ((time - point.time) / beatLength);
    return point.time + beats * beatLength;
}

} // namespace rs
