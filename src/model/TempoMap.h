#pragma once
#include <juce_core/juce_core.h>
#include <vector>

namespace rs
{

// Times are in milliseconds
class TempoMap
{
public:
    struct TimingPoint
    {
        double time = 0.0;
        double bpm = 120.0;
        double speedMultiplier = 1.0;
    };

    TempoMap();

    // Sets the tempo of the first timing point
    void setTempo (double bpm);
    double getTempo() const { return points.front().bpm; }

    // Replaces any point already at the same time
    void addTimingPoint (double time, double bpm, double speedMultiplier = 1.0);
    void clear();

    int getNumTimingPoints() const { return static_cast<int> (points.size()); }

    // Point in effect at the given time; the first point also governs earlier times
    const TimingPoint& getTimingPointAt (double time) const;

    double getBeatLengthAt (double time) const;
    double getSpeedMultiplierAt (double time) const;

    // Snap a time to the nearest 1/divisor beat, anchored at the timing point
    // governing referenceTime
    double snapTime (double time, int divisor, double referenceTime) const;

private:
    std::vector<TimingPoint> points;
};

} // namespace rs
