#include "DistanceSnapGrid.h"
#include "model/EditorConfig.h"
#include <algorithm>
#include <climits>
#include <cmath>
#include <stdexcept>

namespace rs
{
namespace edit
{

DistanceSnapGrid::DistanceSnapGrid (const DistanceSnapProvider& provider, BeatDivisor& divisor,
                                    const gfx::Theme& t, gfx::Point start, double startMs,
                                    std::optional<double> endMs)
    : snapProvider (provider),
      theme (t),
      startPosition (start),
      startTime (startMs),
      beatDivisor (divisor),
      endTime (endMs),
      endTimeTolerance (EditorConfig::defaultEndTimeTolerance)
{
    setAnimating (true);
    beatDivisor.addListener (this);
}

DistanceSnapGrid::~DistanceSnapGrid()
{
    beatDivisor.removeListener (this);
    clearContent();
}

// ─── Cache ───────────────────────────────────────────────

void DistanceSnapGrid::beatDivisorChanged (int)
{
    // Re-run even for an unchanged value; the layout may have moved in the meantime
    invalidateGrid();
}

void DistanceSnapGrid::resized()
{
    invalidateGrid();
}

void DistanceSnapGrid::invalidateGrid()
{
    gridValid = false;
    repaint();
}

void DistanceSnapGrid::setEndTimeTolerance (double toleranceMs)
{
    jassert (toleranceMs >= 0.0);
    endTimeTolerance = toleranceMs;
    invalidateGrid();
}

void DistanceSnapGrid::animationTick (double)
{
    ensureValid();
}

void DistanceSnapGrid::ensureValid()
{
    if (gridValid)
        return;

    updateSpacing();

    clearContent();
    createContent (startPosition);

    gridValid = true;
    ++contentGeneration;

    DBG ("DistanceSnapGrid: rebuilt " << static_cast<int> (ticks.size()) << " ticks, spacing "
         << distanceSpacing << ", max intervals " << maxIntervals);
}

void DistanceSnapGrid::updateSpacing()
{
    distanceSpacing = snapProvider.getBeatSnapDistanceAt (startTime);
    if (! (distanceSpacing > 0.0f))
        throw std::logic_error ("snap provider returned a non-positive beat snap distance");

    intervalDuration = snapProvider.distanceToDuration (startTime, distanceSpacing);
    if (! (intervalDuration > 0.0))
        throw std::logic_error ("snap provider returned a non-positive interval duration");

    if (! endTime.has_value())
    {
        maxIntervals = INT_MAX;
        return;
    }

    double maxDuration = *endTime - startTime + endTimeTolerance;
    double intervals = std::floor (maxDuration / intervalDuration);

    if (intervals <= 0.0)
        maxIntervals = 0;
    else if (intervals >= static_cast<double> (INT_MAX))
        maxIntervals = INT_MAX;
    else
        maxIntervals = static_cast<int> (intervals);
}

void DistanceSnapGrid::clearContent()
{
    removeAllChildren();
    ticks.clear();
}

void DistanceSnapGrid::addTick (std::unique_ptr<SnapTick> tick)
{
    addChild (tick.get());
    ticks.push_back (std::move (tick));
}

// ─── Derived values ──────────────────────────────────────

float DistanceSnapGrid::getDistanceSpacing()
{
    ensureValid();
    return distanceSpacing;
}

double DistanceSnapGrid::getIntervalDuration()
{
    ensureValid();
    return intervalDuration;
}

int DistanceSnapGrid::getMaxIntervals()
{
    ensureValid();
    return maxIntervals;
}

double DistanceSnapGrid::getTimeForInterval (int intervalIndex)
{
    ensureValid();
    return startTime + intervalIndex * intervalDuration;
}

int DistanceSnapGrid::getNumTicks()
{
    ensureValid();
    return static_cast<int> (ticks.size());
}

const SnapTick* DistanceSnapGrid::getTick (int index)
{
    ensureValid();
    if (index >= 0 && index < static_cast<int> (ticks.size()))
        return ticks[static_cast<size_t> (index)].get();
    return nullptr;
}

// ─── Snapping ────────────────────────────────────────────

DistanceSnapGrid::SnapResult DistanceSnapGrid::getSnappedPosition (gfx::Point position)
{
    ensureValid();
    return snapToGrid (position);
}

DistanceSnapGrid::SnapResult DistanceSnapGrid::makeResult (gfx::Point position, int intervalIndex) const
{
    jassert (intervalIndex >= 0 && intervalIndex <= maxIntervals);
    return { position, startTime + intervalIndex * intervalDuration };
}

int DistanceSnapGrid::clampInterval (double intervalCount, int minimum) const
{
    int lower = std::min (minimum, maxIntervals);
    if (std::isnan (intervalCount))
        return lower;

    double clamped = std::clamp (intervalCount, static_cast<double> (lower), static_cast<double> (maxIntervals));
    return static_cast<int> (clamped);
}

gfx::Color DistanceSnapGrid::getColourForBeatIndex (int index) const
{
    jassert (index >= 0);

    int divisor = beatDivisor.getValue();
    auto colour = theme.getColourForDivisor (BeatDivisor::getDivisorForBeatIndex (index + 1, divisor));

    int repeatIndex = index / divisor;
    return colour.multipliedAlpha (0.5f / static_cast<float> (repeatIndex + 1));
}

// ─── Mouse ───────────────────────────────────────────────

void DistanceSnapGrid::mouseMove (const gfx::MouseEvent& e)
{
    if (onHover)
        onHover (getSnappedPosition ({ e.x, e.y }));
}

void DistanceSnapGrid::mouseDown (const gfx::MouseEvent& e)
{
    if (e.rightButton)
        return;

    if (onPlace)
        onPlace (getSnappedPosition ({ e.x, e.y }));
}

} // namespace edit
} // namespace rs
