#pragma once

#include "graphics/core/Widget.h"
#include "graphics/theme/Theme.h"
#include "model/BeatDivisor.h"
#include "DistanceSnapProvider.h"
#include "SnapTick.h"
#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace rs
{
namespace edit
{

// A grid which takes user input and returns a quantized ("snapped") position and time.
//
// Spacing, interval count and tick content are cached. The cache is invalidated by
// every divisor notification, by layout changes and by tolerance changes, and is
// rebuilt lazily by ensureValid() at the next read or frame tick, so any number of
// invalidations between two reads costs one rebuild.
class DistanceSnapGrid : public gfx::Widget,
                         private BeatDivisor::Listener
{
public:
    struct SnapResult
    {
        gfx::Point position;
        double time = 0.0;
    };

    ~DistanceSnapGrid() override;

    // ─── Cache ───────────────────────────────────────────

    void invalidateGrid();
    bool isGridValid() const { return gridValid; }
    void ensureValid();

    // Number of times the tick content has been rebuilt
    int getContentGeneration() const { return contentGeneration; }

    // ─── Extent ──────────────────────────────────────────

    gfx::Point getStartPosition() const { return startPosition; }
    double getStartTime() const { return startTime; }
    std::optional<double> getEndTime() const { return endTime; }

    // Slack added to the bounded duration so objects snapped marginally before
    // their nominal time still count as inside the grid
    void setEndTimeTolerance (double toleranceMs);
    double getEndTimeTolerance() const { return endTimeTolerance; }

    // ─── Derived values (recomputed on demand) ───────────

    float getDistanceSpacing();
    double getIntervalDuration();

    // INT_MAX when the grid has no end time
    int getMaxIntervals();

    double getTimeForInterval (int intervalIndex);

    int getNumTicks();
    const SnapTick* getTick (int index);

    // ─── Snapping ────────────────────────────────────────

    // Position is in this grid's local space
    SnapResult getSnappedPosition (gfx::Point position);

    // Colour for a 0-based beat index; later repeats of the divisor cycle fade out
    gfx::Color getColourForBeatIndex (int index) const;

    // ─── Widget ──────────────────────────────────────────

    void resized() override;
    void animationTick (double timestampMs) override;
    void mouseMove (const gfx::MouseEvent& e) override;
    void mouseDown (const gfx::MouseEvent& e) override;

    std::function<void (const SnapResult&)> onHover;
    std::function<void (const SnapResult&)> onPlace;

protected:
    // endTime absent: the grid continues until its bounds are exceeded
    DistanceSnapGrid (const DistanceSnapProvider& snapProvider, BeatDivisor& beatDivisor,
                      const gfx::Theme& theme, gfx::Point startPosition, double startTime,
                      std::optional<double> endTime = std::nullopt);

    // Builds the tick visuals for the current spacing and bounds
    virtual void createContent (gfx::Point startPosition) = 0;

    // Shape-specific snapping; must return an interval index in [0, maxIntervals]
    virtual SnapResult snapToGrid (gfx::Point position) const = 0;

    SnapResult makeResult (gfx::Point position, int intervalIndex) const;
    int clampInterval (double intervalCount, int minimum) const;
    void addTick (std::unique_ptr<SnapTick> tick);

    const DistanceSnapProvider& snapProvider;
    const gfx::Theme& theme;

    const gfx::Point startPosition;
    const double startTime;

    // Valid only while gridValid is true
    float distanceSpacing = 0.0f;
    double intervalDuration = 0.0;
    int maxIntervals = 0;

private:
    void beatDivisorChanged (int newDivisor) override;
    void updateSpacing();
    void clearContent();

    BeatDivisor& beatDivisor;
    const std::optional<double> endTime;
    double endTimeTolerance;

    bool gridValid = false;
    int contentGeneration = 0;
    std::vector<std::unique_ptr<SnapTick>> ticks;
};

} // namespace edit
} // namespace rs
