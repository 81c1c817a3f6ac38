#pragma once

#include "graphics/core/Types.h"
#include "model/BeatmapDifficulty.h"
#include "model/TempoMap.h"
#include "DifficultyPreemptResolver.h"
#include "Judgement.h"
#include <memory>
#include <vector>

namespace rs
{
namespace objects
{

class HitObject
{
public:
    HitObject() = default;
    virtual ~HitObject() = default;

    HitObject (const HitObject&) = delete;
    HitObject& operator= (const HitObject&) = delete;

    void setStartTime (double t) { startTime = t; }
    double getStartTime() const { return startTime; }

    void setPosition (gfx::Point p) { position = p; }
    gfx::Point getPosition() const { return position; }

    // Time before startTime at which the object starts appearing
    double getTimePreempt() const { return timePreempt; }
    double getTimeFadeIn() const { return timeFadeIn; }

    double getVisibleFrom() const { return startTime - timePreempt; }
    bool isVisibleAt (double time) const { return time >= getVisibleFrom() && time < startTime; }

    // Recomputes all derived timing from scratch and rebuilds nested objects.
    // Safe to call again after the difficulty or timing changes.
    void applyDefaults (const TempoMap& tempoMap, const BeatmapDifficulty& difficulty,
                        const DifficultyPreemptResolver& resolver);

    const std::vector<std::unique_ptr<HitObject>>& getNestedObjects() const { return nested; }

    // Fresh judgements on every call; ownership passes to the caller
    virtual std::vector<std::unique_ptr<Judgement>> createJudgements() const { return {}; }

protected:
    virtual void applyDefaultsToSelf (const TempoMap& tempoMap, const BeatmapDifficulty& difficulty,
                                      const DifficultyPreemptResolver& resolver);
    virtual void createNestedObjects() {}

    void addNested (std::unique_ptr<HitObject> object);

    double startTime = 0.0;
    gfx::Point position;

    double timePreempt = 0.0;
    double timeFadeIn = 0.0;

private:
    std::vector<std::unique_ptr<HitObject>> nested;
};

} // namespace objects
} // namespace rs
