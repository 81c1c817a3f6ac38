#include "HitObject.h"
#include <algorithm>

namespace rs
{
namespace objects
{

namespace
{
    // Fade-in reaches its full length once the preempt is at least this long
    constexpr double fullFadeInPreempt = 450.0;
    constexpr double fullFadeIn = 400.0;
}

void HitObject::applyDefaults (const TempoMap& tempoMap, const BeatmapDifficulty& difficulty,
                               const DifficultyPreemptResolver& resolver)
{
    applyDefaultsToSelf (tempoMap, difficulty, resolver);

    nested.clear();
    createNestedObjects();

    for (auto& object : nested)
        object->applyDefaults (tempoMap, difficulty, resolver);
}

void HitObject::applyDefaultsToSelf (const TempoMap&, const BeatmapDifficulty& difficulty,
                                     const DifficultyPreemptResolver& resolver)
{
    timePreempt = resolver.getBasePreemptAt (startTime, difficulty);
    timeFadeIn = fullFadeIn * std::min (1.0, timePreempt / fullFadeInPreempt);
}

void HitObject::addNested (std::unique_ptr<HitObject> object)
{
    nested.push_back (std::move (object));
}

} // namespace objects
} // namespace rs
