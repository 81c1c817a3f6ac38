#include "RepeatPoint.h"
#include <algorithm>
#include <stdexcept>

namespace rs
{
namespace objects
{

namespace
{
    void checkSpan (double spanDuration, int repeatIndex)
    {
        if (repeatIndex < 0)
            throw std::invalid_argument ("repeat index must not be negative");
        if (! (spanDuration > 0.0))
            throw std::invalid_argument ("span duration must be positive");
    }
}

RepeatPoint::RepeatPoint (int index, double span)
    : repeatIndex (index), spanDuration (span)
{
    checkSpan (spanDuration, repeatIndex);
}

double RepeatPoint::computeTimePreempt (double basePreempt, double spanDuration, int repeatIndex)
{
    checkSpan (spanDuration, repeatIndex);

    if (! (basePreempt >= 0.0))
        throw std::invalid_argument ("base preempt must not be negative");

    double preempt = basePreempt + spanDuration;

    if (repeatIndex > 0)
        preempt = std::min (spanDuration * 2.0, preempt);

    return preempt;
}

void RepeatPoint::applyDefaultsToSelf (const TempoMap& tempoMap, const BeatmapDifficulty& difficulty,
                                       const DifficultyPreemptResolver& resolver)
{
    HitObject::applyDefaultsToSelf (tempoMap, difficulty, resolver);

    timePreempt = computeTimePreempt (timePreempt, spanDuration, repeatIndex);
}

std::vector<std::unique_ptr<Judgement>> RepeatPoint::createJudgements() const
{
    std::vector<std::unique_ptr<Judgement>> judgements;
    judgements.push_back (std::make_unique<Judgement>());
    return judgements;
}

} // namespace objects
} // namespace rs
