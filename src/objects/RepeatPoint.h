#pragma once

#include "HitObject.h"

namespace rs
{
namespace objects
{

// Reversal point of a repeating slider span
class RepeatPoint : public HitObject
{
public:
    // repeatIndex is 0 for the first reversal; spanDuration must be positive
    RepeatPoint (int repeatIndex, double spanDuration);

    int getRepeatIndex() const { return repeatIndex; }
    double getSpanDuration() const { return spanDuration; }

    // Appear one span earlier than a plain object would. After the first reversal,
    // cap the lead time at two spans so that no more than two reversals show at once
    // on short, fast spans.
    static double computeTimePreempt (double basePreempt, double spanDuration, int repeatIndex);

    std::vector<std::unique_ptr<Judgement>> createJudgements() const override;

protected:
    void applyDefaultsToSelf (const TempoMap& tempoMap, const BeatmapDifficulty& difficulty,
                              const DifficultyPreemptResolver& resolver) override;

private:
    const int repeatIndex;
    const double spanDuration;
};

} // namespace objects
} // namespace rs
