#pragma once

namespace rs
{
namespace objects
{

enum class HitResult
{
    None,
    Miss,
    Meh,
    Ok,
    Good,
    Great
};

// Scoring token handed to the scoring side when an object is evaluated
class Judgement
{
public:
    virtual ~Judgement() = default;

    virtual HitResult getMaxResult() const { return HitResult::Great; }

    virtual int numericResultFor (HitResult result) const
    {
        switch (result)
        {
            case HitResult::Meh:   return 50;
            case HitResult::Ok:    return 100;
            case HitResult::Good:  return 200;
            case HitResult::Great: return 300;
            case HitResult::None:
            case HitResult::Miss:
            default:               return 0;
        }
    }

    int getMaxNumericResult() const { return numericResultFor (getMaxResult()); }
};

} // namespace objects
} // namespace rs
