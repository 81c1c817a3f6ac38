#pragma once

#include "HitObject.h"

namespace rs
{
namespace objects
{

class HitCircle : public HitObject
{
public:
    std::vector<std::unique_ptr<Judgement>> createJudgements() const override
    {
        std::vector<std::unique_ptr<Judgement>> judgements;
        judgements.push_back (std::make_unique<Judgement>());
        return judgements;
    }
};

} // namespace objects
} // namespace rs
