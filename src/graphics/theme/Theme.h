#pragma once

#include "graphics/core/Types.h"

namespace rs
{
namespace gfx
{

struct Theme
{
    // ─── Beat divisor colours ────────────────────────────
    Color divisorWhole          = Color::fromARGB (0xffffffff);   // 1/1
    Color divisorHalf           = Color::fromARGB (0xffed1121);   // 1/2
    Color divisorThird          = Color::fromARGB (0xffaa88ff);   // 1/3
    Color divisorQuarter        = Color::fromARGB (0xff66ccff);   // 1/4
    Color divisorSixth          = Color::fromARGB (0xffeeaa00);   // 1/6
    Color divisorEighth         = Color::fromARGB (0xffffcc22);   // 1/8
    Color divisorTwelfth        = Color::fromARGB (0xffcc6600);   // 1/12
    Color divisorSixteenth      = Color::fromARGB (0xff6644cc);   // 1/16
    Color divisorUnknown        = Color::fromARGB (0xffff0000);

    // ─── Snap grid ───────────────────────────────────────
    float ringThickness         = 2.0f;
    float tickLength            = 12.0f;
    float tickThickness         = 2.0f;

    Color getColourForDivisor (int divisor) const
    {
        switch (divisor)
        {
            case 1:  return divisorWhole;
            case 2:  return divisorHalf;
            case 3:  return divisorThird;
            case 4:  return divisorQuarter;
            case 6:  return divisorSixth;
            case 8:  return divisorEighth;
            case 12: return divisorTwelfth;
            case 16: return divisorSixteenth;
            default: return divisorUnknown;
        }
    }

    Color* getDivisorSlot (int divisor)
    {
        switch (divisor)
        {
            case 1:  return &divisorWhole;
            case 2:  return &divisorHalf;
            case 3:  return &divisorThird;
            case 4:  return &divisorQuarter;
            case 6:  return &divisorSixth;
            case 8:  return &divisorEighth;
            case 12: return &divisorTwelfth;
            case 16: return &divisorSixteenth;
            default: return nullptr;
        }
    }

    // ─── Singleton ───────────────────────────────────────
    static const Theme& getDefault()
    {
        static Theme instance;
        return instance;
    }
};

} // namespace gfx
} // namespace rs
