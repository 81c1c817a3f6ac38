#pragma once

namespace rs
{
namespace gfx
{

// Positions are local to the widget receiving the event
struct MouseEvent
{
    float x = 0.0f;
    float y = 0.0f;
    int clickCount = 0;
    bool rightButton = false;
    bool shift = false;
    bool control = false;
    bool alt = false;
};

} // namespace gfx
} // namespace rs
