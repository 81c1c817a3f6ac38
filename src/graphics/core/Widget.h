#pragma once

#include "Node.h"
#include "Event.h"

namespace rs
{
namespace gfx
{

class Widget : public Node
{
public:
    Widget() = default;
    ~Widget() override = default;

    // ─── Mouse events ────────────────────────────────────

    virtual void mouseDown (const MouseEvent&) {}
    virtual void mouseMove (const MouseEvent&) {}

    // ─── Layout ──────────────────────────────────────────

    virtual void resized() {}

    void setBounds (const Rect& newBounds);
    void setBounds (float x, float y, float w, float h);

    // ─── Repaint ─────────────────────────────────────────

    void repaint() { invalidate(); }

    // ─── Animation ───────────────────────────────────────

    // Called once per frame by the host for widgets that are animating
    bool isAnimating() const { return animating; }
    void setAnimating (bool a) { animating = a; }
    virtual void animationTick (double) {}

protected:
    bool animating = false;
};

} // namespace gfx
} // namespace rs
