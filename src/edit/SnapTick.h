#pragma once

#include "graphics/core/Node.h"
#include <cmath>
#include <memory>

namespace rs
{
namespace edit
{

// Visual marker for one grid interval. Geometry is in the owning grid's local space.
class SnapTick : public gfx::Node
{
public:
    enum class Shape { ring, line };

    static std::unique_ptr<SnapTick> makeRing (int beatIndex, gfx::Point centre, float radius,
                                               float thickness, gfx::Color colour)
    {
        auto tick = std::unique_ptr<SnapTick> (new SnapTick (Shape::ring, beatIndex, thickness, colour));
        tick->centre = centre;
        tick->radius = radius;
        tick->setBounds (gfx::Rect (centre.x - radius, centre.y - radius, radius * 2.0f, radius * 2.0f));
        return tick;
    }

    static std::unique_ptr<SnapTick> makeLine (int beatIndex, gfx::Point from, gfx::Point to,
                                               float thickness, gfx::Color colour)
    {
        auto tick = std::unique_ptr<SnapTick> (new SnapTick (Shape::line, beatIndex, thickness, colour));
        tick->from = from;
        tick->to = to;
        tick->centre = (from + to) * 0.5f;
        tick->setBounds (gfx::Rect (std::min (from.x, to.x), std::min (from.y, to.y),
                                    std::abs (to.x - from.x), std::abs (to.y - from.y)));
        return tick;
    }

    Shape getShape() const { return shape; }
    int getBeatIndex() const { return beatIndex; }
    gfx::Color getColour() const { return colour; }
    float getThickness() const { return thickness; }

    gfx::Point getCentre() const { return centre; }
    float getRadius() const { return radius; }
    gfx::Point getFrom() const { return from; }
    gfx::Point getTo() const { return to; }

private:
    SnapTick (Shape s, int index, float t, gfx::Color c)
        : shape (s), beatIndex (index), thickness (t), colour (c) {}

    Shape shape;
    int beatIndex;
    float thickness;
    gfx::Color colour;

    gfx::Point centre;
    float radius = 0.0f;
    gfx::Point from, to;
};

} // namespace edit
} // namespace rs
