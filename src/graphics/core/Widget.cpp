#include "Widget.h"

namespace rs
{
namespace gfx
{

void Widget::setBounds (const Rect& newBounds)
{
    if (getBounds() != newBounds)
    {
        Node::setBounds (newBounds);
        resized();
    }
}

void Widget::setBounds (float x, float y, float w, float h)
{
    setBounds (Rect (x, y, w, h));
}

} // namespace gfx
} // namespace rs
