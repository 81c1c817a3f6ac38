#include "Node.h"

namespace rs
{
namespace gfx
{

Node::~Node()
{
    removeAllChildren();
    detachFromParent();
}

// ─── Tree structure ──────────────────────────────────────

void Node::addChild (Node* child)
{
    if (child == nullptr || child == this || child->parent == this)
        return;

    child->detachFromParent();
    child->parent = this;
    children.push_back (child);
    invalidate();
}

void Node::removeChild (Node* child)
{
    auto it = std::find (children.begin(), children.end(), child);
    if (it == children.end())
        return;

    children.erase (it);
    child->parent = nullptr;
    invalidate();
}

void Node::removeAllChildren()
{
    if (children.empty())
        return;

    for (auto* child : children)
        child->parent = nullptr;

    children.clear();
    invalidate();
}

void Node::detachFromParent()
{
    if (parent != nullptr)
        parent->removeChild (this);
}

Node* Node::getChild (int index) const
{
    if (index < 0 || index >= getNumChildren())
        return nullptr;

    return children[static_cast<size_t> (index)];
}

// ─── Bounds and dirty tracking ───────────────────────────

void Node::setBounds (const Rect& newBounds)
{
    if (bounds == newBounds)
        return;

    bounds = newBounds;
    invalidate();
}

void Node::invalidate()
{
    // Marks the whole ancestor chain so the host repaints from the root
    for (Node* node = this; node != nullptr; node = node->parent)
        node->dirty = true;
}

} // namespace gfx
} // namespace rs
