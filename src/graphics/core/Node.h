#pragma once

#include "Types.h"
#include <vector>
#include <algorithm>

namespace rs
{
namespace gfx
{

// Children are not owned; whoever creates a child keeps it alive while attached
class Node
{
public:
    Node() = default;
    virtual ~Node();

    Node (const Node&) = delete;
    Node& operator= (const Node&) = delete;

    // ─── Tree structure ──────────────────────────────────

    void addChild (Node* child);
    void removeChild (Node* child);
    void removeAllChildren();
    Node* getParent() const { return parent; }

    int getNumChildren() const { return static_cast<int> (children.size()); }
    Node* getChild (int index) const;

    // ─── Bounds ──────────────────────────────────────────

    void setBounds (const Rect& newBounds);
    const Rect& getBounds() const { return bounds; }

    float getWidth() const { return bounds.width; }
    float getHeight() const { return bounds.height; }

    // ─── Dirty tracking ──────────────────────────────────

    void invalidate();
    bool isDirty() const { return dirty; }
    void clearDirty() { dirty = false; }

protected:
    void detachFromParent();

    Rect bounds;
    bool dirty = true;

    Node* parent = nullptr;
    std::vector<Node*> children;
};

} // namespace gfx
} // namespace rs
