// Tests for graphics/core/Node.h and Widget.h -- tree bookkeeping and dirty propagation.

#include "graphics/core/Widget.h"

#include <gtest/gtest.h>

namespace rs
{
namespace gfx
{
namespace
{

class CountingWidget : public Widget
{
public:
    void resized() override { ++resizeCount; }
    int resizeCount = 0;
};

TEST (NodeTest, AddAndRemoveChildren)
{
    Node root, a, b;

    root.addChild (&a);
    root.addChild (&b);
    root.addChild (&a);

    ASSERT_EQ (root.getNumChildren(), 2);
    EXPECT_EQ (root.getChild (0), &a);
    EXPECT_EQ (root.getChild (1), &b);
    EXPECT_EQ (root.getChild (2), nullptr);
    EXPECT_EQ (a.getParent(), &root);

    root.removeChild (&a);
    EXPECT_EQ (root.getNumChildren(), 1);
    EXPECT_EQ (a.getParent(), nullptr);

    root.removeAllChildren();
    EXPECT_EQ (root.getNumChildren(), 0);
    EXPECT_EQ (b.getParent(), nullptr);
}

TEST (NodeTest, IgnoresNullAndSelf)
{
    Node root;
    root.addChild (nullptr);
    root.addChild (&root);
    EXPECT_EQ (root.getNumChildren(), 0);
}

TEST (NodeTest, ReparentingDetachesFromOldParent)
{
    Node first, second, child;

    first.addChild (&child);
    second.addChild (&child);

    EXPECT_EQ (first.getNumChildren(), 0);
    EXPECT_EQ (second.getNumChildren(), 1);
    EXPECT_EQ (child.getParent(), &second);
}

TEST (NodeTest, InvalidatePropagatesToAncestors)
{
    Node root, middle, leaf;
    root.addChild (&middle);
    middle.addChild (&leaf);

    root.clearDirty();
    middle.clearDirty();
    leaf.clearDirty();

    leaf.invalidate();

    EXPECT_TRUE (leaf.isDirty());
    EXPECT_TRUE (middle.isDirty());
    EXPECT_TRUE (root.isDirty());
}

TEST (NodeTest, SetBoundsOnlyDirtiesOnChange)
{
    Node node;
    node.setBounds (Rect (0.0f, 0.0f, 10.0f, 10.0f));
    node.clearDirty();

    node.setBounds (Rect (0.0f, 0.0f, 10.0f, 10.0f));
    EXPECT_FALSE (node.isDirty());

    node.setBounds (Rect (0.0f, 0.0f, 20.0f, 10.0f));
    EXPECT_TRUE (node.isDirty());
    EXPECT_FLOAT_EQ (node.getWidth(), 20.0f);
}

TEST (NodeTest, DestroyedChildLeavesParent)
{
    Node root;
    {
        Node child;
        root.addChild (&child);
        EXPECT_EQ (root.getNumChildren(), 1);
    }
    EXPECT_EQ (root.getNumChildren(), 0);
}

TEST (RectTest, ContainsInclusiveCountsEdges)
{
    Rect rect (100.0f, 100.0f, 50.0f, 20.0f);

    EXPECT_TRUE (rect.containsInclusive (Point (100.0f, 100.0f)));
    EXPECT_TRUE (rect.containsInclusive (Point (150.0f, 120.0f)));
    EXPECT_FALSE (rect.containsInclusive (Point (150.5f, 110.0f)));
    EXPECT_FALSE (rect.containsInclusive (Point (10.0f, 10.0f)));
}

TEST (WidgetTest, ResizedOnlyCalledWhenBoundsChange)
{
    CountingWidget widget;

    widget.setBounds (0.0f, 0.0f, 100.0f, 50.0f);
    widget.setBounds (0.0f, 0.0f, 100.0f, 50.0f);
    EXPECT_EQ (widget.resizeCount, 1);

    widget.setBounds (0.0f, 0.0f, 100.0f, 60.0f);
    EXPECT_EQ (widget.resizeCount, 2);
}

TEST (WidgetTest, RepaintMarksDirty)
{
    CountingWidget widget;
    widget.clearDirty();
    widget.repaint();
    EXPECT_TRUE (widget.isDirty());
}

} // namespace
} // namespace gfx
} // namespace rs
