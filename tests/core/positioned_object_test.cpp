// Tests for the positioned-object tree: ownership, traversal and change notification.

#include <gtest/gtest.h>

#include <score_core/positioned_object.hpp>

#include <stdexcept>
#include <vector>

namespace {

using score_core::ObjectKind;
using score_core::PositionedObject;
using score_units::Point;
using score_units::mm;

// ---------------------------------------------------------------------------
// Helper
// ---------------------------------------------------------------------------

class CountingObject : public PositionedObject {
public:
    explicit CountingObject(Point pos) : PositionedObject(pos) {}

    int changes = 0;
    std::vector<const PositionedObject*> changed_nodes;

protected:
    void on_subtree_changed(const PositionedObject& changed) override {
        ++changes;
        changed_nodes.push_back(&changed);
    }
};

// ---------------------------------------------------------------------------
// Ownership
// ---------------------------------------------------------------------------

TEST(PositionedObject, EmplaceChildSetsParent) {
    PositionedObject root(Point{mm(1), mm(2)});
    auto& child = root.emplace_child<PositionedObject>(Point{mm(3), mm(4)});

    EXPECT_EQ(child.parent(), &root);
    ASSERT_EQ(root.children().size(), 1u);
    EXPECT_EQ(root.children()[0].get(), &child);
    EXPECT_EQ(&child.root(), &root);
    EXPECT_TRUE(root.is_ancestor_of(child));
    EXPECT_FALSE(child.is_ancestor_of(root));
}

TEST(PositionedObject, DetachReturnsOwnership) {
    PositionedObject root(Point{});
    auto& child = root.emplace_child<PositionedObject>(Point{mm(3), mm(4)});
    child.emplace_child<PositionedObject>(Point{});

    auto owned = child.detach();
    ASSERT_NE(owned, nullptr);
    EXPECT_EQ(owned.get(), &child);
    EXPECT_EQ(owned->parent(), nullptr);
    EXPECT_TRUE(root.children().empty());
    EXPECT_EQ(owned->children().size(), 1u);

    EXPECT_EQ(root.detach(), nullptr);
}

TEST(PositionedObject, AdoptMovesDetachedSubtree) {
    PositionedObject root(Point{});
    auto& left = root.emplace_child<PositionedObject>(Point{});
    auto& right = root.emplace_child<PositionedObject>(Point{});
    auto& leaf = left.emplace_child<PositionedObject>(Point{mm(2), mm(0)});

    EXPECT_THROW(root.adopt(nullptr), std::invalid_argument);

    right.adopt(leaf.detach());
    EXPECT_EQ(leaf.parent(), &right);
    EXPECT_TRUE(left.children().empty());
    EXPECT_EQ(&leaf.root(), &root);
}

TEST(PositionedObject, AdoptingAnAncestorThrows) {
    auto top = std::make_unique<PositionedObject>(Point{});
    auto& below = top->emplace_child<PositionedObject>(Point{});
    EXPECT_THROW(below.adopt(std::move(top)), std::invalid_argument);
}

// ---------------------------------------------------------------------------
// Traversal
// ---------------------------------------------------------------------------

TEST(PositionedObject, ForEachDescendantIsPreOrder) {
    PositionedObject root(Point{});
    auto& a = root.emplace_child<PositionedObject>(Point{});
    auto& a1 = a.emplace_child<PositionedObject>(Point{});
    auto& b = root.emplace_child<PositionedObject>(Point{});

    std::vector<const PositionedObject*> seen;
    static_cast<const PositionedObject&>(root).for_each_descendant(
        [&](const PositionedObject& node) { seen.push_back(&node); });

    ASSERT_EQ(seen.size(), 3u);
    EXPECT_EQ(seen[0], &a);
    EXPECT_EQ(seen[1], &a1);
    EXPECT_EQ(seen[2], &b);
}

TEST(PositionedObject, KindQueries) {
    PositionedObject root(Point{}, ObjectKind::Page);
    auto& mid = root.emplace_child<PositionedObject>(Point{}, ObjectKind::Staff);
    auto& leaf = mid.emplace_child<PositionedObject>(Point{}, ObjectKind::Clef);
    mid.emplace_child<PositionedObject>(Point{}, ObjectKind::Clef);

    EXPECT_EQ(root.descendants_of_kind(ObjectKind::Clef).size(), 2u);
    EXPECT_EQ(leaf.first_ancestor_of_kind(ObjectKind::Staff), &mid);
    EXPECT_EQ(leaf.first_ancestor_of_kind(ObjectKind::Page), &root);
    EXPECT_EQ(mid.first_ancestor_of_kind(ObjectKind::Staff), nullptr);
    EXPECT_STREQ(score_core::object_kind_name(leaf.kind()), "Clef");
}

// ---------------------------------------------------------------------------
// Change notification
// ---------------------------------------------------------------------------

TEST(PositionedObject, MutationsNotifyAncestors) {
    CountingObject root(Point{});
    auto& mid = root.emplace_child<CountingObject>(Point{});
    EXPECT_EQ(root.changes, 1);

    auto& leaf = mid.emplace_child<PositionedObject>(Point{});
    EXPECT_EQ(root.changes, 2);
    EXPECT_EQ(mid.changes, 1);
    EXPECT_EQ(mid.changed_nodes.back(), &leaf);

    leaf.set_x(mm(5));
    EXPECT_EQ(root.changes, 3);
    EXPECT_EQ(mid.changes, 2);

    auto owned = leaf.detach();
    EXPECT_EQ(root.changes, 4);
    EXPECT_EQ(mid.changes, 3);

    owned->set_y(mm(1));
    EXPECT_EQ(root.changes, 4);
}

TEST(PositionedObject, DefaultBreakableLengthIsZero) {
    PositionedObject node(Point{mm(1), mm(1)});
    EXPECT_EQ(node.breakable_length(), score_units::zero);
}

} // namespace
