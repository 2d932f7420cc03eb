// Tests for coordinate mapping across pages and flowables.

#include <gtest/gtest.h>

#include <score_core/document.hpp>
#include <score_core/errors.hpp>
#include <score_core/flowable.hpp>
#include <score_core/mapping.hpp>

namespace {

using score_core::Document;
using score_core::Flowable;
using score_core::PositionedObject;
using score_units::Point;
using score_units::mm;

// Letter paper: live area 175.9mm wide starting at (20mm, 20mm).
constexpr double live_width = 175.9;

// ---------------------------------------------------------------------------
// Outside flowables
// ---------------------------------------------------------------------------

TEST(Mapping, DescendantPosSumsLocalPositions) {
    PositionedObject root(Point{mm(100), mm(100)});
    auto& a = root.emplace_child<PositionedObject>(Point{mm(1), mm(2)});
    auto& b = a.emplace_child<PositionedObject>(Point{mm(3), mm(4)});

    EXPECT_EQ(score_core::descendant_pos(root, b), (Point{mm(4), mm(6)}));
    EXPECT_EQ(score_core::descendant_pos_x(a, b), mm(3));
    EXPECT_THROW(score_core::descendant_pos(b, root), score_core::DisjointTreeError);
}

TEST(Mapping, MapToDocumentOnPage) {
    Document doc;
    auto& obj = doc.page(0).emplace_child<PositionedObject>(Point{mm(10), mm(5)});
    auto& child = obj.emplace_child<PositionedObject>(Point{mm(1), mm(1)});

    EXPECT_EQ(score_core::map_to_document(obj), (Point{mm(30), mm(25)}));
    EXPECT_EQ(score_core::map_to_document(child), (Point{mm(31), mm(26)}));
    EXPECT_EQ(score_core::map_to_document(doc.page(0)), doc.page(0).pos());
}

TEST(Mapping, CommonAncestor) {
    PositionedObject root(Point{});
    auto& a = root.emplace_child<PositionedObject>(Point{});
    auto& a1 = a.emplace_child<PositionedObject>(Point{});
    auto& b = root.emplace_child<PositionedObject>(Point{});

    EXPECT_EQ(score_core::common_ancestor(a1, b), &root);
    EXPECT_EQ(score_core::common_ancestor(a1, a), &a);
    EXPECT_EQ(score_core::common_ancestor(a, a), &a);

    PositionedObject other(Point{});
    EXPECT_EQ(score_core::common_ancestor(a, other), nullptr);
}

TEST(Mapping, MapBetweenUnrelatedTreesThrows) {
    PositionedObject first(Point{});
    PositionedObject second(Point{});
    EXPECT_THROW(score_core::map_between(first, second), score_core::DisjointTreeError);
}

TEST(Mapping, MapBetweenSiblingsOnPage) {
    Document doc;
    auto& a = doc.page(0).emplace_child<PositionedObject>(Point{mm(10), mm(10)});
    auto& b = doc.page(0).emplace_child<PositionedObject>(Point{mm(15), mm(40)});
    EXPECT_EQ(score_core::map_between(a, b), (Point{mm(5), mm(30)}));
    EXPECT_EQ(score_core::map_between(b, a), (Point{mm(-5), mm(-30)}));
}

// ---------------------------------------------------------------------------
// Through flowables
// ---------------------------------------------------------------------------

TEST(Mapping, ObjectOnLaterLineMapsThroughItsLine) {
    Document doc;
    auto& flowable = doc.page(0).emplace_child<Flowable>(Point{mm(0), mm(10)}, mm(400), mm(30));
    auto& obj = flowable.emplace_child<PositionedObject>(Point{mm(200), mm(2)});

    ASSERT_EQ(flowable.lines().size(), 3u);
    EXPECT_EQ(score_core::enclosing_flowable(obj), &flowable);

    const Point pos = score_core::map_to_document(obj);
    EXPECT_NEAR(pos.x.value(), 20 + (200 - live_width), 1e-9);
    EXPECT_NEAR(pos.y.value(), 20 + 10 + 35 + 2, 1e-9);
}

TEST(Mapping, MapBetweenInsideFlowableStaysOnTimeline) {
    Document doc;
    auto& flowable = doc.page(0).emplace_child<Flowable>(Point{mm(0), mm(10)}, mm(400), mm(30));
    auto& early = flowable.emplace_child<PositionedObject>(Point{mm(10), mm(0)});
    auto& late = flowable.emplace_child<PositionedObject>(Point{mm(300), mm(5)});

    EXPECT_EQ(score_core::map_between(early, late), (Point{mm(290), mm(5)}));
}

TEST(Mapping, MapBetweenWrappedAndUnwrappedUsesDocumentSpace) {
    Document doc;
    auto& flowable = doc.page(0).emplace_child<Flowable>(Point{mm(0), mm(10)}, mm(400), mm(30));
    auto& wrapped = flowable.emplace_child<PositionedObject>(Point{mm(200), mm(0)});
    auto& loose = doc.page(0).emplace_child<PositionedObject>(Point{mm(0), mm(0)});

    const Point offset = score_core::map_between(loose, wrapped);
    EXPECT_NEAR(offset.x.value(), 200 - live_width, 1e-9);
    EXPECT_NEAR(offset.y.value(), 10 + 35, 1e-9);
}

} // namespace
