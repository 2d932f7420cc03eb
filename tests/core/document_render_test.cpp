// Tests for the render pass: hooks, slice dispatch and failure handling.

#include <gtest/gtest.h>

#include <score_core/document.hpp>
#include <score_core/errors.hpp>
#include <score_core/flowable.hpp>

#include <string>
#include <vector>

#include "test_helpers.h"

namespace {

using score_core::Document;
using score_core::Flowable;
using score_core::Line;
using score_core::ObjectKind;
using score_core::PositionedObject;
using score_units::Point;
using score_units::Unit;
using score_units::mm;

constexpr double live_width = 175.9;

// ---------------------------------------------------------------------------
// Helper
// ---------------------------------------------------------------------------

struct SliceCall {
    std::string kind;
    Point pos;
    Unit offset;
};

// Records which slices it is asked to draw.
class SpanningObject : public PositionedObject {
public:
    SpanningObject(Point pos, Unit length) : PositionedObject(pos), length_(length) {}

    Unit breakable_length() const override { return length_; }

    void render_complete(score_core::RenderSink&, const Point& pos, const Line*,
        Unit flowable_x) override
    {
        calls.push_back({"complete", pos, flowable_x});
    }
    void render_before_break(score_core::RenderSink&, const Point& pos, const Line&,
        Unit flowable_x) override
    {
        calls.push_back({"before_break", pos, flowable_x});
    }
    void render_spanning_continuation(score_core::RenderSink&, const Point& pos, const Line&,
        Unit object_x) override
    {
        calls.push_back({"spanning", pos, object_x});
    }
    void render_after_break(score_core::RenderSink&, const Point& pos, const Line&,
        Unit object_x) override
    {
        calls.push_back({"after_break", pos, object_x});
    }

    std::vector<SliceCall> calls;

private:
    Unit length_;
};

// Counts hooks and optionally reserves a margin on its flowable each pass.
class HookObject : public PositionedObject {
public:
    explicit HookObject(Point pos, Unit margin = score_units::zero)
        : PositionedObject(pos), margin_(margin) {}

    void pre_render_hook() override {
        ++pre;
        if (margin_ > score_units::zero) {
            auto* flowable = static_cast<Flowable*>(first_ancestor_of_kind(ObjectKind::Flowable));
            flowable->add_pass_margin_controller(mm(0), margin_, "hook");
        }
    }
    void post_render_hook() override { ++post; }

    int pre = 0;
    int post = 0;

private:
    Unit margin_;
};

// ---------------------------------------------------------------------------
// Slice dispatch
// ---------------------------------------------------------------------------

TEST(DocumentRender, ObjectOnOneLineRendersComplete) {
    Document doc;
    auto& flowable = doc.page(0).emplace_child<Flowable>(Point{mm(0), mm(10)}, mm(500), mm(30));
    auto& obj = flowable.emplace_child<SpanningObject>(Point{mm(20), mm(3)}, mm(50));

    score_test::RecordingSink sink;
    doc.render(sink);

    ASSERT_EQ(obj.calls.size(), 1u);
    EXPECT_EQ(obj.calls[0].kind, "complete");
    EXPECT_EQ(obj.calls[0].pos, (Point{mm(40), mm(33)}));
    EXPECT_EQ(obj.calls[0].offset, mm(20));
}

TEST(DocumentRender, SpanningObjectIsSlicedAcrossLines) {
    Document doc;
    auto& flowable = doc.page(0).emplace_child<Flowable>(Point{mm(0), mm(10)}, mm(800), mm(30));
    auto& obj = flowable.emplace_child<SpanningObject>(Point{mm(100), mm(0)}, mm(400));

    score_test::RecordingSink sink;
    doc.render(sink);

    ASSERT_EQ(obj.calls.size(), 3u);
    EXPECT_EQ(obj.calls[0].kind, "before_break");
    EXPECT_EQ(obj.calls[0].offset, mm(100));

    EXPECT_EQ(obj.calls[1].kind, "spanning");
    EXPECT_NEAR(obj.calls[1].offset.value(), live_width - 100, 1e-9);
    EXPECT_NEAR(obj.calls[1].pos.x.value(), 20.0, 1e-9);
    EXPECT_NEAR(obj.calls[1].pos.y.value(), 20 + 10 + 35, 1e-9);

    EXPECT_EQ(obj.calls[2].kind, "after_break");
    EXPECT_NEAR(obj.calls[2].offset.value(), 2 * live_width - 100, 1e-9);
}

TEST(DocumentRender, ObjectEndingAtLineEndIsNotContinued) {
    Document doc;
    auto& flowable = doc.page(0).emplace_child<Flowable>(Point{mm(0), mm(0)}, mm(100), mm(30));
    auto& obj = flowable.emplace_child<SpanningObject>(Point{mm(0), mm(0)}, mm(100));

    score_test::RecordingSink sink;
    doc.render(sink);

    ASSERT_EQ(obj.calls.size(), 1u);
    EXPECT_EQ(obj.calls[0].kind, "complete");
}

TEST(DocumentRender, ObjectsOutsideFlowablesRenderAtDocumentPosition) {
    Document doc;
    auto& obj = doc.page(0).emplace_child<SpanningObject>(Point{mm(5), mm(6)}, mm(500));

    score_test::RecordingSink sink;
    doc.render(sink);

    ASSERT_EQ(obj.calls.size(), 1u);
    EXPECT_EQ(obj.calls[0].kind, "complete");
    EXPECT_EQ(obj.calls[0].pos, (Point{mm(25), mm(26)}));
}

TEST(DocumentRender, PagePreviewsAreOptional) {
    Document doc;
    doc.page(1).emplace_child<SpanningObject>(Point{}, mm(0));

    score_test::RecordingSink plain;
    doc.render(plain);
    EXPECT_TRUE(plain.rects.empty());

    score_test::RecordingSink previews;
    doc.render(previews, true);
    EXPECT_EQ(previews.rects.size(), 4u);
}

// ---------------------------------------------------------------------------
// Hooks and failures
// ---------------------------------------------------------------------------

TEST(DocumentRender, HooksRunOncePerPass) {
    Document doc;
    auto& flowable = doc.page(0).emplace_child<Flowable>(Point{}, mm(300), mm(30));
    auto& hook = flowable.emplace_child<HookObject>(Point{}, mm(10));

    score_test::RecordingSink sink;
    doc.render(sink);
    doc.render(sink);

    EXPECT_EQ(hook.pre, 2);
    EXPECT_EQ(hook.post, 2);
    // Controllers registered during the pass do not pile up.
    EXPECT_EQ(flowable.pass_margin_controllers().size(), 1u);
    EXPECT_TRUE(flowable.margin_controllers().empty());
    EXPECT_EQ(flowable.lines()[0].page_pos.x, mm(10));
}

TEST(DocumentRender, CallerControllersSurviveRenderPasses) {
    Document doc;
    auto& flowable = doc.page(0).emplace_child<Flowable>(Point{}, mm(300), mm(30));
    flowable.add_margin_controller(mm(0), mm(30), "caller");
    flowable.emplace_child<HookObject>(Point{}, mm(10));

    score_test::RecordingSink sink;
    doc.render(sink);
    doc.render(sink);

    ASSERT_EQ(flowable.margin_controllers().size(), 1u);
    EXPECT_EQ(flowable.pass_margin_controllers().size(), 1u);
    EXPECT_EQ(flowable.lines()[0].page_pos.x, mm(30));
    EXPECT_EQ(flowable.margin_needed_at(mm(0)), mm(30));
}

TEST(DocumentRender, EmptyTrailingPagesAreDropped) {
    Document doc;
    auto& flowable = doc.page(0).emplace_child<Flowable>(Point{}, mm(400), mm(200));

    score_test::RecordingSink sink;
    doc.render(sink);
    ASSERT_EQ(flowable.lines().size(), 3u);
    EXPECT_EQ(flowable.lines().back().page_index, 2u);
    EXPECT_EQ(doc.page_count(), 3u);

    flowable.set_length(mm(100));
    doc.render(sink);
    EXPECT_EQ(doc.page_count(), 1u);
}

TEST(DocumentRender, PagesWithContentAreKept) {
    Document doc;
    doc.page(0).emplace_child<Flowable>(Point{}, mm(100), mm(30));
    doc.page(2).emplace_child<SpanningObject>(Point{}, mm(0));

    score_test::RecordingSink sink;
    doc.render(sink);
    EXPECT_EQ(doc.page_count(), 3u);
}

TEST(DocumentRender, LayoutErrorAbortsPassButRunsPostHooks) {
    Document doc;
    auto& flowable = doc.page(0).emplace_child<Flowable>(Point{}, mm(300), mm(30));
    auto& hook = flowable.emplace_child<HookObject>(Point{}, mm(400));
    auto& obj = flowable.emplace_child<SpanningObject>(Point{}, mm(10));

    score_test::RecordingSink sink;
    EXPECT_THROW(doc.render(sink), score_core::LayoutError);
    EXPECT_EQ(hook.pre, 1);
    EXPECT_EQ(hook.post, 1);
    EXPECT_TRUE(obj.calls.empty());
}

} // namespace
