#pragma once

#include <score_core/positioned_object.hpp>
#include <cstddef>
#include <string>
#include <vector>

namespace score_core {

class Page;

// A point in a Flowable's timeline: x runs along the unbroken timeline, y is
// measured from the flowable's top. Only Flowable::map_to_document turns it
// into a document-space Point.
struct TimelinePoint {
    score_units::Unit x;
    score_units::Unit y;
};

// Lines starting at or after `flowable_x` must leave `margin_left` free at
// their start. Controllers sharing a layout key replace one another.
struct MarginController {
    score_units::Unit flowable_x;
    score_units::Unit margin_left;
    std::string layout_key;
};

// One broken segment of a Flowable's timeline.
struct Line {
    score_units::Unit flowable_x;
    score_units::Unit length;
    std::size_t page_index = 0;
    // Page-relative origin of the line's content; fringes are drawn left of it.
    score_units::Point page_pos;

    score_units::Unit flowable_end() const { return flowable_x + length; }
};

bool operator==(const Line& a, const Line& b);
bool operator!=(const Line& a, const Line& b);

enum class LayoutState { Unbroken, Breaking, Broken };

// One continuous horizontal timeline, wrapped over lines and pages on demand.
class Flowable : public PositionedObject {
public:
    Flowable(score_units::Point pos, score_units::Unit length, score_units::Unit height,
        score_units::Unit y_padding = score_units::mm(5));

    score_units::Unit length() const { return length_; }
    void set_length(score_units::Unit length);
    score_units::Unit height() const { return height_; }
    void set_height(score_units::Unit height);
    score_units::Unit y_padding() const { return y_padding_; }
    void set_y_padding(score_units::Unit y_padding);

    LayoutState layout_state() const { return state_; }

    // Kept until cleared explicitly.
    void add_margin_controller(MarginController controller);
    void add_margin_controller(score_units::Unit flowable_x, score_units::Unit margin_left,
        std::string layout_key);
    // Registered from a pre-render hook; dropped at the start of the next pass.
    void add_pass_margin_controller(MarginController controller);
    void add_pass_margin_controller(score_units::Unit flowable_x, score_units::Unit margin_left,
        std::string layout_key);
    // Clears both kinds.
    void clear_margin_controllers();
    const std::vector<MarginController>& margin_controllers() const { return controllers_; }
    const std::vector<MarginController>& pass_margin_controllers() const { return pass_controllers_; }

    // Largest requirement among all controllers in force at `flowable_x`
    // (per layout key, the last one at or before it).
    score_units::Unit margin_needed_at(score_units::Unit flowable_x) const;

    // Breaks the timeline if needed. Throws LayoutError when a line cannot fit.
    const std::vector<Line>& lines() const;
    void invalidate_layout();

    // Index of the line containing `flowable_x` (the last line starting at or before it).
    std::size_t line_index_at(score_units::Unit flowable_x) const;
    const Line& line_at(score_units::Unit flowable_x) const;

    score_units::Point line_document_origin(const Line& line) const;
    score_units::Point map_to_document(const TimelinePoint& point) const;

    TimelinePoint timeline_pos(const PositionedObject& descendant) const;
    score_units::Unit descendant_pos_x(const PositionedObject& descendant) const;

    // Dispatches complete / before-break / spanning-continuation / after-break
    // slices of `object` over the lines its timeline extent touches.
    void render_object(PositionedObject& object, RenderSink& sink) const;

    void pre_render_hook() override;

protected:
    // Moving the flowable itself moves every line origin.
    void on_subtree_changed(const PositionedObject& changed) override;

private:
    void break_lines() const;
    const Page& owning_page() const;
    Page& line_page(const Line& line) const;

    score_units::Unit length_;
    score_units::Unit height_;
    score_units::Unit y_padding_;
    std::vector<MarginController> controllers_;
    std::vector<MarginController> pass_controllers_;
    mutable std::vector<Line> lines_;
    mutable LayoutState state_ = LayoutState::Unbroken;
};

} // namespace score_core
