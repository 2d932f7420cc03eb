#include <score_core/page.hpp>
#include <score_core/render_sink.hpp>

namespace score_core {

namespace {

const double preview_line_thickness_mm = 0.25;

} // namespace

Page::Page(score_units::Point pos, std::size_t index, PageSide side, const Paper& paper,
    PageSupplier* supplier)
    : PositionedObject(pos, ObjectKind::Page),
      index_(index),
      side_(side),
      paper_(paper),
      supplier_(supplier) {}

void Page::set_paper(const Paper& paper) {
    paper_ = paper;
}

score_units::Rect Page::bounding_rect() const {
    const score_units::Unit rect_x = side_ == PageSide::Right
        ? -(paper_.gutter + paper_.margin_left)
        : -paper_.margin_left;
    return score_units::Rect{rect_x, -paper_.margin_top, paper_.width, paper_.height};
}

score_units::Rect Page::document_space_bounding_rect() const {
    score_units::Rect local = bounding_rect();
    local.x += x();
    local.y += y();
    return local;
}

score_units::Unit Page::full_margin_left() const {
    if (side_ == PageSide::Right) return paper_.margin_left + paper_.gutter;
    return paper_.margin_left;
}

score_units::Unit Page::full_margin_right() const {
    if (side_ == PageSide::Right) return paper_.margin_right;
    return paper_.margin_right + paper_.gutter;
}

void Page::render_geometry_preview(RenderSink& sink) const {
    const score_units::Unit thickness = score_units::mm(preview_line_thickness_mm);
    sink.draw_rect(document_space_bounding_rect(), thickness);
    sink.draw_rect(score_units::Rect{x(), y(), paper_.live_width(), paper_.live_height()}, thickness);
}

} // namespace score_core
