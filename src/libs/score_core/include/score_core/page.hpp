#pragma once

#include <score_core/paper.hpp>
#include <score_core/positioned_object.hpp>
#include <cstddef>

namespace score_core {

class PageSupplier;

// The side a page lies on when bound; the gutter sits on the binding side.
enum class PageSide { Left, Right };

// A tree root. Its position is the top-left corner of the live area in
// document space. Pages are created by Document, never directly.
class Page : public PositionedObject {
public:
    Page(score_units::Point pos, std::size_t index, PageSide side, const Paper& paper,
        PageSupplier* supplier);

    std::size_t index() const { return index_; }
    PageSide side() const { return side_; }
    const Paper& paper() const { return paper_; }
    void set_paper(const Paper& paper);
    PageSupplier* supplier() const { return supplier_; }

    // Paper rect relative to the live-area origin.
    score_units::Rect bounding_rect() const;
    score_units::Rect document_space_bounding_rect() const;

    // Margins including the gutter when it falls on that side.
    score_units::Unit full_margin_left() const;
    score_units::Unit full_margin_right() const;

    score_units::Unit left_margin_x() const { return score_units::zero; }
    score_units::Unit right_margin_x() const { return paper_.live_width(); }
    score_units::Unit top_margin_y() const { return score_units::zero; }
    score_units::Unit bottom_margin_y() const { return paper_.live_height(); }
    score_units::Unit center_x() const { return paper_.live_width() / 2.0; }

    // Outlines of the paper and the live area, for interactive views.
    void render_geometry_preview(RenderSink& sink) const;

private:
    std::size_t index_ = 0;
    PageSide side_ = PageSide::Right;
    Paper paper_;
    PageSupplier* supplier_ = nullptr;
};

} // namespace score_core
