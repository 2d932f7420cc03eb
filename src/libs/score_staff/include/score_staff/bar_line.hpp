#pragma once

#include <score_core/positioned_object.hpp>
#include <vector>

namespace score_staff {

class Staff;

// A vertical line through a set of staves, parented to the highest one.
class BarLine : public score_core::PositionedObject {
public:
    // `staves` must be non-empty; the first is taken as the parent staff.
    BarLine(score_units::Unit pos_x, std::vector<const Staff*> staves);

    const std::vector<const Staff*>& staves() const { return staves_; }
    const Staff& highest_staff() const;
    const Staff& lowest_staff() const;

    void render_complete(score_core::RenderSink& sink, const score_units::Point& pos,
        const score_core::Line* line, score_units::Unit flowable_x) override;

private:
    std::vector<const Staff*> staves_;
};

// Orders `staves` top to bottom, then attaches a bar line to the highest.
// Throws std::invalid_argument for an empty set and DisjointTreeError when the
// staves share no tree.
BarLine& add_bar_line(score_units::Unit pos_x, const std::vector<Staff*>& staves);

} // namespace score_staff
