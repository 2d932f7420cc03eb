#include <score_staff/bar_line.hpp>
#include <score_core/mapping.hpp>
#include <score_core/render_sink.hpp>
#include <score_staff/staff.hpp>
#include <algorithm>
#include <stdexcept>
#include <utility>

namespace score_staff {

using score_core::ObjectKind;
using score_units::Point;
using score_units::Unit;

BarLine::BarLine(Unit pos_x, std::vector<const Staff*> staves)
    : PositionedObject(Point{pos_x, Unit(0.0, pos_x.type())}, ObjectKind::BarLine),
      staves_(std::move(staves))
{
    if (staves_.empty())
        throw std::invalid_argument("a bar line needs at least one staff");
}

const Staff& BarLine::highest_staff() const {
    return *staves_.front();
}

const Staff& BarLine::lowest_staff() const {
    return *staves_.back();
}

void BarLine::render_complete(score_core::RenderSink& sink, const Point& pos,
    const score_core::Line*, Unit)
{
    const Staff& top = highest_staff();
    const Staff& bottom = lowest_staff();
    // Both ends are measured from this bar line, which sits on the top staff.
    const Point to_bottom = score_core::map_between(top, bottom);
    const Unit top_y = pos.y - y() + top.barline_extent().first;
    const Unit bottom_y = pos.y - y() + to_bottom.y + bottom.barline_extent().second;
    sink.draw_line(Point{pos.x, top_y}, Point{pos.x, bottom_y},
        top.unit(top.engraving_settings().bar_line_thickness));
}

BarLine& add_bar_line(Unit pos_x, const std::vector<Staff*>& staves) {
    if (staves.empty())
        throw std::invalid_argument("a bar line needs at least one staff");

    Staff* reference = staves.front();
    std::vector<Staff*> ordered = staves;
    std::stable_sort(ordered.begin(), ordered.end(), [&](const Staff* a, const Staff* b) {
        return score_core::map_between(*reference, *a).y < score_core::map_between(*reference, *b).y;
    });

    std::vector<const Staff*> members(ordered.begin(), ordered.end());
    return ordered.front()->emplace_child<BarLine>(pos_x, std::move(members));
}

} // namespace score_staff
