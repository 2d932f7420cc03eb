#include <score_staff/clef.hpp>
#include <score_core/flowable.hpp>
#include <score_staff/staff.hpp>
#include <array>

namespace score_staff {

using score_core::ObjectKind;
using score_units::Point;
using score_units::Unit;

namespace {

constexpr std::array<ClefTypeInfo, 5> clef_types{{
    {"treble", "gClef", 3.0, 5.0},
    {"bass", "fClef", 1.0, -1.0},
    {"alto", "cClef", 2.0, 2.0},
    {"tenor", "cClef", 1.0, 1.0},
    {"percussion", "unpitchedPercussionClef1", 2.0, 5.0},
}};

} // namespace

const ClefTypeInfo& clef_type_info(ClefType type) {
    return clef_types[static_cast<std::size_t>(type)];
}

std::optional<ClefType> clef_type_from_name(std::string_view name) {
    for (std::size_t i = 0; i < clef_types.size(); ++i) {
        if (name == clef_types[i].name) return static_cast<ClefType>(i);
    }
    return std::nullopt;
}

Clef::Clef(Unit pos_x, ClefType type)
    : StaffObject(Point{pos_x, Unit(0.0, pos_x.type())}, ObjectKind::Clef), type_(type) {}

void Clef::set_clef_type(ClefType type) {
    type_ = type;
    if (auto* s = first_ancestor_of_kind(ObjectKind::Staff))
        static_cast<Staff*>(s)->invalidate_layout_caches();
}

Unit Clef::bounding_width() const {
    return glyph_width(glyph_name());
}

Unit Clef::middle_c_staff_position() const {
    return staff().unit(clef_type_info(type_).middle_c_staff_position);
}

Unit Clef::breakable_length() const {
    return staff().distance_to_next_of_type(*this);
}

void Clef::render_in_fringe(score_core::RenderSink& sink, const Point& line_pos,
    const score_core::Line* line) const
{
    const Staff& s = staff();
    const StaffFringeLayout fringe = s.fringe_layout_at(line);
    const Unit x = line_pos.x + fringe.clef.value_or(Unit(0.0, s.unit_type()));
    draw_glyph(sink, Point{x, line_pos.y + s.unit(clef_type_info(type_).staff_position)},
        glyph_name());
}

void Clef::render_complete(score_core::RenderSink& sink, const Point& pos,
    const score_core::Line* line, Unit)
{
    if (at_line_start(line)) {
        render_in_fringe(sink, pos, line);
        return;
    }
    draw_glyph(sink, Point{pos.x, pos.y + staff().unit(clef_type_info(type_).staff_position)},
        glyph_name());
}

void Clef::render_spanning_continuation(score_core::RenderSink& sink, const Point& pos,
    const score_core::Line& line, Unit)
{
    render_in_fringe(sink, pos, &line);
}

void Clef::render_after_break(score_core::RenderSink& sink, const Point& pos,
    const score_core::Line& line, Unit)
{
    render_in_fringe(sink, pos, &line);
}

} // namespace score_staff
