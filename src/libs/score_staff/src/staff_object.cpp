#include <score_staff/staff_object.hpp>
#include <score_core/flowable.hpp>
#include <score_core/mapping.hpp>
#include <score_core/render_sink.hpp>
#include <score_staff/errors.hpp>
#include <score_staff/font_metrics.hpp>
#include <score_staff/staff.hpp>
#include <stdexcept>

namespace score_staff {

using score_core::ObjectKind;
using score_units::Unit;

StaffObject::StaffObject(score_units::Point pos, ObjectKind kind)
    : PositionedObject(pos, kind) {}

const Staff& StaffObject::staff() const {
    const auto* found = first_ancestor_of_kind(ObjectKind::Staff);
    if (!found)
        throw std::logic_error(std::string(score_core::object_kind_name(kind()))
            + " is not attached to a staff");
    return *static_cast<const Staff*>(found);
}

Staff& StaffObject::staff() {
    auto* found = first_ancestor_of_kind(ObjectKind::Staff);
    if (!found)
        throw std::logic_error(std::string(score_core::object_kind_name(kind()))
            + " is not attached to a staff");
    return *static_cast<Staff*>(found);
}

Unit StaffObject::pos_x_in_staff() const {
    return score_core::descendant_pos_x(staff(), *this);
}

bool StaffObject::at_line_start(const score_core::Line* line) const {
    const Staff& s = staff();
    return s.staff_pos_x_at(line) == pos_x_in_staff();
}

Unit StaffObject::glyph_width(const std::string& glyph_name) const {
    const Staff& s = staff();
    const auto bounds = s.font_metrics().glyph_bounds(glyph_name);
    if (!bounds)
        throw GlyphLookupError("no metrics for glyph '" + glyph_name + "'");
    return s.unit(bounds->width);
}

void StaffObject::draw_glyph(score_core::RenderSink& sink, const score_units::Point& pos,
    const std::string& glyph_name) const
{
    sink.draw_glyph(pos, glyph_name, glyph_width(glyph_name), staff().unit(1.0));
}

} // namespace score_staff
