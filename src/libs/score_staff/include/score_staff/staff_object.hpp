#pragma once

#include <score_core/positioned_object.hpp>
#include <string>

namespace score_core {
struct Line;
}

namespace score_staff {

class Staff;

// Base for objects that live somewhere below a Staff and measure themselves
// in its staff spaces.
class StaffObject : public score_core::PositionedObject {
public:
    StaffObject(score_units::Point pos, score_core::ObjectKind kind);

    // Throws std::logic_error when not attached below a staff.
    const Staff& staff() const;
    Staff& staff();
    score_units::Unit pos_x_in_staff() const;

    // True when this object sits exactly where `line` starts on the staff.
    bool at_line_start(const score_core::Line* line) const;

protected:
    // Width of `glyph_name` in the staff's units. Throws GlyphLookupError.
    score_units::Unit glyph_width(const std::string& glyph_name) const;
    void draw_glyph(score_core::RenderSink& sink, const score_units::Point& pos,
        const std::string& glyph_name) const;
};

} // namespace score_staff
