#pragma once

#include <score_staff/staff_object.hpp>
#include <optional>
#include <string_view>

namespace score_staff {

enum class ClefType { Treble, Bass, Alto, Tenor, Percussion };

struct ClefTypeInfo {
    const char* name;
    const char* glyph_name;
    // Staff y of the glyph origin, and of middle C under this clef.
    double staff_position;
    double middle_c_staff_position;
};

const ClefTypeInfo& clef_type_info(ClefType type);
std::optional<ClefType> clef_type_from_name(std::string_view name);

// Sets pitch meaning from its position to the next clef. Redrawn in the
// fringe of every line it stays active on.
class Clef : public StaffObject {
public:
    Clef(score_units::Unit pos_x, ClefType type);

    ClefType clef_type() const { return type_; }
    void set_clef_type(ClefType type);
    const char* glyph_name() const { return clef_type_info(type_).glyph_name; }

    score_units::Unit bounding_width() const;
    score_units::Unit middle_c_staff_position() const;

    score_units::Unit breakable_length() const override;

    void render_complete(score_core::RenderSink& sink, const score_units::Point& pos,
        const score_core::Line* line, score_units::Unit flowable_x) override;
    void render_spanning_continuation(score_core::RenderSink& sink, const score_units::Point& pos,
        const score_core::Line& line, score_units::Unit object_x) override;
    void render_after_break(score_core::RenderSink& sink, const score_units::Point& pos,
        const score_core::Line& line, score_units::Unit object_x) override;

private:
    void render_in_fringe(score_core::RenderSink& sink, const score_units::Point& line_pos,
        const score_core::Line* line) const;

    ClefType type_;
};

} // namespace score_staff
