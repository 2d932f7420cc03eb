#include <score_staff/key_signature.hpp>
#include <score_core/flowable.hpp>
#include <score_staff/clef.hpp>
#include <score_staff/staff.hpp>
#include <array>
#include <stdexcept>
#include <string>

namespace score_staff {

using score_core::ObjectKind;
using score_units::Point;
using score_units::Unit;

namespace {

// Treble clef staff positions in the order accidentals are added.
constexpr std::array<double, 7> treble_sharp_positions{0.0, 1.5, -0.5, 1.0, 2.5, 0.5, 2.0};
constexpr std::array<double, 7> treble_flat_positions{2.0, 0.5, 2.5, 1.0, 3.0, 1.5, 3.5};

// Octave shift (in staff spaces) that keeps the pattern on the staff for a
// clef whose middle C sits at `middle_c`.
double clef_offset(double middle_c) {
    constexpr double treble_middle_c = 5.0;
    constexpr double octave = 3.5;
    double offset = middle_c - treble_middle_c;
    while (offset < -0.5) offset += octave;
    while (offset > 3.0) offset -= octave;
    return offset;
}

void check_fifths(int fifths) {
    if (fifths < -7 || fifths > 7)
        throw std::invalid_argument("key signature fifths must be in -7..7, got "
            + std::to_string(fifths));
}

} // namespace

KeySignature::KeySignature(Unit pos_x, int fifths)
    : StaffObject(Point{pos_x, Unit(0.0, pos_x.type())}, ObjectKind::KeySignature),
      fifths_(fifths)
{
    check_fifths(fifths_);
}

void KeySignature::set_fifths(int fifths) {
    check_fifths(fifths);
    fifths_ = fifths;
    if (auto* s = first_ancestor_of_kind(ObjectKind::Staff))
        static_cast<Staff*>(s)->invalidate_layout_caches();
}

const char* KeySignature::accidental_glyph() const {
    return fifths_ < 0 ? "accidentalFlat" : "accidentalSharp";
}

Unit KeySignature::visual_width() const {
    if (fifths_ == 0) return staff().unit(0.0);
    return glyph_width(accidental_glyph()) * static_cast<double>(accidental_count());
}

std::vector<Unit> KeySignature::accidental_positions() const {
    const Staff& s = staff();
    const double offset = clef_offset(s.middle_c_at(pos_x_in_staff()).value());
    const auto& pattern = fifths_ < 0 ? treble_flat_positions : treble_sharp_positions;
    std::vector<Unit> positions;
    for (int i = 0; i < accidental_count(); ++i)
        positions.push_back(s.unit(pattern[static_cast<std::size_t>(i)] + offset));
    return positions;
}

Unit KeySignature::breakable_length() const {
    return staff().distance_to_next_of_type(*this);
}

void KeySignature::draw_accidentals(score_core::RenderSink& sink, const Point& left) const {
    if (fifths_ == 0) return;
    const std::string glyph = accidental_glyph();
    const Unit advance = glyph_width(glyph);
    Unit x = left.x;
    for (const Unit& y : accidental_positions()) {
        draw_glyph(sink, Point{x, left.y + y}, glyph);
        x += advance;
    }
}

void KeySignature::render_in_fringe(score_core::RenderSink& sink, const Point& line_pos,
    const score_core::Line* line) const
{
    const Staff& s = staff();
    const StaffFringeLayout fringe = s.fringe_layout_at(line);
    const Unit x = line_pos.x + fringe.key_signature.value_or(Unit(0.0, s.unit_type()));
    draw_accidentals(sink, Point{x, line_pos.y});
}

void KeySignature::render_complete(score_core::RenderSink& sink, const Point& pos,
    const score_core::Line* line, Unit)
{
    if (at_line_start(line)) {
        render_in_fringe(sink, pos, line);
        return;
    }
    draw_accidentals(sink, pos);
}

void KeySignature::render_spanning_continuation(score_core::RenderSink& sink, const Point& pos,
    const score_core::Line& line, Unit)
{
    render_in_fringe(sink, pos, &line);
}

void KeySignature::render_after_break(score_core::RenderSink& sink, const Point& pos,
    const score_core::Line& line, Unit)
{
    render_in_fringe(sink, pos, &line);
}

} // namespace score_staff
