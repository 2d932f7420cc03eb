#include <score_staff/time_signature.hpp>
#include <score_core/flowable.hpp>
#include <score_staff/staff.hpp>
#include <algorithm>
#include <stdexcept>

namespace score_staff {

using score_core::ObjectKind;
using score_units::Point;
using score_units::Unit;

namespace {

void check_meter(const Meter& meter) {
    if (meter.upper <= 0 || meter.lower < 0)
        throw std::invalid_argument("invalid meter " + std::to_string(meter.upper) + "/"
            + std::to_string(meter.lower));
}

} // namespace

std::vector<std::string> time_signature_digit_glyphs(int number) {
    std::vector<std::string> glyphs;
    for (char digit : std::to_string(number))
        glyphs.push_back(std::string("timeSig") + digit);
    return glyphs;
}

TimeSignature::TimeSignature(Unit pos_x, Meter meter)
    : StaffObject(Point{pos_x, Unit(0.0, pos_x.type())}, ObjectKind::TimeSignature),
      meter_(meter)
{
    check_meter(meter_);
}

void TimeSignature::set_meter(Meter meter) {
    check_meter(meter);
    meter_ = meter;
    if (auto* s = first_ancestor_of_kind(ObjectKind::Staff))
        static_cast<Staff*>(s)->invalidate_layout_caches();
}

std::vector<std::string> TimeSignature::upper_glyphs() const {
    return time_signature_digit_glyphs(meter_.upper);
}

std::vector<std::string> TimeSignature::lower_glyphs() const {
    if (meter_.lower == 0) return {};
    return time_signature_digit_glyphs(meter_.lower);
}

Unit TimeSignature::row_width(const std::vector<std::string>& glyphs) const {
    Unit width = staff().unit(0.0);
    for (const auto& glyph : glyphs)
        width += glyph_width(glyph);
    return width;
}

Unit TimeSignature::visual_width() const {
    return std::max(row_width(upper_glyphs()), row_width(lower_glyphs()));
}

void TimeSignature::draw_row(score_core::RenderSink& sink, const Point& left,
    const std::vector<std::string>& glyphs, Unit total_width) const
{
    Unit x = left.x + (total_width - row_width(glyphs)) / 2.0;
    for (const auto& glyph : glyphs) {
        draw_glyph(sink, Point{x, left.y}, glyph);
        x += glyph_width(glyph);
    }
}

void TimeSignature::render_complete(score_core::RenderSink& sink, const Point& pos,
    const score_core::Line* line, Unit)
{
    const Staff& s = staff();
    Unit x = pos.x;
    if (at_line_start(line)) {
        const StaffFringeLayout fringe = s.fringe_layout_at(line);
        x += fringe.time_signature.value_or(Unit(0.0, s.unit_type()));
    }

    const Unit width = visual_width();
    const auto lower = lower_glyphs();
    if (lower.empty()) {
        draw_row(sink, Point{x, pos.y + s.center_y()}, upper_glyphs(), width);
        return;
    }
    draw_row(sink, Point{x, pos.y + s.unit(1.0)}, upper_glyphs(), width);
    draw_row(sink, Point{x, pos.y + s.unit(3.0)}, lower, width);
}

} // namespace score_staff
