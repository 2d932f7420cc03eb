#pragma once

#include <score_staff/staff_object.hpp>
#include <string>
#include <vector>

namespace score_staff {

// `lower` 0 draws the upper number alone, centered on the staff.
struct Meter {
    int upper = 4;
    int lower = 4;
};

class TimeSignature : public StaffObject {
public:
    // Throws std::invalid_argument for a non-positive upper or negative lower number.
    TimeSignature(score_units::Unit pos_x, Meter meter);

    const Meter& meter() const { return meter_; }
    void set_meter(Meter meter);

    std::vector<std::string> upper_glyphs() const;
    std::vector<std::string> lower_glyphs() const;

    // Width of the wider of the two numbers.
    score_units::Unit visual_width() const;

    void render_complete(score_core::RenderSink& sink, const score_units::Point& pos,
        const score_core::Line* line, score_units::Unit flowable_x) override;

private:
    score_units::Unit row_width(const std::vector<std::string>& glyphs) const;
    void draw_row(score_core::RenderSink& sink, const score_units::Point& left,
        const std::vector<std::string>& glyphs, score_units::Unit total_width) const;

    Meter meter_;
};

std::vector<std::string> time_signature_digit_glyphs(int number);

} // namespace score_staff
