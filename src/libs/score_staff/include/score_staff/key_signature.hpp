#pragma once

#include <score_staff/staff_object.hpp>
#include <vector>

namespace score_staff {

// Sharps (positive) or flats (negative) in circle-of-fifths order, -7..7.
class KeySignature : public StaffObject {
public:
    // Throws std::invalid_argument outside -7..7.
    KeySignature(score_units::Unit pos_x, int fifths);

    int fifths() const { return fifths_; }
    void set_fifths(int fifths);
    int accidental_count() const { return fifths_ < 0 ? -fifths_ : fifths_; }
    const char* accidental_glyph() const;

    score_units::Unit visual_width() const;
    // Staff y of each accidental under the clef active here. Throws NoClefError.
    std::vector<score_units::Unit> accidental_positions() const;

    score_units::Unit breakable_length() const override;

    void render_complete(score_core::RenderSink& sink, const score_units::Point& pos,
        const score_core::Line* line, score_units::Unit flowable_x) override;
    void render_spanning_continuation(score_core::RenderSink& sink, const score_units::Point& pos,
        const score_core::Line& line, score_units::Unit object_x) override;
    void render_after_break(score_core::RenderSink& sink, const score_units::Point& pos,
        const score_core::Line& line, score_units::Unit object_x) override;

private:
    void draw_accidentals(score_core::RenderSink& sink, const score_units::Point& left) const;
    void render_in_fringe(score_core::RenderSink& sink, const score_units::Point& line_pos,
        const score_core::Line* line) const;

    int fifths_ = 0;
};

} // namespace score_staff
