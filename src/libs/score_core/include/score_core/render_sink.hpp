#pragma once

#include <score_units/point.hpp>
#include <string>

namespace score_core {

// Rendering backend. Receives final document-space geometry; the layout core
// never talks to a drawing API itself.
class RenderSink {
public:
    virtual ~RenderSink() = default;

    virtual void draw_line(const score_units::Point& from, const score_units::Point& to,
        score_units::Unit thickness) = 0;

    virtual void draw_rect(const score_units::Rect& rect, score_units::Unit thickness) = 0;

    // `pos` is the glyph origin (left edge, baseline). `width` is the measured
    // advance; `staff_space` is the size glyph metrics are expressed in.
    virtual void draw_glyph(const score_units::Point& pos, const std::string& glyph_name,
        score_units::Unit width, score_units::Unit staff_space) = 0;
};

} // namespace score_core
