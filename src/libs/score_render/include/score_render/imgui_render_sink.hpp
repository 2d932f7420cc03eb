#pragma once

#include <score_core/render_sink.hpp>
#include <cstddef>

struct ImDrawList;

namespace score_render {

// Draws document-space geometry (base units) into an ImGui draw list.
// Glyphs are shown as labelled outlines sized by their measured advance.
class ImGuiRenderSink : public score_core::RenderSink {
public:
    ImGuiRenderSink(ImDrawList* draw_list, float offset_x, float offset_y, float zoom);

    void draw_line(const score_units::Point& from, const score_units::Point& to,
        score_units::Unit thickness) override;
    void draw_rect(const score_units::Rect& rect, score_units::Unit thickness) override;
    void draw_glyph(const score_units::Point& pos, const std::string& glyph_name,
        score_units::Unit width, score_units::Unit staff_space) override;

    std::size_t primitive_count() const { return primitive_count_; }

private:
    ImDrawList* draw_list_ = nullptr;
    float offset_x_ = 0;
    float offset_y_ = 0;
    float zoom_ = 1.0f;
    std::size_t primitive_count_ = 0;
};

} // namespace score_render
