#include <score_render/imgui_render_sink.hpp>
#include "imgui.h"
#include <algorithm>

namespace score_render {

namespace {

const unsigned int ink_color = IM_COL32(230, 230, 225, 255);
const unsigned int frame_color = IM_COL32(110, 110, 118, 255);
const unsigned int glyph_color = IM_COL32(120, 180, 240, 255);
const float min_thickness = 1.0f;
// Below this many pixels per staff space glyph labels are unreadable.
const float min_label_staff_space = 14.0f;

ImVec2 world_to_screen(const score_units::Point& p, float offset_x, float offset_y, float zoom) {
    return ImVec2((float)p.x.base_value() * zoom + offset_x, (float)p.y.base_value() * zoom + offset_y);
}

} // namespace

ImGuiRenderSink::ImGuiRenderSink(ImDrawList* draw_list, float offset_x, float offset_y, float zoom)
    : draw_list_(draw_list), offset_x_(offset_x), offset_y_(offset_y), zoom_(zoom) {}

void ImGuiRenderSink::draw_line(const score_units::Point& from, const score_units::Point& to,
    score_units::Unit thickness)
{
    ++primitive_count_;
    if (!draw_list_) return;
    const float width = std::max(min_thickness, (float)thickness.base_value() * zoom_);
    draw_list_->AddLine(world_to_screen(from, offset_x_, offset_y_, zoom_),
        world_to_screen(to, offset_x_, offset_y_, zoom_), ink_color, width);
}

void ImGuiRenderSink::draw_rect(const score_units::Rect& rect, score_units::Unit thickness) {
    ++primitive_count_;
    if (!draw_list_) return;
    const score_units::Point min_pt{rect.x, rect.y};
    const score_units::Point max_pt{rect.right(), rect.bottom()};
    const float width = std::max(min_thickness, (float)thickness.base_value() * zoom_);
    draw_list_->AddRect(world_to_screen(min_pt, offset_x_, offset_y_, zoom_),
        world_to_screen(max_pt, offset_x_, offset_y_, zoom_), frame_color, 0.0f, 0, width);
}

void ImGuiRenderSink::draw_glyph(const score_units::Point& pos, const std::string& glyph_name,
    score_units::Unit width, score_units::Unit staff_space)
{
    ++primitive_count_;
    if (!draw_list_) return;
    const score_units::Point top_left{pos.x, pos.y - staff_space};
    const score_units::Point bottom_right{pos.x + width, pos.y + staff_space};
    const ImVec2 a = world_to_screen(top_left, offset_x_, offset_y_, zoom_);
    const ImVec2 b = world_to_screen(bottom_right, offset_x_, offset_y_, zoom_);
    draw_list_->AddRectFilled(a, b, IM_COL32(120, 180, 240, 40));
    draw_list_->AddRect(a, b, glyph_color, 0.0f, 0, min_thickness);

    if ((float)staff_space.base_value() * zoom_ >= min_label_staff_space) {
        draw_list_->AddText(ImVec2(a.x + 2.0f, a.y + 1.0f), glyph_color, glyph_name.c_str());
    }
}

} // namespace score_render
