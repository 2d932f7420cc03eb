#include <score_canvas/score_canvas.hpp>
#include <score_core/document.hpp>
#include <score_core/errors.hpp>
#include <score_render/imgui_render_sink.hpp>
#include <score_staff/errors.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>
#include "imgui.h"
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <memory>

namespace {

const float min_zoom = 0.1f;
const float max_zoom = 40.0f;
const float fit_margin_px = 24.0f;

std::filesystem::path find_project_root() {
    std::filesystem::path p = std::filesystem::current_path();
    for (int i = 0; i < 8; ++i) {
        if (std::filesystem::exists(p / "CMakeLists.txt") && std::filesystem::exists(p / "src")) {
            return p;
        }
        if (!p.has_parent_path()) break;
        p = p.parent_path();
    }
    return std::filesystem::current_path();
}

std::shared_ptr<spdlog::logger> viewer_logger() {
    static std::shared_ptr<spdlog::logger> logger;
    if (logger) return logger;

    try {
        const std::filesystem::path logs_dir = find_project_root() / "logs";
        std::filesystem::create_directories(logs_dir);
        const std::filesystem::path log_file = logs_dir / "score_viewer_latest.log";
        logger = spdlog::basic_logger_mt("score_viewer_logger", log_file.string(), true);
        logger->set_level(spdlog::level::info);
        logger->flush_on(spdlog::level::info);
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
        logger->info("Viewer logger initialized. file={}", log_file.string());
    } catch (const spdlog::spdlog_ex&) {
        logger = spdlog::default_logger();
    } catch (const std::filesystem::filesystem_error&) {
        logger = spdlog::default_logger();
    }
    return logger;
}

} // namespace

namespace score_canvas {

ScoreCanvas::ScoreCanvas() = default;

ScoreCanvas::~ScoreCanvas() = default;

void ScoreCanvas::set_document(score_core::Document* document) {
    document_ = document;
    layout_error_.clear();
    needs_fit_ = true;
}

void ScoreCanvas::pan(float dx, float dy) {
    offset_x_ += dx;
    offset_y_ += dy;
}

void ScoreCanvas::zoom_at(float screen_x, float screen_y, float zoom_delta) {
    float new_zoom = std::clamp(zoom_ * zoom_delta, min_zoom, max_zoom);
    float factor = new_zoom / zoom_;
    offset_x_ = screen_x - (screen_x - offset_x_) * factor;
    offset_y_ = screen_y - (screen_y - offset_y_) * factor;
    zoom_ = new_zoom;
}

void ScoreCanvas::zoom_at_center(float zoom_delta) {
    zoom_ = std::clamp(zoom_ * zoom_delta, min_zoom, max_zoom);
}

void ScoreCanvas::screen_to_world(float screen_x, float screen_y, double& world_x, double& world_y) const {
    world_x = (screen_x - offset_x_) / zoom_;
    world_y = (screen_y - offset_y_) / zoom_;
}

void ScoreCanvas::world_to_screen(double world_x, double world_y, float& screen_x, float& screen_y) const {
    screen_x = (float)world_x * zoom_ + offset_x_;
    screen_y = (float)world_y * zoom_ + offset_y_;
}

void ScoreCanvas::fit_first_page(float region_width, float region_height) {
    if (!document_) return;
    const score_units::Rect page = document_->page(0).document_space_bounding_rect();
    const float page_w = (float)page.width.base_value();
    const float page_h = (float)page.height.base_value();
    if (page_w <= 0 || page_h <= 0) return;

    const ImVec2 origin = ImGui::GetCursorScreenPos();
    const float usable_w = std::max(1.0f, region_width - 2.0f * fit_margin_px);
    const float usable_h = std::max(1.0f, region_height - 2.0f * fit_margin_px);
    zoom_ = std::clamp(std::min(usable_w / page_w, usable_h / page_h), min_zoom, max_zoom);
    offset_x_ = origin.x + (region_width - page_w * zoom_) * 0.5f - (float)page.x.base_value() * zoom_;
    offset_y_ = origin.y + fit_margin_px - (float)page.y.base_value() * zoom_;
}

void ScoreCanvas::draw_grid(ImVec2 region_min, ImVec2 region_max) {
    ImDrawList* dl = ImGui::GetWindowDrawList();
    if (!dl) return;

    const unsigned int grid_color = IM_COL32(50, 50, 55, 255);
    const float grid_thickness = 1.0f;

    double left_world, top_world, right_world, bottom_world;
    screen_to_world(region_min.x, region_min.y, left_world, top_world);
    screen_to_world(region_max.x, region_max.y, right_world, bottom_world);

    if (grid_step_ * zoom_ < 8.0f) return;

    double start_x = std::floor(left_world / grid_step_) * grid_step_;
    double start_y = std::floor(top_world / grid_step_) * grid_step_;

    for (double wx = start_x; wx <= right_world + grid_step_; wx += grid_step_) {
        float sx1, sy1, sx2, sy2;
        world_to_screen(wx, top_world, sx1, sy1);
        world_to_screen(wx, bottom_world, sx2, sy2);
        dl->AddLine(ImVec2(sx1, sy1), ImVec2(sx2, sy2), grid_color, grid_thickness);
    }
    for (double wy = start_y; wy <= bottom_world + grid_step_; wy += grid_step_) {
        float sx1, sy1, sx2, sy2;
        world_to_screen(left_world, wy, sx1, sy1);
        world_to_screen(right_world, wy, sx2, sy2);
        dl->AddLine(ImVec2(sx1, sy1), ImVec2(sx2, sy2), grid_color, grid_thickness);
    }
}

void ScoreCanvas::handle_input(float region_width, float region_height) {
    ImGuiIO& io = ImGui::GetIO();
    ImVec2 mouse = io.MousePos;
    ImVec2 win_min = ImGui::GetWindowPos();
    ImVec2 win_max = ImVec2(win_min.x + region_width, win_min.y + region_height);

    bool in_region = mouse.x >= win_min.x && mouse.x <= win_max.x &&
                     mouse.y >= win_min.y && mouse.y <= win_max.y;

    if (ImGui::IsMouseClicked(0) && in_region) {
        dragging_ = true;
        drag_start_x_ = mouse.x;
        drag_start_y_ = mouse.y;
        drag_start_offset_x_ = offset_x_;
        drag_start_offset_y_ = offset_y_;
    }
    if (ImGui::IsMouseReleased(0))
        dragging_ = false;

    if (dragging_) {
        offset_x_ = drag_start_offset_x_ + (mouse.x - drag_start_x_);
        offset_y_ = drag_start_offset_y_ + (mouse.y - drag_start_y_);
    }

    if (in_region && io.MouseWheel != 0.0f) {
        float factor = io.MouseWheel > 0 ? 1.2f : 1.0f / 1.2f;
        zoom_at(mouse.x, mouse.y, factor);
    }

    if (in_region && ImGui::IsKeyPressed(ImGuiKey_F))
        needs_fit_ = true;
    if (in_region && ImGui::IsKeyPressed(ImGuiKey_P))
        page_previews_ = !page_previews_;
}

void ScoreCanvas::report_layout_error(const char* event, const std::string& reason) {
    if (layout_error_ != reason)
        viewer_logger()->error("{} reason={}", event, reason);
    layout_error_ = reason;
}

bool ScoreCanvas::update_and_draw(float region_width, float region_height) {
    if (region_width <= 0 || region_height <= 0) return false;

    handle_input(region_width, region_height);
    if (needs_fit_) {
        fit_first_page(region_width, region_height);
        needs_fit_ = false;
    }

    ImVec2 region_min = ImGui::GetCursorScreenPos();
    ImVec2 region_max = ImVec2(region_min.x + region_width, region_min.y + region_height);

    ImDrawList* draw_list = ImGui::GetWindowDrawList();
    if (!draw_list) return true;

    draw_grid(region_min, region_max);
    if (!document_) return true;

    score_render::ImGuiRenderSink sink(draw_list, offset_x_, offset_y_, zoom_);
    try {
        document_->render(sink, page_previews_);
        if (!layout_error_.empty())
            viewer_logger()->info("layout_recovered");
        layout_error_.clear();
    } catch (const score_core::LayoutError& e) {
        report_layout_error("layout_failed", e.what());
    } catch (const score_staff::NoClefError& e) {
        report_layout_error("no_clef", e.what());
    } catch (const score_staff::GlyphLookupError& e) {
        report_layout_error("glyph_missing", e.what());
    }

    if (!layout_error_.empty()) {
        draw_list->AddText(ImVec2(region_min.x + 8.0f, region_min.y + 8.0f),
            IM_COL32(240, 110, 100, 255), layout_error_.c_str());
    }
    return true;
}

} // namespace score_canvas
