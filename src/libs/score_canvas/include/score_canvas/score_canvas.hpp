#pragma once

#include <string>

struct ImVec2;

namespace score_core {
class Document;
}

namespace score_canvas {

// Pan/zoom view over a Document. Runs a full render pass every frame.
class ScoreCanvas {
public:
    ScoreCanvas();
    ~ScoreCanvas();

    void set_document(score_core::Document* document);
    score_core::Document* document() const { return document_; }

    void set_page_previews(bool enabled) { page_previews_ = enabled; }
    bool page_previews() const { return page_previews_; }

    void set_grid_step(float step) { grid_step_ = step; }
    float grid_step() const { return grid_step_; }

    void pan(float dx, float dy);
    void zoom_at(float screen_x, float screen_y, float zoom_delta);
    void zoom_at_center(float zoom_delta);

    void screen_to_world(float screen_x, float screen_y, double& world_x, double& world_y) const;
    void world_to_screen(double world_x, double world_y, float& screen_x, float& screen_y) const;

    // Scales and centers the first page in the region.
    void fit_first_page(float region_width, float region_height);

    void set_offset(float ox, float oy) { offset_x_ = ox; offset_y_ = oy; }
    void set_zoom(float z) { zoom_ = z; }
    float offset_x() const { return offset_x_; }
    float offset_y() const { return offset_y_; }
    float zoom() const { return zoom_; }

    // Message of the last failed layout pass, empty after a good one.
    const std::string& layout_error() const { return layout_error_; }

    bool update_and_draw(float region_width, float region_height);

private:
    score_core::Document* document_ = nullptr;
    bool page_previews_ = true;
    float offset_x_ = 0;
    float offset_y_ = 0;
    float zoom_ = 1.0f;
    float grid_step_ = 72.0f;
    bool dragging_ = false;
    float drag_start_x_ = 0;
    float drag_start_y_ = 0;
    float drag_start_offset_x_ = 0;
    float drag_start_offset_y_ = 0;
    bool needs_fit_ = true;
    std::string layout_error_;

    void draw_grid(ImVec2 region_min, ImVec2 region_max);
    void handle_input(float region_width, float region_height);
    void report_layout_error(const char* event, const std::string& reason);
};

} // namespace score_canvas
