#pragma once

namespace score_staff {

// Engraving defaults, in staff spaces.
namespace engraving {

constexpr double staff_left_padding = 0.5;
constexpr double time_signature_left_padding = 0.5;
constexpr double key_signature_left_padding = 0.5;
// Gap between the fringe and a grouped line's first content.
constexpr double group_trailing_padding = 1.0;

constexpr double staff_line_thickness = 0.13;
constexpr double bar_line_thickness = 0.16;

} // namespace engraving

// Paddings used when stacking a fringe right-to-left from a line's start.
struct FringeSettings {
    double trailing_padding = 0.0;
    double staff_left_padding = engraving::staff_left_padding;
    double time_signature_left_padding = engraving::time_signature_left_padding;
    double key_signature_left_padding = engraving::key_signature_left_padding;

    static FringeSettings staff_defaults() { return FringeSettings{}; }
    static FringeSettings group_defaults() {
        FringeSettings settings;
        settings.trailing_padding = engraving::group_trailing_padding;
        return settings;
    }
};

struct EngravingSettings {
    FringeSettings staff_fringe = FringeSettings::staff_defaults();
    FringeSettings group_fringe = FringeSettings::group_defaults();
    double staff_line_thickness = engraving::staff_line_thickness;
    double bar_line_thickness = engraving::bar_line_thickness;
};

} // namespace score_staff
