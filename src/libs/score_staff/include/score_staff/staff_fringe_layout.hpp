#pragma once

#include <score_staff/engraving_settings.hpp>
#include <score_units/unit.hpp>
#include <optional>

namespace score_staff {

class Staff;

// Left edges of the fringe layers at one line start, relative to the line's
// content origin (all <= 0). Absent layers are empty.
struct StaffFringeLayout {
    score_units::Unit pos_x_in_staff;
    score_units::Unit staff;
    std::optional<score_units::Unit> clef;
    std::optional<score_units::Unit> key_signature;
    std::optional<score_units::Unit> time_signature;
};

bool operator==(const StaffFringeLayout& a, const StaffFringeLayout& b);
bool operator!=(const StaffFringeLayout& a, const StaffFringeLayout& b);

// Stacks the modifiers active at `staff_pos_x` right-to-left from zero:
// trailing padding, time signature (only one sitting exactly there), key
// signature, clef, staff-left padding.
StaffFringeLayout compute_isolated_fringe_layout(const Staff& staff,
    score_units::Unit staff_pos_x, const FringeSettings& settings);

// Moves the staff, clef and key signature edges so the staff edge lands on
// `basis`. The time signature edge stays put.
StaffFringeLayout align_fringe_layout(const StaffFringeLayout& layout, score_units::Unit basis);

} // namespace score_staff
