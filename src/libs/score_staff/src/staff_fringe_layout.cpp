#include <score_staff/staff_fringe_layout.hpp>
#include <score_staff/clef.hpp>
#include <score_staff/key_signature.hpp>
#include <score_staff/staff.hpp>
#include <score_staff/time_signature.hpp>

namespace score_staff {

using score_units::Unit;

bool operator==(const StaffFringeLayout& a, const StaffFringeLayout& b) {
    return a.pos_x_in_staff == b.pos_x_in_staff && a.staff == b.staff && a.clef == b.clef
        && a.key_signature == b.key_signature && a.time_signature == b.time_signature;
}

bool operator!=(const StaffFringeLayout& a, const StaffFringeLayout& b) {
    return !(a == b);
}

StaffFringeLayout compute_isolated_fringe_layout(const Staff& staff, Unit staff_pos_x,
    const FringeSettings& settings)
{
    StaffFringeLayout layout;
    layout.pos_x_in_staff = staff_pos_x;

    Unit current = staff.unit(0.0) - staff.unit(settings.trailing_padding);

    if (const TimeSignature* time_sig = staff.time_signature_at(staff_pos_x)) {
        current -= time_sig->visual_width();
        layout.time_signature = current;
        current -= staff.unit(settings.time_signature_left_padding);
    }
    if (const KeySignature* key_sig = staff.active_key_signature_at(staff_pos_x)) {
        current -= key_sig->visual_width();
        layout.key_signature = current;
        current -= staff.unit(settings.key_signature_left_padding);
    }
    if (const Clef* clef = staff.active_clef_at(staff_pos_x)) {
        current -= clef->bounding_width();
        layout.clef = current;
    }
    current -= staff.unit(settings.staff_left_padding);
    layout.staff = current;
    return layout;
}

StaffFringeLayout align_fringe_layout(const StaffFringeLayout& layout, Unit basis) {
    const Unit target(basis, layout.staff.type());
    if (target == layout.staff) return layout;

    const Unit delta = target - layout.staff;
    StaffFringeLayout aligned = layout;
    aligned.staff = target;
    if (aligned.clef) *aligned.clef += delta;
    if (aligned.key_signature) *aligned.key_signature += delta;
    return aligned;
}

} // namespace score_staff
