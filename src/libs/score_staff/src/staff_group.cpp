#include <score_staff/staff_group.hpp>
#include <score_core/flowable.hpp>
#include <score_core/log.hpp>
#include <score_staff/staff.hpp>
#include <algorithm>
#include <stdexcept>

namespace score_staff {

using score_units::Unit;

StaffGroup::StaffGroup(const FringeSettings& settings) : settings_(settings) {}

StaffGroup::~StaffGroup() {
    for (Staff* staff : staves_) {
        staff->group_ = nullptr;
        staff->invalidate_layout_caches();
    }
}

void StaffGroup::add_staff(Staff& staff) {
    if (staff.group_ == this) return;
    if (staff.group_) staff.group_->remove_staff(staff);
    staves_.push_back(&staff);
    staff.group_ = this;
    staff.invalidate_layout_caches();
}

void StaffGroup::remove_staff(Staff& staff) {
    auto it = std::find(staves_.begin(), staves_.end(), &staff);
    if (it == staves_.end()) return;
    staves_.erase(it);
    staff.group_ = nullptr;
    staff.invalidate_layout_caches();
    invalidate();
}

bool StaffGroup::contains(const Staff& staff) const {
    return std::find(staves_.begin(), staves_.end(), &staff) != staves_.end();
}

void StaffGroup::set_settings(const FringeSettings& settings) {
    settings_ = settings;
    invalidate();
}

StaffFringeLayout StaffGroup::fringe_layout_at(const Staff& staff, const score_core::Line* line) {
    if (!line) return fringe_layout_at_flowable_x(staff, std::nullopt);
    return fringe_layout_at_flowable_x(staff, line->flowable_x);
}

StaffFringeLayout StaffGroup::fringe_layout_at_flowable_x(const Staff& staff,
    std::optional<Unit> flowable_x)
{
    if (!contains(staff))
        throw std::invalid_argument("staff is not a member of this group");

    std::optional<double> location;
    if (flowable_x) location = flowable_x->base_value();
    auto it = cache_.find(CacheKey{&staff, location});
    if (it != cache_.end()) return it->second;

    std::vector<StaffFringeLayout> isolated;
    isolated.reserve(staves_.size());
    Unit basis = score_units::zero;
    for (const Staff* member : staves_) {
        isolated.push_back(compute_isolated_fringe_layout(*member,
            member->staff_pos_x_at_flowable_x(flowable_x), settings_));
        if (isolated.back().staff < basis) basis = isolated.back().staff;
    }

    for (std::size_t i = 0; i < staves_.size(); ++i)
        cache_[CacheKey{staves_[i], location}] = align_fringe_layout(isolated[i], basis);

    score_core::layout_logger()->debug("group_fringe_aligned staves={} basis={}",
        staves_.size(), basis.to_string());
    return cache_.at(CacheKey{&staff, location});
}

void StaffGroup::invalidate() {
    cache_.clear();
}

} // namespace score_staff
