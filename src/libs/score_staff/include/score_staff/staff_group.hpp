#pragma once

#include <score_staff/engraving_settings.hpp>
#include <score_staff/staff_fringe_layout.hpp>
#include <cstddef>
#include <map>
#include <optional>
#include <utility>
#include <vector>

namespace score_core {
struct Line;
}

namespace score_staff {

class Staff;

// Staves whose line-start fringes share one staff edge. Does not own them;
// a staff leaves its group when destroyed.
class StaffGroup {
public:
    explicit StaffGroup(const FringeSettings& settings = FringeSettings::group_defaults());
    ~StaffGroup();

    StaffGroup(const StaffGroup&) = delete;
    StaffGroup& operator=(const StaffGroup&) = delete;

    // Moves `staff` out of any other group.
    void add_staff(Staff& staff);
    void remove_staff(Staff& staff);
    const std::vector<Staff*>& staves() const { return staves_; }
    bool contains(const Staff& staff) const;

    const FringeSettings& settings() const { return settings_; }
    void set_settings(const FringeSettings& settings);

    // Aligned layout of `staff` at a line start. Throws std::invalid_argument
    // when `staff` is not a member.
    StaffFringeLayout fringe_layout_at(const Staff& staff, const score_core::Line* line);
    StaffFringeLayout fringe_layout_at_flowable_x(const Staff& staff,
        std::optional<score_units::Unit> flowable_x);

    void invalidate();
    std::size_t cached_layout_count() const { return cache_.size(); }

private:
    using CacheKey = std::pair<const Staff*, std::optional<double>>;

    std::vector<Staff*> staves_;
    FringeSettings settings_;
    std::map<CacheKey, StaffFringeLayout> cache_;
};

} // namespace score_staff
