#pragma once

#include <score_core/positioned_object.hpp>
#include <score_staff/engraving_settings.hpp>
#include <score_staff/staff_fringe_layout.hpp>
#include <string>
#include <map>
#include <optional>
#include <utility>
#include <vector>

namespace score_core {
class Flowable;
}

namespace score_staff {

class Clef;
class FontMetrics;
class KeySignature;
class StaffGroup;
class TimeSignature;

template <typename T>
struct ModifierEntry {
    score_units::Unit pos_x;
    const T* object = nullptr;
};

// Modifier descendants by kind, each sorted by staff x (ties keep tree order).
struct ModifierIndex {
    std::vector<ModifierEntry<Clef>> clefs;
    std::vector<ModifierEntry<KeySignature>> key_signatures;
    std::vector<ModifierEntry<TimeSignature>> time_signatures;
};

// A set of evenly spaced horizontal lines. Its staff unit is one line spacing;
// y grows downward from the top line.
class Staff : public score_core::PositionedObject {
public:
    Staff(score_units::Point pos, score_units::Unit length, const FontMetrics& font_metrics,
        score_units::Unit line_spacing = score_units::mm(1.75), int line_count = 5);
    ~Staff() override;

    const FontMetrics& font_metrics() const { return *font_metrics_; }

    score_units::UnitType unit_type() const { return unit_type_; }
    score_units::Unit unit(double value) const { return score_units::Unit(value, unit_type_); }
    score_units::Unit line_spacing() const { return line_spacing_; }
    int line_count() const { return line_count_; }
    score_units::Unit height() const { return unit(line_count_ - 1); }
    score_units::Unit center_y() const { return height() / 2.0; }
    // Top and bottom of a bar line crossing this staff.
    std::pair<score_units::Unit, score_units::Unit> barline_extent() const;

    score_units::Unit length() const { return length_; }
    void set_length(score_units::Unit length);
    score_units::Unit breakable_length() const override { return length_; }

    const EngravingSettings& engraving_settings() const { return settings_; }
    void set_engraving_settings(const EngravingSettings& settings);

    const std::vector<ModifierEntry<Clef>>& clefs() const;
    const std::vector<ModifierEntry<KeySignature>>& key_signatures() const;
    const std::vector<ModifierEntry<TimeSignature>>& time_signatures() const;

    const Clef* active_clef_at(score_units::Unit pos_x) const;
    const KeySignature* active_key_signature_at(score_units::Unit pos_x) const;
    // Only a time signature sitting exactly at `pos_x`.
    const TimeSignature* time_signature_at(score_units::Unit pos_x) const;
    // Staff y of middle C under the active clef. Throws NoClefError.
    score_units::Unit middle_c_at(score_units::Unit pos_x) const;
    // Gap to the next object of the same kind, or to the staff end.
    score_units::Unit distance_to_next_of_type(const score_core::PositionedObject& object) const;

    bool y_inside_staff(score_units::Unit pos_y) const;
    bool y_on_ledger(score_units::Unit pos_y) const;
    // Ledger line positions between the staff and `pos_y`, nearest last.
    std::vector<score_units::Unit> ledgers_needed_for_y(score_units::Unit pos_y) const;

    const score_core::Flowable* flowable() const;
    score_core::Flowable* flowable();

    // Staff x where a line starting at `flowable_x` enters this staff, clamped to zero.
    score_units::Unit staff_pos_x_at_flowable_x(std::optional<score_units::Unit> flowable_x) const;
    score_units::Unit staff_pos_x_at(const score_core::Line* line) const;

    StaffFringeLayout fringe_layout_at(const score_core::Line* line) const;
    StaffFringeLayout fringe_layout_at_flowable_x(std::optional<score_units::Unit> flowable_x) const;

    StaffGroup* group() const { return group_; }
    // Key of this staff's margin controllers on its flowable.
    std::string layout_key() const;

    // Drops the modifier index and every fringe layout that depends on it.
    void invalidate_layout_caches();

    void render_slice(score_core::RenderSink& sink, const score_units::Point& pos,
        std::optional<score_units::Unit> clip_start_x, std::optional<score_units::Unit> clip_width,
        const score_core::Line* line);

    void render_complete(score_core::RenderSink& sink, const score_units::Point& pos,
        const score_core::Line* line, score_units::Unit flowable_x) override;
    void render_before_break(score_core::RenderSink& sink, const score_units::Point& pos,
        const score_core::Line& line, score_units::Unit flowable_x) override;
    void render_spanning_continuation(score_core::RenderSink& sink, const score_units::Point& pos,
        const score_core::Line& line, score_units::Unit object_x) override;
    void render_after_break(score_core::RenderSink& sink, const score_units::Point& pos,
        const score_core::Line& line, score_units::Unit object_x) override;

    void pre_render_hook() override;
    void post_render_hook() override;

protected:
    void on_subtree_changed(const score_core::PositionedObject& changed) override;

private:
    friend class StaffGroup;

    const ModifierIndex& modifier_index() const;
    void register_margin_controllers();

    const FontMetrics* font_metrics_ = nullptr;
    score_units::Unit length_;
    score_units::Unit line_spacing_;
    int line_count_ = 5;
    score_units::UnitType unit_type_;
    EngravingSettings settings_;
    StaffGroup* group_ = nullptr;

    mutable std::optional<ModifierIndex> index_;
    mutable std::map<std::optional<double>, StaffFringeLayout> fringe_layouts_;
};

} // namespace score_staff
