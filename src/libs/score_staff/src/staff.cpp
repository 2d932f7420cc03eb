#include <score_staff/staff.hpp>
#include <score_core/flowable.hpp>
#include <score_core/log.hpp>
#include <score_core/mapping.hpp>
#include <score_core/render_sink.hpp>
#include <score_staff/clef.hpp>
#include <score_staff/errors.hpp>
#include <score_staff/key_signature.hpp>
#include <score_staff/staff_group.hpp>
#include <score_staff/time_signature.hpp>
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace score_staff {

using score_core::ObjectKind;
using score_core::PositionedObject;
using score_units::Point;
using score_units::Unit;

namespace {

bool is_modifier_kind(ObjectKind kind) {
    return kind == ObjectKind::Clef || kind == ObjectKind::KeySignature
        || kind == ObjectKind::TimeSignature;
}

bool contains_modifier(const PositionedObject& node) {
    if (is_modifier_kind(node.kind())) return true;
    bool found = false;
    node.for_each_descendant([&](const PositionedObject& d) {
        if (is_modifier_kind(d.kind())) found = true;
    });
    return found;
}

template <typename T>
void sort_entries(std::vector<ModifierEntry<T>>& entries) {
    std::stable_sort(entries.begin(), entries.end(),
        [](const ModifierEntry<T>& a, const ModifierEntry<T>& b) { return a.pos_x < b.pos_x; });
}

// Last entry at or before `pos_x`.
template <typename T>
const T* active_at(const std::vector<ModifierEntry<T>>& entries, Unit pos_x) {
    for (auto it = entries.rbegin(); it != entries.rend(); ++it) {
        if (it->pos_x <= pos_x) return it->object;
    }
    return nullptr;
}

} // namespace

Staff::Staff(Point pos, Unit length, const FontMetrics& font_metrics, Unit line_spacing,
    int line_count)
    : PositionedObject(pos, ObjectKind::Staff),
      font_metrics_(&font_metrics),
      length_(length),
      line_spacing_(line_spacing),
      line_count_(line_count),
      unit_type_{"staff units", line_spacing.base_value()}
{
    if (line_count_ < 1)
        throw std::invalid_argument("a staff needs at least one line");
    if (line_spacing_ <= score_units::zero)
        throw std::invalid_argument("staff line spacing must be positive");
}

Staff::~Staff() {
    if (group_) group_->remove_staff(*this);
}

std::pair<Unit, Unit> Staff::barline_extent() const {
    if (line_count_ == 1) return {unit(-1.0), unit(1.0)};
    return {unit(0.0), height()};
}

void Staff::set_length(Unit length) {
    length_ = length;
    invalidate_layout_caches();
}

void Staff::set_engraving_settings(const EngravingSettings& settings) {
    settings_ = settings;
    invalidate_layout_caches();
}

std::string Staff::layout_key() const {
    return fmt::format("staff_fringe/{}", static_cast<const void*>(this));
}

const ModifierIndex& Staff::modifier_index() const {
    if (index_) return *index_;

    ModifierIndex index;
    for_each_descendant([&](const PositionedObject& node) {
        switch (node.kind()) {
        case ObjectKind::Clef:
            index.clefs.push_back({score_core::descendant_pos_x(*this, node),
                static_cast<const Clef*>(&node)});
            break;
        case ObjectKind::KeySignature:
            index.key_signatures.push_back({score_core::descendant_pos_x(*this, node),
                static_cast<const KeySignature*>(&node)});
            break;
        case ObjectKind::TimeSignature:
            index.time_signatures.push_back({score_core::descendant_pos_x(*this, node),
                static_cast<const TimeSignature*>(&node)});
            break;
        default:
            break;
        }
    });
    sort_entries(index.clefs);
    sort_entries(index.key_signatures);
    sort_entries(index.time_signatures);
    index_ = std::move(index);
    return *index_;
}

const std::vector<ModifierEntry<Clef>>& Staff::clefs() const {
    return modifier_index().clefs;
}

const std::vector<ModifierEntry<KeySignature>>& Staff::key_signatures() const {
    return modifier_index().key_signatures;
}

const std::vector<ModifierEntry<TimeSignature>>& Staff::time_signatures() const {
    return modifier_index().time_signatures;
}

const Clef* Staff::active_clef_at(Unit pos_x) const {
    return active_at(clefs(), pos_x);
}

const KeySignature* Staff::active_key_signature_at(Unit pos_x) const {
    return active_at(key_signatures(), pos_x);
}

const TimeSignature* Staff::time_signature_at(Unit pos_x) const {
    for (const auto& entry : time_signatures()) {
        if (entry.pos_x == pos_x) return entry.object;
    }
    return nullptr;
}

Unit Staff::middle_c_at(Unit pos_x) const {
    const Clef* clef = active_clef_at(pos_x);
    if (!clef)
        throw NoClefError("no clef active at staff x=" + pos_x.to_string());
    return clef->middle_c_staff_position();
}

Unit Staff::distance_to_next_of_type(const PositionedObject& object) const {
    const Unit start_x = score_core::descendant_pos_x(*this, object);
    std::optional<Unit> next_x;
    for_each_descendant([&](const PositionedObject& node) {
        if (&node == &object || node.kind() != object.kind()) return;
        const Unit x = score_core::descendant_pos_x(*this, node);
        if (x > start_x && (!next_x || x < *next_x)) next_x = x;
    });
    if (next_x) return *next_x - start_x;
    return length_ - start_x;
}

bool Staff::y_inside_staff(Unit pos_y) const {
    return pos_y >= score_units::zero && pos_y <= height();
}

bool Staff::y_on_ledger(Unit pos_y) const {
    if (y_inside_staff(pos_y)) return false;
    const double in_staff = Unit(pos_y, unit_type_).value();
    return std::fmod(in_staff, 1.0) == 0.0;
}

std::vector<Unit> Staff::ledgers_needed_for_y(Unit pos_y) const {
    const int start = static_cast<int>(Unit(pos_y, unit_type_).value());
    std::vector<Unit> ledgers;
    if (start < 0) {
        for (int p = start; p < 0; ++p)
            ledgers.push_back(unit(p));
    } else if (start > line_count_ - 1) {
        for (int p = start; p > line_count_ - 1; --p)
            ledgers.push_back(unit(p));
    }
    return ledgers;
}

const score_core::Flowable* Staff::flowable() const {
    return score_core::enclosing_flowable(*this);
}

score_core::Flowable* Staff::flowable() {
    return static_cast<score_core::Flowable*>(first_ancestor_of_kind(ObjectKind::Flowable));
}

Unit Staff::staff_pos_x_at_flowable_x(std::optional<Unit> flowable_x) const {
    const score_core::Flowable* flow = flowable();
    if (!flowable_x || !flow) return Unit(0.0, length_.type());
    const Unit pos = *flowable_x - flow->descendant_pos_x(*this);
    if (pos < score_units::zero) return Unit(0.0, pos.type());
    return pos;
}

Unit Staff::staff_pos_x_at(const score_core::Line* line) const {
    if (!line) return staff_pos_x_at_flowable_x(std::nullopt);
    return staff_pos_x_at_flowable_x(line->flowable_x);
}

StaffFringeLayout Staff::fringe_layout_at(const score_core::Line* line) const {
    if (!line) return fringe_layout_at_flowable_x(std::nullopt);
    return fringe_layout_at_flowable_x(line->flowable_x);
}

StaffFringeLayout Staff::fringe_layout_at_flowable_x(std::optional<Unit> flowable_x) const {
    if (group_) return group_->fringe_layout_at_flowable_x(*this, flowable_x);

    std::optional<double> key;
    if (flowable_x) key = flowable_x->base_value();
    auto it = fringe_layouts_.find(key);
    if (it != fringe_layouts_.end()) return it->second;

    const StaffFringeLayout layout = compute_isolated_fringe_layout(*this,
        staff_pos_x_at_flowable_x(flowable_x), settings_.staff_fringe);
    fringe_layouts_.emplace(key, layout);
    return layout;
}

void Staff::invalidate_layout_caches() {
    index_.reset();
    fringe_layouts_.clear();
    if (group_) group_->invalidate();
}

void Staff::on_subtree_changed(const PositionedObject& changed) {
    if (&changed == this || contains_modifier(changed)) invalidate_layout_caches();
}

void Staff::register_margin_controllers() {
    score_core::Flowable* flow = flowable();
    if (!flow) return;

    const ModifierIndex& index = modifier_index();
    std::vector<Unit> positions{Unit(0.0, length_.type())};
    for (const auto& e : index.clefs) positions.push_back(e.pos_x);
    for (const auto& e : index.key_signatures) positions.push_back(e.pos_x);
    for (const auto& e : index.time_signatures) positions.push_back(e.pos_x);

    const Unit staff_x = flow->descendant_pos_x(*this);
    const std::string key = layout_key();
    for (const Unit& pos : positions) {
        if (pos < score_units::zero || pos > length_) continue;
        const Unit flowable_x = staff_x + pos;
        const StaffFringeLayout fringe = fringe_layout_at_flowable_x(flowable_x);
        flow->add_pass_margin_controller(flowable_x, -fringe.staff, key);
    }
    score_core::layout_logger()->debug("staff_margins_registered key={} controllers={}",
        key, positions.size());
}

void Staff::pre_render_hook() {
    invalidate_layout_caches();
    register_margin_controllers();
}

void Staff::post_render_hook() {
    invalidate_layout_caches();
}

void Staff::render_slice(score_core::RenderSink& sink, const Point& pos,
    std::optional<Unit> clip_start_x, std::optional<Unit> clip_width,
    const score_core::Line* line)
{
    const StaffFringeLayout fringe = fringe_layout_at(line);
    Unit slice_length = length_;
    if (clip_width) {
        slice_length = *clip_width;
    } else if (clip_start_x) {
        slice_length = length_ - *clip_start_x;
    }

    const Unit start_x = pos.x + fringe.staff;
    const Unit end_x = pos.x + slice_length;
    const Unit thickness = unit(settings_.staff_line_thickness);
    for (int i = 0; i < line_count_; ++i) {
        const Unit y = pos.y + unit(i);
        sink.draw_line(Point{start_x, y}, Point{end_x, y}, thickness);
    }
}

void Staff::render_complete(score_core::RenderSink& sink, const Point& pos,
    const score_core::Line* line, Unit)
{
    render_slice(sink, pos, std::nullopt, std::nullopt, line);
}

void Staff::render_before_break(score_core::RenderSink& sink, const Point& pos,
    const score_core::Line& line, Unit flowable_x)
{
    render_slice(sink, pos, Unit(0.0, length_.type()), line.flowable_end() - flowable_x, &line);
}

void Staff::render_spanning_continuation(score_core::RenderSink& sink, const Point& pos,
    const score_core::Line& line, Unit object_x)
{
    render_slice(sink, pos, object_x, line.length, &line);
}

void Staff::render_after_break(score_core::RenderSink& sink, const Point& pos,
    const score_core::Line& line, Unit object_x)
{
    render_slice(sink, pos, object_x, std::nullopt, &line);
}

} // namespace score_staff
