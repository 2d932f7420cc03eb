#include <score_core/flowable.hpp>
#include <score_core/document.hpp>
#include <score_core/errors.hpp>
#include <score_core/log.hpp>
#include <score_core/mapping.hpp>
#include <score_core/page.hpp>
#include <algorithm>
#include <stdexcept>
#include <unordered_map>

namespace score_core {

using score_units::Point;
using score_units::Unit;

bool operator==(const Line& a, const Line& b) {
    return a.flowable_x == b.flowable_x && a.length == b.length
        && a.page_index == b.page_index && a.page_pos == b.page_pos;
}

bool operator!=(const Line& a, const Line& b) {
    return !(a == b);
}

Flowable::Flowable(Point pos, Unit length, Unit height, Unit y_padding)
    : PositionedObject(pos, ObjectKind::Flowable),
      length_(length),
      height_(height),
      y_padding_(y_padding) {}

void Flowable::set_length(Unit length) {
    length_ = length;
    invalidate_layout();
}

void Flowable::set_height(Unit height) {
    height_ = height;
    invalidate_layout();
}

void Flowable::set_y_padding(Unit y_padding) {
    y_padding_ = y_padding;
    invalidate_layout();
}

void Flowable::add_margin_controller(MarginController controller) {
    controllers_.push_back(std::move(controller));
    invalidate_layout();
}

void Flowable::add_margin_controller(Unit flowable_x, Unit margin_left, std::string layout_key) {
    add_margin_controller(MarginController{flowable_x, margin_left, std::move(layout_key)});
}

void Flowable::add_pass_margin_controller(MarginController controller) {
    pass_controllers_.push_back(std::move(controller));
    invalidate_layout();
}

void Flowable::add_pass_margin_controller(Unit flowable_x, Unit margin_left, std::string layout_key) {
    add_pass_margin_controller(MarginController{flowable_x, margin_left, std::move(layout_key)});
}

void Flowable::clear_margin_controllers() {
    controllers_.clear();
    pass_controllers_.clear();
    invalidate_layout();
}

Unit Flowable::margin_needed_at(Unit flowable_x) const {
    struct Active {
        Unit flowable_x;
        Unit margin;
    };
    std::unordered_map<std::string, Active> active;
    auto consider = [&](const MarginController& c) {
        if (c.flowable_x > flowable_x) return;
        auto it = active.find(c.layout_key);
        if (it == active.end()) {
            active.emplace(c.layout_key, Active{c.flowable_x, c.margin_left});
            return;
        }
        Active& current = it->second;
        if (c.flowable_x > current.flowable_x
            || (c.flowable_x == current.flowable_x && c.margin_left > current.margin))
        {
            current = Active{c.flowable_x, c.margin_left};
        }
    };
    for (const auto& c : controllers_) consider(c);
    for (const auto& c : pass_controllers_) consider(c);

    Unit needed = score_units::zero;
    for (const auto& [key, a] : active) {
        if (a.margin > needed) needed = a.margin;
    }
    return needed;
}

const std::vector<Line>& Flowable::lines() const {
    if (state_ != LayoutState::Broken) break_lines();
    return lines_;
}

void Flowable::invalidate_layout() {
    if (state_ == LayoutState::Breaking)
        throw std::logic_error("flowable changed while its lines are being broken");
    lines_.clear();
    state_ = LayoutState::Unbroken;
}

std::size_t Flowable::line_index_at(Unit flowable_x) const {
    const auto& all = lines();
    auto it = std::upper_bound(all.begin(), all.end(), flowable_x,
        [](const Unit& x, const Line& line) { return x < line.flowable_x; });
    if (it == all.begin()) return 0;
    return static_cast<std::size_t>(std::distance(all.begin(), it)) - 1;
}

const Line& Flowable::line_at(Unit flowable_x) const {
    return lines()[line_index_at(flowable_x)];
}

Point Flowable::line_document_origin(const Line& line) const {
    return line_page(line).pos() + line.page_pos;
}

Point Flowable::map_to_document(const TimelinePoint& point) const {
    const Line& line = line_at(point.x);
    return line_document_origin(line) + Point{point.x - line.flowable_x, point.y};
}

TimelinePoint Flowable::timeline_pos(const PositionedObject& descendant) const {
    const Point p = descendant_pos(*this, descendant);
    return TimelinePoint{p.x, p.y};
}

Unit Flowable::descendant_pos_x(const PositionedObject& descendant) const {
    return timeline_pos(descendant).x;
}

void Flowable::render_object(PositionedObject& object, RenderSink& sink) const {
    const TimelinePoint start = timeline_pos(object);
    const Unit object_length = object.breakable_length();
    const Unit end = start.x + object_length;
    const auto& all = lines();
    const std::size_t first = line_index_at(start.x);

    for (std::size_t i = first; i < all.size(); ++i) {
        const Line& line = all[i];
        if (i != first && end <= line.flowable_x) break;

        const Point line_origin = line_document_origin(line);
        if (i == first) {
            const Point pos = line_origin + Point{start.x - line.flowable_x, start.y};
            if (object_length <= score_units::zero || end <= line.flowable_end()) {
                object.render_complete(sink, pos, &line, start.x);
                break;
            }
            object.render_before_break(sink, pos, line, start.x);
            continue;
        }

        const Point pos = line_origin + Point{score_units::zero, start.y};
        const Unit object_x = line.flowable_x - start.x;
        if (end > line.flowable_end() && i + 1 < all.size()) {
            object.render_spanning_continuation(sink, pos, line, object_x);
        } else {
            object.render_after_break(sink, pos, line, object_x);
            break;
        }
    }
}

void Flowable::pre_render_hook() {
    // Children register fresh controllers during the same pre-render walk.
    pass_controllers_.clear();
    invalidate_layout();
}

void Flowable::on_subtree_changed(const PositionedObject& changed) {
    if (&changed == this) invalidate_layout();
}

const Page& Flowable::owning_page() const {
    const Page* page = score_core::root_page(*this);
    if (!page)
        throw LayoutError("flowable is not attached to a page");
    return *page;
}

Page& Flowable::line_page(const Line& line) const {
    PageSupplier* supplier = owning_page().supplier();
    if (!supplier)
        throw LayoutError("flowable's page has no page supplier");
    return supplier->page(line.page_index);
}

void Flowable::break_lines() const {
    if (state_ == LayoutState::Breaking)
        throw std::logic_error("flowable line breaking re-entered");
    state_ = LayoutState::Breaking;
    lines_.clear();

    try {
        if (enclosing_flowable(*this))
            throw LayoutError("flowables nested inside flowables are not supported");
        const Page& first_page = owning_page();
        PageSupplier* supplier = first_page.supplier();
        if (!supplier)
            throw LayoutError("flowable's page has no page supplier");

        const Point start = descendant_pos(first_page, *this);
        std::size_t page_index = first_page.index();
        Unit line_left = start.x;
        Unit line_y = start.y;
        Unit x(0.0, length_.type());
        std::vector<Line> out;

        while (true) {
            const Page& page = supplier->page(page_index);
            const Unit margin = margin_needed_at(x);
            const Unit available = page.paper().live_width() - line_left - margin;
            if (available <= score_units::zero) {
                throw LayoutError("no room for a line at flowable x=" + x.to_string()
                    + ": margin " + margin.to_string() + " on a live width of "
                    + page.paper().live_width().to_string());
            }

            const Unit remaining = length_ - x;
            const bool last = remaining <= available;
            const Unit line_length = last ? remaining : Unit(available, length_.type());
            out.push_back(Line{x, line_length, page_index, Point{line_left + margin, line_y}});
            if (last) break;

            x += line_length;
            line_left = score_units::zero;
            line_y += height_ + y_padding_;
            if (line_y + height_ > page.paper().live_height()) {
                ++page_index;
                line_y = score_units::zero;
            }
        }

        lines_ = std::move(out);
        state_ = LayoutState::Broken;
        layout_logger()->debug("flowable_broken length={} lines={} last_page={}",
            length_.to_string(), lines_.size(), lines_.back().page_index);
    } catch (const std::exception& e) {
        lines_.clear();
        state_ = LayoutState::Unbroken;
        layout_logger()->error("flowable_break_failed reason={}", e.what());
        throw;
    }
}

} // namespace score_core
