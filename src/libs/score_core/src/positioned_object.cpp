#include <score_core/positioned_object.hpp>
#include <algorithm>
#include <stdexcept>

namespace score_core {

const char* object_kind_name(ObjectKind kind) {
    switch (kind) {
    case ObjectKind::Generic: return "Generic";
    case ObjectKind::Page: return "Page";
    case ObjectKind::Flowable: return "Flowable";
    case ObjectKind::Staff: return "Staff";
    case ObjectKind::Clef: return "Clef";
    case ObjectKind::KeySignature: return "KeySignature";
    case ObjectKind::TimeSignature: return "TimeSignature";
    case ObjectKind::BarLine: return "BarLine";
    }
    return "Unknown";
}

PositionedObject::PositionedObject(score_units::Point pos, ObjectKind kind)
    : pos_(pos), kind_(kind) {}

PositionedObject::~PositionedObject() = default;

void PositionedObject::set_pos(const score_units::Point& pos) {
    pos_ = pos;
    notify_changed();
}

void PositionedObject::set_x(score_units::Unit x) {
    pos_.x = x;
    notify_changed();
}

void PositionedObject::set_y(score_units::Unit y) {
    pos_.y = y;
    notify_changed();
}

PositionedObject& PositionedObject::adopt(std::unique_ptr<PositionedObject> child) {
    if (!child)
        throw std::invalid_argument("cannot adopt a null object");
    if (child->parent_)
        throw std::invalid_argument("object is already attached to a parent");
    if (child.get() == this || child->is_ancestor_of(*this))
        throw std::invalid_argument("adopting an ancestor would create a cycle");

    child->parent_ = this;
    children_.push_back(std::move(child));
    PositionedObject& ref = *children_.back();
    ref.notify_changed();
    return ref;
}

std::unique_ptr<PositionedObject> PositionedObject::detach() {
    if (!parent_) return nullptr;

    // Ancestors must see the change while they are still reachable.
    notify_changed();

    auto& siblings = parent_->children_;
    auto it = std::find_if(siblings.begin(), siblings.end(),
        [this](const std::unique_ptr<PositionedObject>& c) { return c.get() == this; });
    std::unique_ptr<PositionedObject> owned = std::move(*it);
    siblings.erase(it);
    parent_ = nullptr;
    return owned;
}

bool PositionedObject::is_ancestor_of(const PositionedObject& other) const {
    for (const PositionedObject* p = other.parent_; p; p = p->parent_) {
        if (p == this) return true;
    }
    return false;
}

const PositionedObject& PositionedObject::root() const {
    const PositionedObject* node = this;
    while (node->parent_) node = node->parent_;
    return *node;
}

PositionedObject& PositionedObject::root() {
    PositionedObject* node = this;
    while (node->parent_) node = node->parent_;
    return *node;
}

std::vector<const PositionedObject*> PositionedObject::descendants_of_kind(ObjectKind kind) const {
    std::vector<const PositionedObject*> out;
    for_each_descendant([&](const PositionedObject& node) {
        if (node.kind() == kind) out.push_back(&node);
    });
    return out;
}

const PositionedObject* PositionedObject::first_ancestor_of_kind(ObjectKind kind) const {
    for (const PositionedObject* p = parent_; p; p = p->parent_) {
        if (p->kind_ == kind) return p;
    }
    return nullptr;
}

PositionedObject* PositionedObject::first_ancestor_of_kind(ObjectKind kind) {
    for (PositionedObject* p = parent_; p; p = p->parent_) {
        if (p->kind_ == kind) return p;
    }
    return nullptr;
}

score_units::Unit PositionedObject::breakable_length() const {
    return score_units::zero;
}

void PositionedObject::pre_render_hook() {}

void PositionedObject::post_render_hook() {}

void PositionedObject::render_complete(RenderSink&, const score_units::Point&,
    const Line*, score_units::Unit) {}

void PositionedObject::render_before_break(RenderSink& sink, const score_units::Point& pos,
    const Line& line, score_units::Unit flowable_x)
{
    render_complete(sink, pos, &line, flowable_x);
}

void PositionedObject::render_spanning_continuation(RenderSink&, const score_units::Point&,
    const Line&, score_units::Unit) {}

void PositionedObject::render_after_break(RenderSink&, const score_units::Point&,
    const Line&, score_units::Unit) {}

void PositionedObject::on_subtree_changed(const PositionedObject&) {}

void PositionedObject::notify_changed() {
    for (PositionedObject* node = this; node; node = node->parent_)
        node->on_subtree_changed(*this);
}

} // namespace score_core
