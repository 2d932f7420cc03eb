#pragma once

#include <score_units/point.hpp>
#include <memory>
#include <utility>
#include <vector>

namespace score_core {

class RenderSink;
struct Line;

// Closed set of node kinds the layout core dispatches on.
enum class ObjectKind {
    Generic,
    Page,
    Flowable,
    Staff,
    Clef,
    KeySignature,
    TimeSignature,
    BarLine
};

const char* object_kind_name(ObjectKind kind);

// A node in the ownership tree. Parents own their children; the position is
// relative to the parent (timeline space when the parent chain reaches a Flowable).
class PositionedObject {
public:
    explicit PositionedObject(score_units::Point pos, ObjectKind kind = ObjectKind::Generic);
    virtual ~PositionedObject();

    PositionedObject(const PositionedObject&) = delete;
    PositionedObject& operator=(const PositionedObject&) = delete;

    ObjectKind kind() const { return kind_; }

    const score_units::Point& pos() const { return pos_; }
    score_units::Unit x() const { return pos_.x; }
    score_units::Unit y() const { return pos_.y; }
    void set_pos(const score_units::Point& pos);
    void set_x(score_units::Unit x);
    void set_y(score_units::Unit y);

    PositionedObject* parent() { return parent_; }
    const PositionedObject* parent() const { return parent_; }
    const std::vector<std::unique_ptr<PositionedObject>>& children() const { return children_; }

    template <typename T, typename... Args>
    T& emplace_child(Args&&... args) {
        auto child = std::make_unique<T>(std::forward<Args>(args)...);
        T& ref = *child;
        adopt(std::move(child));
        return ref;
    }

    // Appends `child` (which must not be attached or be an ancestor of this).
    PositionedObject& adopt(std::unique_ptr<PositionedObject> child);

    // Removes this subtree from its parent and hands back ownership.
    // Returns null for roots, which are owned elsewhere.
    std::unique_ptr<PositionedObject> detach();

    bool is_ancestor_of(const PositionedObject& other) const;
    const PositionedObject& root() const;
    PositionedObject& root();

    // Pre-order walk over descendants (this node excluded).
    template <typename Fn>
    void for_each_descendant(Fn&& fn) const {
        for (const auto& child : children_) {
            const PositionedObject& node = *child;
            fn(node);
            node.for_each_descendant(fn);
        }
    }

    template <typename Fn>
    void for_each_descendant(Fn&& fn) {
        for (auto& child : children_) {
            fn(*child);
            child->for_each_descendant(fn);
        }
    }

    std::vector<const PositionedObject*> descendants_of_kind(ObjectKind kind) const;
    const PositionedObject* first_ancestor_of_kind(ObjectKind kind) const;
    PositionedObject* first_ancestor_of_kind(ObjectKind kind);

    // Extent along the enclosing Flowable's timeline. Zero: drawn on one line.
    virtual score_units::Unit breakable_length() const;

    virtual void pre_render_hook();
    virtual void post_render_hook();

    // Slice rendering. `pos` is in document space; `line` is null outside flowables.
    virtual void render_complete(RenderSink& sink, const score_units::Point& pos,
        const Line* line, score_units::Unit flowable_x);
    virtual void render_before_break(RenderSink& sink, const score_units::Point& pos,
        const Line& line, score_units::Unit flowable_x);
    virtual void render_spanning_continuation(RenderSink& sink, const score_units::Point& pos,
        const Line& line, score_units::Unit object_x);
    virtual void render_after_break(RenderSink& sink, const score_units::Point& pos,
        const Line& line, score_units::Unit object_x);

protected:
    // Runs on the changed node and on every ancestor after adopt/detach/move.
    virtual void on_subtree_changed(const PositionedObject& changed);

private:
    void notify_changed();

    score_units::Point pos_;
    ObjectKind kind_ = ObjectKind::Generic;
    PositionedObject* parent_ = nullptr;
    std::vector<std::unique_ptr<PositionedObject>> children_;
};

} // namespace score_core
