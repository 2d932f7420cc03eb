#include <score_core/mapping.hpp>
#include <score_core/errors.hpp>
#include <score_core/flowable.hpp>
#include <score_core/page.hpp>
#include <string>
#include <unordered_set>

namespace score_core {

score_units::Point descendant_pos(const PositionedObject& ancestor, const PositionedObject& node) {
    // Start in the node's own units so single-unit trees stay exact.
    score_units::Point result{
        score_units::Unit(0.0, node.x().type()),
        score_units::Unit(0.0, node.y().type())};
    const PositionedObject* current = &node;
    while (current && current != &ancestor) {
        result = result + current->pos();
        current = current->parent();
    }
    if (!current)
        throw DisjointTreeError(std::string("node of kind ") + object_kind_name(node.kind())
            + " is not a descendant of node of kind " + object_kind_name(ancestor.kind()));
    return result;
}

score_units::Unit descendant_pos_x(const PositionedObject& ancestor, const PositionedObject& node) {
    return descendant_pos(ancestor, node).x;
}

const PositionedObject* common_ancestor(const PositionedObject& a, const PositionedObject& b) {
    std::unordered_set<const PositionedObject*> chain;
    for (const PositionedObject* p = &a; p; p = p->parent())
        chain.insert(p);
    for (const PositionedObject* p = &b; p; p = p->parent()) {
        if (chain.count(p)) return p;
    }
    return nullptr;
}

const Flowable* enclosing_flowable(const PositionedObject& node) {
    const PositionedObject* found = node.first_ancestor_of_kind(ObjectKind::Flowable);
    return static_cast<const Flowable*>(found);
}

const Page* root_page(const PositionedObject& node) {
    const PositionedObject& root = node.root();
    if (root.kind() != ObjectKind::Page) return nullptr;
    return static_cast<const Page*>(&root);
}

score_units::Point map_to_document(const PositionedObject& node) {
    if (const Flowable* flowable = enclosing_flowable(node)) {
        const score_units::Point in_flowable = descendant_pos(*flowable, node);
        return flowable->map_to_document(TimelinePoint{in_flowable.x, in_flowable.y});
    }
    const PositionedObject& root = node.root();
    if (&root == &node) return node.pos();
    return root.pos() + descendant_pos(root, node);
}

score_units::Point map_between(const PositionedObject& src, const PositionedObject& dst) {
    const PositionedObject* ancestor = common_ancestor(src, dst);
    if (!ancestor)
        throw DisjointTreeError("cannot map between nodes in unrelated trees");

    const bool ancestor_in_timeline = ancestor->kind() == ObjectKind::Flowable
        || enclosing_flowable(*ancestor) != nullptr;
    const bool any_wrapped = enclosing_flowable(src) != nullptr
        || enclosing_flowable(dst) != nullptr;
    if (ancestor_in_timeline || !any_wrapped)
        return descendant_pos(*ancestor, dst) - descendant_pos(*ancestor, src);

    // One side lives on broken lines and the other does not: only document
    // space gives a meaningful offset.
    return map_to_document(dst) - map_to_document(src);
}

} // namespace score_core
