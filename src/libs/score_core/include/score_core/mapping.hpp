#pragma once

#include <score_core/positioned_object.hpp>

namespace score_core {

class Flowable;
class Page;

// Sum of local positions from `node` up to (excluding) `ancestor`.
// Throws DisjointTreeError if `ancestor` is not above `node`.
score_units::Point descendant_pos(const PositionedObject& ancestor, const PositionedObject& node);
score_units::Unit descendant_pos_x(const PositionedObject& ancestor, const PositionedObject& node);

// Nearest common ancestor (a node counts as its own ancestor); null when disjoint.
const PositionedObject* common_ancestor(const PositionedObject& a, const PositionedObject& b);

// Nearest Flowable strictly above `node`, if any.
const Flowable* enclosing_flowable(const PositionedObject& node);

// The Page at the root of `node`'s tree, or null when the root is not a page.
const Page* root_page(const PositionedObject& node);

// Document-space position. Nodes inside a Flowable are placed through its lines.
score_units::Point map_to_document(const PositionedObject& node);

// Offset from `src` to `dst`. Stays in timeline space when both share a
// Flowable, so objects split across lines still measure their logical distance.
// Throws DisjointTreeError when the nodes share no ancestor.
score_units::Point map_between(const PositionedObject& src, const PositionedObject& dst);

} // namespace score_core
