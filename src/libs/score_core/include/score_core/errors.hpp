#pragma once

#include <stdexcept>

namespace score_core {

// Coordinate mapping between nodes that share no ancestor.
class DisjointTreeError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

// The layout pass cannot place content, e.g. a fringe wider than a page's live area.
// Nothing of the failed pass is kept; callers change the input and run the pass again.
class LayoutError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace score_core
