#pragma once

#include <stdexcept>

namespace score_staff {

// A pitch-dependent query ran at a staff position no clef covers.
class NoClefError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// FontMetrics has no entry for a glyph that has to be measured.
class GlyphLookupError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace score_staff
