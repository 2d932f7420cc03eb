#pragma once

#include <score_loaders/json_loader.hpp>

namespace score_loaders {

// Grand staff over several lines with clef, key and meter changes. Used by
// the viewer when no score file is found.
LoadedScore generate_debug_score();

} // namespace score_loaders
