#pragma once

#include <spdlog/spdlog.h>
#include <memory>

namespace score_core {

// Shared "score_layout" logger. Applications may register their own logger
// under that name before the first call to redirect layout diagnostics.
std::shared_ptr<spdlog::logger> layout_logger();

} // namespace score_core
