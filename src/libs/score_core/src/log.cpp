#include <score_core/log.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace score_core {

std::shared_ptr<spdlog::logger> layout_logger() {
    static std::shared_ptr<spdlog::logger> logger;
    if (logger) return logger;

    logger = spdlog::get("score_layout");
    if (logger) return logger;

    try {
        logger = spdlog::stderr_color_mt("score_layout");
        logger->set_level(spdlog::level::warn);
        logger->set_pattern("[%H:%M:%S.%e] [%n] [%l] %v");
    } catch (const spdlog::spdlog_ex&) {
        logger = spdlog::default_logger();
    }
    return logger;
}

} // namespace score_core
