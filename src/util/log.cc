#include "util/log.hpp"

#include <fmt/format.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <array>

bool
phabstack::log_setup(const std::string& level, Status& status) {
    const std::array<std::string, 6> levels = {"trace", "debug", "info", "warn", "error", "off"};

    bool known = false;
    for (const auto& name : levels) {
        known = known || name == level;
    }
    if (!known) {
        return status.set_error(ErrorKind::User, fmt::format("unknown log level '{}'", level));
    }

    auto logger = spdlog::get("phabstack");
    if (!logger) {
        logger = spdlog::stderr_color_mt("phabstack");
        logger->set_pattern("%^%l%$: %v");
        spdlog::set_default_logger(logger);
    }
    spdlog::set_level(spdlog::level::from_str(level));
    return true;
}
