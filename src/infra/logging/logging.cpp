#include "logging.hpp"

#include <algorithm>
#include <memory>
#include <string>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace treecp::infra::logging {

void setup(spdlog::level::level_enum level) {
    auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    // ERROR выделяется фоном, как в остальных наших утилитах
    sink->set_color(spdlog::level::err, sink->bold_on_red);
    sink->set_color(spdlog::level::warn, sink->yellow);

    auto logger = std::make_shared<spdlog::logger>(LOGGER_NAME, std::move(sink));
    logger->set_pattern(LOG_PATTERN);
    logger->set_level(level);
    spdlog::set_default_logger(std::move(logger));
}

auto parse_level(std::string_view name) -> spdlog::level::level_enum {
    const auto level = spdlog::level::from_str(std::string(name));
    // from_str возвращает off для неизвестных имён
    if (level == spdlog::level::off && name != "off") {
        spdlog::warn("Unknown log level '{}', using info", name);
        return spdlog::level::info;
    }
    return level;
}

auto effective_level(const std::optional<std::string>& log_level, bool quiet)
    -> spdlog::level::level_enum
{
    const auto level = log_level ? parse_level(*log_level) : spdlog::level::info;
    return quiet ? std::max(level, spdlog::level::err) : level;
}

} // namespace treecp::infra::logging
