#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <spdlog/spdlog.h>

namespace treecp::infra::logging {

inline constexpr auto LOGGER_NAME = "treecp";
inline constexpr auto LOG_PATTERN = "[%Y-%m-%d %H:%M:%S] [%^%l%$] %v";

/// Цветной логгер в stdout, становится логгером по умолчанию.
void setup(spdlog::level::level_enum level = spdlog::level::info);

/// "warn", "debug", ... -> уровень spdlog; нераспознанное имя -> info.
[[nodiscard]] auto parse_level(std::string_view name) -> spdlog::level::level_enum;

/// Уровень из --log-level (по умолчанию info). quiet поднимает его
/// минимум до error, в какой комбинации ни были бы заданы оба.
[[nodiscard]] auto effective_level(const std::optional<std::string>& log_level, bool quiet)
    -> spdlog::level::level_enum;

} // namespace treecp::infra::logging
