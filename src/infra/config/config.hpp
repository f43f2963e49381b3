#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <expected>
#include <filesystem>

#include "../error_handler/error.hpp"

namespace treecp::args_parser {
    struct CLIArgs;
}

namespace treecp::infra {

inline constexpr std::uint32_t DEFAULT_MAX_PARALLEL_DIRS = 64;
inline constexpr std::size_t DEFAULT_PROGRESS_QUEUE = 256;
inline constexpr std::size_t MAX_BUFFER_SIZE = std::size_t{1} << 30; // 1 GiB

struct Config {
    // I/O
    std::optional<std::size_t> buffer_size;           // bytes, 0 или пусто -> 1 MiB
    std::optional<std::uint32_t> max_parallel_dirs;   // 0 -> без ограничения
    std::optional<std::size_t> progress_queue;

    // Behavior
    bool verify = false;
    bool progress = true;
    bool quiet = false;
    std::optional<std::string> log_level;

    // Слияние с другим Config (например, из CLI)
    void merge_with(const Config& other);

    [[nodiscard]] auto effective_max_parallel_dirs() const -> std::uint32_t {
        return max_parallel_dirs.value_or(DEFAULT_MAX_PARALLEL_DIRS);
    }
    [[nodiscard]] auto effective_progress_queue() const -> std::size_t {
        return progress_queue.value_or(DEFAULT_PROGRESS_QUEUE);
    }
};

/// Загружает конфигурацию из файла YAML (первый найденный).
/// Ищет файл в порядке:
///   1. ./.treecp.yaml
///   2. $XDG_CONFIG_HOME/treecp/config.yaml
///   3. ~/.config/treecp/config.yaml
/// Возвращает пустой Config, если файл не найден.
[[nodiscard]] auto load_config_from_file() -> std::expected<Config, Error>;

/// Кандидаты для load_config_from_file в порядке поиска. Пункт 2 есть,
/// только если XDG_CONFIG_HOME задан, пункт 3 только если задан HOME.
[[nodiscard]] auto config_search_paths() -> std::vector<std::filesystem::path>;

/// buffer_size больше MAX_BUFFER_SIZE -> ErrorCode::ConfigError.
[[nodiscard]] auto load_config_from_path(const std::filesystem::path& path)
    -> std::expected<Config, Error>;

/// Создаёт Config из CLI аргументов (структура из args_parser)
[[nodiscard]] auto config_from_cli(const args_parser::CLIArgs& args) -> Config;

} // namespace treecp::infra
