#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <cstdlib>
#include <system_error>

#include "config.hpp"
#include "../../cli/args_parser/args_parser.hpp"

namespace treecp::infra {
    void Config::merge_with(const Config& other) {
        if (other.buffer_size) buffer_size = other.buffer_size;
        if (other.max_parallel_dirs) max_parallel_dirs = other.max_parallel_dirs;
        if (other.progress_queue) progress_queue = other.progress_queue;
        if (other.log_level) log_level = other.log_level;
        if (other.verify) verify = true;
        if (!other.progress) progress = false; // CLI может отключить
        if (other.quiet) quiet = true;
    }

    auto config_search_paths() -> std::vector<std::filesystem::path> {
        std::vector<std::filesystem::path> paths;

        // 1. Локальный файл
        paths.push_back(".treecp.yaml");

        // 2. XDG
        if (const char* config_home = std::getenv("XDG_CONFIG_HOME"); config_home && *config_home) {
            paths.push_back(std::filesystem::path(config_home) / "treecp" / "config.yaml");
        }

        // 3. ~/.config, проверяется и при заданном XDG_CONFIG_HOME
        if (const char* home = std::getenv("HOME"); home && *home) {
            paths.push_back(std::filesystem::path(home) / ".config" / "treecp" / "config.yaml");
        }

        return paths;
    }

    auto load_config_from_path(const std::filesystem::path& path) -> std::expected<Config, Error> {
        try {
            YAML::Node config = YAML::LoadFile(path.string());
            Config cfg{};

            if (config["buffer_size"]) cfg.buffer_size = config["buffer_size"].as<std::size_t>();
            if (config["max_parallel_dirs"]) cfg.max_parallel_dirs = config["max_parallel_dirs"].as<std::uint32_t>();
            if (config["progress_queue"]) cfg.progress_queue = config["progress_queue"].as<std::size_t>();

            if (config["verify"]) cfg.verify = config["verify"].as<bool>();
            if (config["progress"]) cfg.progress = config["progress"].as<bool>();
            if (config["quiet"]) cfg.quiet = config["quiet"].as<bool>();
            if (config["log_level"]) cfg.log_level = config["log_level"].as<std::string>();

            if (cfg.buffer_size && *cfg.buffer_size > MAX_BUFFER_SIZE) {
                return std::unexpected(make_error(ErrorCode::ConfigError,
                    fmt::format("{}: buffer_size {} exceeds the limit of {} bytes",
                                path.string(), *cfg.buffer_size, MAX_BUFFER_SIZE), path));
            }

            spdlog::debug("Loaded config from {}", path.string());
            return cfg;

        } catch (const YAML::Exception& e) {
            return std::unexpected(make_error(ErrorCode::ConfigError,
                fmt::format("Failed to parse {}: {}", path.string(), e.what()), path));
        }
    }

    auto load_config_from_file() -> std::expected<Config, Error> {
        for (const auto& path : config_search_paths()) {
            std::error_code ec;
            if (!std::filesystem::exists(path, ec)) continue;
            return load_config_from_path(path);
        }

        // Файл не найден -> возвращаем пустой конфиг (не ошибка!)
        return Config{};
    }

    [[nodiscard]]
    auto config_from_cli(const args_parser::CLIArgs& args) -> Config {
        Config cfg{};
        cfg.buffer_size = args.buffer_size;
        cfg.max_parallel_dirs = args.max_parallel_dirs;
        cfg.verify = args.verify;
        cfg.progress = !args.no_progress;
        cfg.quiet = args.quiet;
        cfg.log_level = args.log_level;
        return cfg;
    }

} // namespace treecp::infra
