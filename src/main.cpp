#include <fmt/core.h>
#include <fmt/ranges.h>

#include "infra/config/config.hpp"
#include "infra/error_handler/error.hpp"
#include "infra/logging/logging.hpp"
#include "infra/monitoring/monitoring.hpp"
#include "cli/args_parser/args_parser.hpp"
#include "core/orchestrator/orchestrator.hpp"
#include <git_info.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <filesystem>
#include <memory>
#include <vector>

using GIT = treecp::build_info::GitInfo;

constexpr auto load_from_cli = treecp::infra::config_from_cli;
constexpr auto load_config_file = treecp::infra::load_config_from_file;
constexpr auto args_parser = treecp::args_parser::parse_args;
constexpr auto git = treecp::build_info::get_git_info();

static auto
out_git_verse(const GIT& info)
-> void {
    fmt::print("Git branch: {}\n", info.branch);
    fmt::print("Git commit: {}\n", info.commit);
    fmt::print("Git commit short: {}\n", info.commit_short);
    fmt::print("Git dirty: {}\n", info.dirty ? "yes" : "no");
    fmt::print("Build timestamp (UTC): {}\n", info.timestamp);
}

int main(int argc, char** argv)
{
    try {
        treecp::infra::logging::setup(spdlog::level::info);

        auto args_res = args_parser(argc, argv);
        if (!args_res) {
            return args_res.error(); // --help или ошибка разбора
        }
        const auto& args = *args_res;

        if (args.version) {
            out_git_verse(git);
            return 0;
        }

        // 1. Загрузить из файла
        auto config_res = load_config_file();
        if (!config_res) {
            auto err = treecp::infra::log_and_return(std::move(config_res.error()));
            return err.to_exit_code();
        }
        auto config = std::move(*config_res);

        // 2. Переопределить из CLI
        config.merge_with(load_from_cli(args));

        spdlog::set_level(treecp::infra::logging::effective_level(config.log_level, config.quiet));

        spdlog::debug("Sources: {}", args.sources);
        spdlog::debug("Destination: {}", args.destination);

        std::vector<std::filesystem::path> source_paths(args.sources.begin(), args.sources.end());
        const std::filesystem::path destination_path(args.destination);

        for (const auto& src : source_paths) {
            std::error_code ec;
            if (!std::filesystem::exists(src, ec)) {
                auto err = treecp::infra::log_and_return(treecp::infra::make_error(
                    treecp::infra::ErrorCode::InvalidArgument,
                    fmt::format("Source does not exist: {}", src.string()), src));
                return err.to_exit_code();
            }
        }

        std::unique_ptr<treecp::infra::ProgressSink> sink;
        if (config.progress && !config.quiet) {
            sink = std::make_unique<treecp::infra::ConsoleProgress>();
        } else {
            sink = std::make_unique<treecp::infra::NullProgress>();
        }

        treecp::core::Orchestrator orchestrator(config, *sink);

        spdlog::info("Starting copy sources={} destination={}", source_paths.size(), destination_path.string());
        auto start_time = std::chrono::steady_clock::now();

        auto result = source_paths.size() == 1
            ? orchestrator.copy(source_paths.front(), destination_path)
            : orchestrator.copy_multiple(source_paths, destination_path);

        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);
        sink.reset(); // дорисовать прогресс до вывода итогов

        if (!result.ok()) {
            spdlog::error("Copy failed files={} code={} err=\"{}\"",
                          result.files_copied,
                          treecp::infra::to_string(result.error->code),
                          result.error->message);
            return result.error->to_exit_code();
        }

        spdlog::info("Copy completed files={} bytes={} ({:.2f} MB) elapsed={:.2f}s",
                     result.files_copied,
                     result.bytes_copied,
                     result.bytes_copied / 1024.0 / 1024.0,
                     duration.count() / 1000.0);

        if (result.bytes_copied > 0 && duration.count() > 0) {
            double speed_mbps = (result.bytes_copied / 1024.0 / 1024.0) / (duration.count() / 1000.0);
            spdlog::info("Average speed: {:.2f} MB/s", speed_mbps);
        }

        return 0;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
