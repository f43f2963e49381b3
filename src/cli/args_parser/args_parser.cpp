#include "args_parser.hpp"

#include <CLI/CLI.hpp>

#include "../../infra/config/config.hpp"

namespace treecp::args_parser {

auto parse_args(int argc, char const* const* argv) -> std::expected<CLIArgs, int>
{
    CLI::App app{"treecp - recursive concurrent directory copy"};

    CLIArgs args;
    std::vector<std::string> paths;

    app.add_option("paths", paths, "One or more source directories followed by the destination")
        ->expected(-1);

    std::size_t buffer_size = 0;
    auto* buffer_opt = app.add_option("-b,--buffer-size", buffer_size,
                                      "Transfer buffer size (e.g. 64K, 4M), at most 1G; default 1M")
        ->transform(CLI::AsSizeValue(false))
        ->check(CLI::Range(std::size_t{0}, infra::MAX_BUFFER_SIZE));

    std::uint32_t max_parallel = 0;
    auto* parallel_opt = app.add_option("-j,--max-parallel-dirs", max_parallel,
                                        "Directories copied concurrently (0 = unlimited)");

    std::string log_level;
    auto* log_opt = app.add_option("--log-level", log_level, "Log level")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "critical", "off"}));

    app.add_flag("--verify", args.verify, "Compare xxHash64 of source and destination after each file");
    app.add_flag("--no-progress", args.no_progress, "Do not draw the progress bar");
    app.add_flag("-q,--quiet", args.quiet, "Print errors only");
    app.add_flag("--version", args.version, "Print build information and exit");

    try {
        app.parse(argc, argv);
        if (!args.version && paths.size() < 2) {
            throw CLI::ValidationError("paths", "expected at least one SOURCE and a DEST");
        }
    } catch (const CLI::ParseError& e) {
        return std::unexpected(app.exit(e));
    }

    if (!paths.empty()) {
        args.destination = paths.back();
        paths.pop_back();
        args.sources = std::move(paths);
    }
    if (*buffer_opt) args.buffer_size = buffer_size;
    if (*parallel_opt) args.max_parallel_dirs = max_parallel;
    if (*log_opt) args.log_level = log_level;

    return args;
}

} // namespace treecp::args_parser
