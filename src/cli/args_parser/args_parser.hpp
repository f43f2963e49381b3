#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <optional>
#include <expected>

namespace treecp::args_parser {

struct CLIArgs
{
    std::vector<std::string> sources;               // позиционные аргументы, все кроме последнего
    std::string destination;                        // последний позиционный аргумент
    bool verify{false};                             // --verify
    bool no_progress{false};                        // --no-progress
    bool quiet{false};                              // -q, --quiet
    bool version{false};                            // --version
    std::optional<std::uint32_t> max_parallel_dirs; // -j, --max-parallel-dirs=N
    std::optional<std::size_t> buffer_size;         // -b, --buffer-size=SIZE
    std::optional<std::string> log_level;           // --log-level=LEVEL
};

/// Parses command-line arguments.
/// On --help or a parse error returns the exit code the process should end with.
[[nodiscard]] auto parse_args(int argc, char const* const* argv) -> std::expected<CLIArgs, int>;

} // namespace treecp::args_parser
