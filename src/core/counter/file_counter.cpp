#include "file_counter.hpp"
#include "../../adapters/fs.hpp"

namespace treecp::core {

auto count_files(const std::filesystem::path& directory)
    -> std::expected<std::uint64_t, infra::Error>
{
    auto entries = adapters::fs::list_directory(directory);
    if (!entries) {
        return std::unexpected(std::move(entries.error()));
    }

    std::uint64_t count = 0;
    for (const auto& entry : *entries) {
        if (!entry.is_directory) {
            ++count;
            continue;
        }
        auto sub = count_files(directory / entry.name);
        if (!sub) {
            return sub;
        }
        count += *sub;
    }
    return count;
}

} // namespace treecp::core
