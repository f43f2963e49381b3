#include "orchestrator.hpp"
#include <algorithm>
#include <future>
#include <utility>
#include "../counter/file_counter.hpp"
#include "../../adapters/fs.hpp"
#include "../../infra/monitoring/progress_channel.hpp"

namespace treecp::core {

Orchestrator::Orchestrator(const infra::Config& config, infra::ProgressSink& sink)
    : config_(config), sink_(sink), engine_(config) {}

auto Orchestrator::copy(const std::filesystem::path& source,
                        const std::filesystem::path& destination)
    -> TransferResult
{
    auto total = count_files(source);
    if (!total) {
        return TransferResult{.error = std::move(total.error())};
    }

    sink_.set_total(*total);

    infra::ProgressPump pump{sink_, config_.effective_progress_queue()};
    auto result = engine_.copy_tree(source, destination, pump.sender());
    // copy_tree вернулся, значит все отправители завершены, канал можно закрыть
    pump.drain_and_stop();

    if (result.ok()) {
        sink_.finish();
    }
    return result;
}

auto Orchestrator::copy_multiple(const std::vector<std::filesystem::path>& sources,
                                 const std::filesystem::path& destination)
    -> TransferResult
{
    std::uint64_t total_files = 0;
    for (const auto& source : sources) {
        auto count = count_files(source);
        if (!count) {
            return TransferResult{.error = std::move(count.error())};
        }
        total_files += *count;
    }

    // Один прогресс на все источники
    sink_.set_total(total_files);

    infra::ProgressPump pump{sink_, config_.effective_progress_queue()};

    if (auto created = adapters::fs::ensure_directory(destination); !created) {
        pump.drain_and_stop();
        return TransferResult{.error = std::move(created.error())};
    }

    std::vector<std::future<TransferResult>> tasks;
    tasks.reserve(sources.size());
    for (const auto& source : sources) {
        tasks.push_back(std::async(std::launch::async,
            [this, &source, &destination, progress = pump.sender()] {
                return engine_.copy_tree(source, destination, progress);
            }));
    }

    TransferResult combined;
    std::vector<std::pair<std::filesystem::path, infra::Error>> failures;
    for (std::size_t i = 0; i < tasks.size(); ++i) {
        auto result = tasks[i].get();
        combined.files_copied += result.files_copied;
        combined.bytes_copied += result.bytes_copied;
        if (result.error) {
            failures.emplace_back(sources[i], std::move(*result.error));
        }
    }

    pump.drain_and_stop();
    sink_.finish();

    if (!failures.empty()) {
        auto first = std::ranges::min_element(failures, {},
            [](const auto& failure) -> const std::filesystem::path& { return failure.first; });
        combined.error = std::move(first->second);
    }
    return combined;
}

} // namespace treecp::core
