#include "copy_engine.hpp"
#include <future>
#include <system_error>
#include <utility>
#include <vector>
#include "../../adapters/fs.hpp"
#include "../../infra/hash/xxhash_verifier.hpp"

namespace treecp::core {

namespace {

// Возвращает слот семафора при выходе из подзадачи
class SlotGuard {
public:
    explicit SlotGuard(std::counting_semaphore<>* slots) noexcept : slots_(slots) {}
    ~SlotGuard() {
        if (slots_) slots_->release();
    }

    SlotGuard(const SlotGuard&) = delete;
    SlotGuard& operator=(const SlotGuard&) = delete;

private:
    std::counting_semaphore<>* slots_;
};

} // namespace

namespace detail {

void AggregateState::add_file(std::uint64_t bytes) {
    std::lock_guard lock(mutex_);
    ++files_copied_;
    bytes_copied_ += bytes;
}

void AggregateState::record_error(infra::Error&& err) {
    std::lock_guard lock(mutex_);
    if (!first_error_) {
        first_error_ = std::move(err);
    }
}

void AggregateState::merge(TransferResult&& child) {
    std::lock_guard lock(mutex_);
    files_copied_ += child.files_copied;
    bytes_copied_ += child.bytes_copied;
    if (child.error && !first_error_) {
        first_error_ = std::move(child.error);
    }
}

auto AggregateState::take() -> TransferResult {
    std::lock_guard lock(mutex_);
    return TransferResult{
        .files_copied = files_copied_,
        .bytes_copied = bytes_copied_,
        .error = std::exchange(first_error_, std::nullopt)
    };
}

} // namespace detail

CopyEngine::CopyEngine(const infra::Config& config, FileVerifier verifier)
    : config_(config)
    , buffer_size_(adapters::fs::effective_buffer_size(config.buffer_size.value_or(0)))
    , verifier_(verifier ? std::move(verifier) : FileVerifier{&infra::XXHashVerifier::verify_files})
{
    if (const auto limit = config_.effective_max_parallel_dirs(); limit > 0) {
        dir_slots_ = std::make_unique<std::counting_semaphore<>>(static_cast<std::ptrdiff_t>(limit));
    }
}

auto CopyEngine::copy_tree(const std::filesystem::path& src,
                           const std::filesystem::path& dst,
                           infra::ProgressChannel::Sender progress) const
    -> TransferResult
{
    if (auto created = adapters::fs::ensure_directory(dst); !created) {
        return TransferResult{.error = std::move(created.error())};
    }

    auto entries = adapters::fs::list_directory(src);
    if (!entries) {
        return TransferResult{.error = std::move(entries.error())};
    }

    detail::AggregateState state;
    std::vector<std::future<void>> subtasks;

    for (const auto& entry : *entries) {
        auto src_path = src / entry.name;
        auto dst_path = dst / entry.name;

        if (entry.is_directory) {
            const bool has_slot = !dir_slots_ || dir_slots_->try_acquire();
            if (has_slot) {
                auto* slots = dir_slots_.get();
                try {
                    subtasks.push_back(std::async(std::launch::async,
                        [this, &state, slots, progress, s = src_path, d = dst_path] {
                            SlotGuard guard{slots};
                            state.merge(copy_tree(s, d, progress));
                        }));
                    continue;
                } catch (const std::system_error&) {
                    // поток не создался, копируем сами
                    if (slots) slots->release();
                }
            }
            // Свободных слотов нет: поддерево копируется в текущем потоке
            state.merge(copy_tree(src_path, dst_path, progress));
            continue;
        }

        auto copied = copy_file_(src_path, dst_path);
        if (!copied) {
            state.record_error(std::move(copied.error()));
            break; // остальные записи этого уровня не трогаем
        }
        progress.send();
        state.add_file(*copied);
    }

    // Подзадачи дожидаются всегда, даже после ошибки на этом уровне
    for (auto& task : subtasks) {
        task.get();
    }
    return state.take();
}

auto CopyEngine::copy_file_(const std::filesystem::path& src,
                            const std::filesystem::path& dst) const
    -> infra::Result<std::uint64_t>
{
    auto bytes = adapters::fs::copy_file_buffered(src, dst, buffer_size_);
    if (!bytes) {
        return bytes;
    }

    if (config_.verify) {
        // несовпадение обрабатывается как сбой копирования файла
        auto verified = verifier_(src, dst);
        if (!verified) {
            return std::unexpected(std::move(verified.error()));
        }
    }
    return bytes;
}

} // namespace treecp::core
