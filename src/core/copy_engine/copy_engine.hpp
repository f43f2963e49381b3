#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <semaphore>
#include "../../infra/config/config.hpp"
#include "../../infra/error_handler/error.hpp"
#include "../../infra/monitoring/progress_channel.hpp"

namespace treecp::core {

// Итог копирования поддерева. Счётчики сохраняются и при ошибке:
// это то, что реально успело скопироваться.
struct TransferResult {
    std::uint64_t files_copied = 0;
    std::uint64_t bytes_copied = 0;
    std::optional<infra::Error> error;

    [[nodiscard]] auto ok() const -> bool { return !error.has_value(); }
};

namespace detail {

// Общее состояние одного вызова copy_tree: его разделяют все
// подзадачи-подкаталоги. Первая пришедшая ошибка остаётся, остальные
// отбрасываются, счётчики суммируются всегда.
class AggregateState {
public:
    void add_file(std::uint64_t bytes);
    void record_error(infra::Error&& err);
    void merge(TransferResult&& child);

    [[nodiscard]] auto take() -> TransferResult;

private:
    std::mutex mutex_;
    std::uint64_t files_copied_ = 0;
    std::uint64_t bytes_copied_ = 0;
    std::optional<infra::Error> first_error_;
};

} // namespace detail

class CopyEngine {
public:
    // Проверка копии после записи (config.verify). Пустой -> xxHash64.
    using FileVerifier = std::function<infra::Result<void>(const std::filesystem::path& src,
                                                           const std::filesystem::path& dst)>;

    explicit CopyEngine(const infra::Config& config, FileVerifier verifier = {});

    CopyEngine(const CopyEngine&) = delete;
    CopyEngine& operator=(const CopyEngine&) = delete;

    // Рекурсивно копирует src в dst. Каждый подкаталог уходит в отдельную
    // задачу (пока есть свободные слоты max_parallel_dirs, иначе копируется
    // в текущем потоке), файлы копируются последовательно. Ошибка файла
    // прекращает обработку оставшихся записей этого уровня, но запущенные
    // подзадачи всегда дожидаются. На каждый скопированный файл один тик
    // в progress.
    [[nodiscard]] auto copy_tree(const std::filesystem::path& src,
                                 const std::filesystem::path& dst,
                                 infra::ProgressChannel::Sender progress) const
        -> TransferResult;

private:
    [[nodiscard]] auto copy_file_(const std::filesystem::path& src,
                                  const std::filesystem::path& dst) const
        -> infra::Result<std::uint64_t>;

    const infra::Config& config_;
    const std::size_t buffer_size_;
    const FileVerifier verifier_;
    // nullptr -> число параллельных подзадач не ограничено
    std::unique_ptr<std::counting_semaphore<>> dir_slots_;
};

} // namespace treecp::core
