#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <expected>
#include <string>
#include <vector>
#include "../infra/error_handler/error.hpp"

namespace treecp::adapters::fs {

inline constexpr std::size_t DEFAULT_BUFFER_SIZE = 1024 * 1024; // 1 MiB

// Владеющий POSIX-дескриптор: закрывается в деструкторе на любом пути.
class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) noexcept : fd_(fd) {}
    ~UniqueFd();

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    [[nodiscard]] auto get() const noexcept -> int { return fd_; }
    [[nodiscard]] auto valid() const noexcept -> bool { return fd_ >= 0; }
    auto release() noexcept -> int;
    void reset(int fd = -1) noexcept;

private:
    int fd_ = -1;
};

struct DirEntry {
    std::string name;
    bool is_directory = false;   // без перехода по симлинкам
};

/// Содержимое каталога, отсортированное по имени.
/// Любая ошибка перечисления: ErrorCode::ReadError.
[[nodiscard]] auto list_directory(const std::filesystem::path& dir)
    -> std::expected<std::vector<DirEntry>, infra::Error>;

/// Создаёт каталог со всеми недостающими родителями (режим 0777 & ~umask).
/// Ошибка: ErrorCode::DestinationError.
[[nodiscard]] auto ensure_directory(const std::filesystem::path& dir)
    -> std::expected<void, infra::Error>;

// Буферизованное копирование одного файла.
// Источник открывается на чтение (SourceOpenError), приёмник создаётся или
// обрезается (DestinationOpenError), байты переносятся блоками buffer_size
// (TransferError). Буфер, который не удалось выделить, тоже TransferError.
// Возвращает количество скопированных байтов.
[[nodiscard]] auto copy_file_buffered(
    const std::filesystem::path& src,
    const std::filesystem::path& dst,
    std::size_t buffer_size = DEFAULT_BUFFER_SIZE
) -> std::expected<std::uint64_t, infra::Error>;

[[nodiscard]] auto effective_buffer_size(std::size_t configured) noexcept -> std::size_t;

} // namespace treecp::adapters::fs
