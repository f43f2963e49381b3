#include "fs.hpp"

#include <algorithm>
#include <cerrno>
#include <new>
#include <stdexcept>
#include <system_error>

#include <fmt/core.h>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace treecp::adapters::fs {

namespace {

auto errno_code() -> std::error_code {
    return {errno, std::generic_category()};
}

// write() может записать меньше запрошенного, дописываем остаток.
auto write_all(int fd, const char* data, std::size_t size) -> std::error_code {
    while (size > 0) {
        const ssize_t written = ::write(fd, data, size);
        if (written < 0) {
            if (errno == EINTR) continue;
            return errno_code();
        }
        data += written;
        size -= static_cast<std::size_t>(written);
    }
    return {};
}

} // namespace

UniqueFd::~UniqueFd() {
    reset();
}

int UniqueFd::release() noexcept {
    const int fd = fd_;
    fd_ = -1;
    return fd;
}

void UniqueFd::reset(int fd) noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
    }
    fd_ = fd;
}

auto effective_buffer_size(std::size_t configured) noexcept -> std::size_t {
    return configured > 0 ? configured : DEFAULT_BUFFER_SIZE;
}

auto list_directory(const std::filesystem::path& dir)
    -> std::expected<std::vector<DirEntry>, infra::Error>
{
    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec) {
        return std::unexpected(infra::make_system_error(
            infra::ErrorCode::ReadError, "Cannot read directory", dir, ec));
    }

    std::vector<DirEntry> entries;
    for (; it != std::filesystem::end(it); it.increment(ec)) {
        if (ec) break;
        const auto status = it->symlink_status(ec);
        if (ec) break;
        entries.push_back(DirEntry{
            .name = it->path().filename().string(),
            .is_directory = std::filesystem::is_directory(status),
        });
    }
    if (ec) {
        return std::unexpected(infra::make_system_error(
            infra::ErrorCode::ReadError, "Cannot read directory", dir, ec));
    }

    std::ranges::sort(entries, {}, &DirEntry::name);
    return entries;
}

auto ensure_directory(const std::filesystem::path& dir)
    -> std::expected<void, infra::Error>
{
    std::error_code ec;
    if (std::filesystem::is_directory(dir, ec)) {
        return {};
    }
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        return std::unexpected(infra::make_system_error(
            infra::ErrorCode::DestinationError, "Cannot create directory", dir, ec));
    }
    return {};
}

auto copy_file_buffered(
    const std::filesystem::path& src,
    const std::filesystem::path& dst,
    std::size_t buffer_size
) -> std::expected<std::uint64_t, infra::Error>
{
    UniqueFd src_fd{::open(src.c_str(), O_RDONLY | O_CLOEXEC)};
    if (!src_fd.valid()) {
        return std::unexpected(infra::make_system_error(
            infra::ErrorCode::SourceOpenError, "Cannot open source", src, errno_code()));
    }

    // src_fd закроется деструктором и на этом пути
    UniqueFd dst_fd{::open(dst.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0666)};
    if (!dst_fd.valid()) {
        return std::unexpected(infra::make_system_error(
            infra::ErrorCode::DestinationOpenError, "Cannot create destination", dst, errno_code()));
    }

    const auto chunk = effective_buffer_size(buffer_size);
    std::vector<char> buffer;
    try {
        buffer.resize(chunk);
    } catch (const std::bad_alloc&) {
        return std::unexpected(infra::make_error(infra::ErrorCode::TransferError,
            fmt::format("Cannot allocate {}-byte buffer for {}", chunk, src.string()), src));
    } catch (const std::length_error&) {
        return std::unexpected(infra::make_error(infra::ErrorCode::TransferError,
            fmt::format("Buffer size {} is too large for {}", chunk, src.string()), src));
    }
    std::uint64_t total = 0;
    for (;;) {
        const ssize_t n = ::read(src_fd.get(), buffer.data(), buffer.size());
        if (n == 0) break;
        if (n < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(infra::make_system_error(
                infra::ErrorCode::TransferError, "Read failed on", src, errno_code()));
        }
        if (auto ec = write_all(dst_fd.get(), buffer.data(), static_cast<std::size_t>(n)); ec) {
            return std::unexpected(infra::make_system_error(
                infra::ErrorCode::TransferError, "Write failed on", dst, ec));
        }
        total += static_cast<std::uint64_t>(n);
    }

    // Ошибка close() на приёмнике означает потерю данных (NFS и т.п.)
    if (::close(dst_fd.release()) != 0) {
        return std::unexpected(infra::make_system_error(
            infra::ErrorCode::TransferError, "Close failed on", dst, errno_code()));
    }
    return total;
}

} // namespace treecp::adapters::fs
