#pragma once

#include <filesystem>
#include <expected>
#include "../error_handler/error.hpp"
#include <xxhash.h>

namespace treecp::infra {

class XXHashVerifier {
public:
    // Вычисляет xxHash64 для файла
    static auto hash_file(const std::filesystem::path& path)
        -> std::expected<XXH64_hash_t, Error>;

    // Сравнивает хеши двух файлов; несовпадение -> ErrorCode::ChecksumMismatch
    static auto verify_files(const std::filesystem::path& src,
                             const std::filesystem::path& dst)
        -> std::expected<void, Error>;

private:
    static constexpr std::size_t BUFFER_SIZE = 1024 * 1024;
};

} // namespace treecp::infra
