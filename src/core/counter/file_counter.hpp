#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include "../../infra/error_handler/error.hpp"

namespace treecp::core {

/// Число файлов (всё, что не каталог) в дереве. Симлинки на каталоги
/// считаются файлами, так же их видит CopyEngine.
/// Каталог, который нельзя прочитать, -> ErrorCode::ReadError.
[[nodiscard]] auto count_files(const std::filesystem::path& directory)
    -> std::expected<std::uint64_t, infra::Error>;

} // namespace treecp::core
