#include "xxhash_verifier.hpp"
#include <fmt/core.h>
#include <fstream>
#include <memory>
#include <vector>

namespace treecp::infra {

auto XXHashVerifier::hash_file(const std::filesystem::path& path)
    -> std::expected<XXH64_hash_t, Error>
{
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::unexpected(make_error(ErrorCode::SourceOpenError,
                                          fmt::format("Cannot open file for hashing: {}", path.string()),
                                          path));
    }

    std::unique_ptr<XXH64_state_t, decltype(&XXH64_freeState)> state{XXH64_createState(), &XXH64_freeState};
    if (!state) {
        return std::unexpected(make_error(ErrorCode::Unknown, "Failed to create XXH64 state", path));
    }

    XXH64_reset(state.get(), 0); // seed = 0

    std::vector<char> buffer(BUFFER_SIZE);
    while (file.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || file.gcount() > 0) {
        XXH64_update(state.get(), buffer.data(), static_cast<std::size_t>(file.gcount()));
    }

    if (file.bad()) {
        return std::unexpected(make_error(ErrorCode::TransferError,
                                          fmt::format("Error reading file: {}", path.string()),
                                          path));
    }

    return XXH64_digest(state.get());
}

auto XXHashVerifier::verify_files(const std::filesystem::path& src,
                                  const std::filesystem::path& dst)
    -> std::expected<void, Error>
{
    auto src_hash = hash_file(src);
    if (!src_hash) {
        return std::unexpected(std::move(src_hash.error()));
    }

    auto dst_hash = hash_file(dst);
    if (!dst_hash) {
        return std::unexpected(std::move(dst_hash.error()));
    }

    if (*src_hash != *dst_hash) {
        return std::unexpected(make_error(ErrorCode::ChecksumMismatch,
            fmt::format("Hash mismatch: {} (src: {:016x}) vs {} (dst: {:016x})",
                        src.string(), *src_hash, dst.string(), *dst_hash),
            dst));
    }

    return {};
}

} // namespace treecp::infra
