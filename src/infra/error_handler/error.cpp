#include "error.hpp"
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <cstdlib>

namespace treecp::infra {

auto to_string(ErrorCode code) -> std::string_view {
    switch (code) {
        case ErrorCode::ReadError:            return "ReadError";
        case ErrorCode::DestinationError:     return "DestinationError";
        case ErrorCode::SourceOpenError:      return "SourceOpenError";
        case ErrorCode::DestinationOpenError: return "DestinationOpenError";
        case ErrorCode::TransferError:        return "TransferError";
        case ErrorCode::ChecksumMismatch:     return "ChecksumMismatch";
        case ErrorCode::InvalidArgument:      return "InvalidArgument";
        case ErrorCode::ConfigError:          return "ConfigError";
        case ErrorCode::Unknown:              break;
    }
    return "Unknown";
}

bool Error::is_fatal() const {
    switch (code) {
        case ErrorCode::ReadError:
        case ErrorCode::DestinationError:
        case ErrorCode::InvalidArgument:
        case ErrorCode::ConfigError:
            return true;
        default:
            return false;
    }
}

int Error::to_exit_code() const {
    switch (code) {
        case ErrorCode::SourceOpenError:
        case ErrorCode::DestinationOpenError: return 2;
        case ErrorCode::TransferError:        return 3;
        case ErrorCode::ChecksumMismatch:     return 22;
        case ErrorCode::InvalidArgument:
        case ErrorCode::ConfigError:          return 64; // EX_USAGE
        default:                              return EXIT_FAILURE;
    }
}

const char* Error::what() const {
    return message.c_str();
}

Error make_error(ErrorCode code, std::string_view message,
                 const std::filesystem::path& path,
                 const std::source_location& loc) {
    return Error{code, message, path, loc};
}

Error make_system_error(ErrorCode code, std::string_view what,
                        const std::filesystem::path& path, std::error_code ec,
                        const std::source_location& loc) {
    return Error{code, fmt::format("{} {}: {}", what, path.string(), ec.message()), path, loc};
}

Error log_and_return(Error&& err) {
    auto level = err.is_fatal() ? spdlog::level::err : spdlog::level::warn;
    spdlog::log(level,
        "[{}:{} in {}] {}: {}",
        err.file, err.line, err.function,
        to_string(err.code), err.message
    );
    return std::move(err);
}

} // namespace treecp::infra
