#pragma once

#include <string>
#include <string_view>
#include <system_error>
#include <source_location>
#include <expected>
#include <filesystem>
#include <utility>

namespace treecp::infra {

enum class ErrorCode {
    // Ошибки обхода и копирования
    ReadError,             // не удалось прочитать каталог
    DestinationError,      // не удалось создать каталог назначения
    SourceOpenError,
    DestinationOpenError,
    TransferError,         // ошибка в процессе передачи байтов

    // Проверка
    ChecksumMismatch,

    // Вход пользователя
    InvalidArgument,
    ConfigError,

    Unknown,
};

[[nodiscard]] auto to_string(ErrorCode code) -> std::string_view;

struct Error {
    ErrorCode code;
    std::string message;
    std::filesystem::path path;   // путь, на котором произошла ошибка (может быть пустым)
    std::string file;
    int line;
    std::string function;

    // Конструктор с автоматическим захватом location
    Error(ErrorCode c, std::string_view msg, std::filesystem::path p = {},
          const std::source_location& loc = std::source_location::current())
        : code(c)
        , message(msg)
        , path(std::move(p))
        , file(loc.file_name())
        , line(static_cast<int>(loc.line()))
        , function(loc.function_name())
    {}

    [[nodiscard]] auto is_fatal() const -> bool;
    [[nodiscard]] auto to_exit_code() const -> int;
    [[nodiscard]] auto what() const -> const char*;
};

// Псевдонимы для удобства
template<typename T>
using Result = std::expected<T, Error>;

[[nodiscard]] auto make_error(
    ErrorCode code,
    std::string_view message,
    const std::filesystem::path& path = {},
    const std::source_location& loc = std::source_location::current()
) -> Error;

/// Ошибка из errno / std::error_code с текстом системы.
[[nodiscard]] auto make_system_error(
    ErrorCode code,
    std::string_view what,
    const std::filesystem::path& path,
    std::error_code ec,
    const std::source_location& loc = std::source_location::current()
) -> Error;

// Логирование ошибки и возврат
[[nodiscard]] auto log_and_return(Error&& err) -> Error;

} // namespace treecp::infra
