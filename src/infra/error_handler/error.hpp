#pragma once

#include <string>
#include <string_view>
#include <system_error>
#include <source_location>
#include <expected>
#include <spdlog/spdlog.h>

namespace mtcopy::infra {

enum class ErrorCode {
    // Ошибки настройки (копирование не начинается)
    NotFound,
    NotADirectory,
    PermissionDenied,
    InvalidArgument,

    // Ошибки отдельных задач (копирование продолжается)
    AlreadyExists,
    DiskFull,
    Busy,            // ← transient, можно повторить
    IOError,
    ChecksumMismatch,
    Interrupted,

    // Системные
    Unknown,
};

[[nodiscard]] auto to_string(ErrorCode code) -> std::string_view;

struct Error {
    ErrorCode code;
    std::string message;
    std::string file;
    int line;
    std::string function;

    // Конструктор с автоматическим захватом location
    Error(ErrorCode c, std::string_view msg,
          const std::source_location& loc = std::source_location::current())
        : code(c)
        , message(msg)
        , file(loc.file_name())
        , line(static_cast<int>(loc.line()))
        , function(loc.function_name())
    {}

    [[nodiscard]] auto is_fatal() const -> bool;
    [[nodiscard]] auto to_exit_code() const -> int;
    [[nodiscard]] auto what() const -> const char*;

    [[nodiscard]] auto is_transient() const -> bool {
        return code == ErrorCode::Busy;
    }
};

// Псевдонимы для удобства
template<typename T>
using Result = std::expected<T, Error>;

using VoidResult = Result<void>;

// Коды завершения процесса
inline constexpr int kExitSuccess = 0;
inline constexpr int kExitSetupError = 1;
inline constexpr int kExitPartialFailure = 2;
inline constexpr int kExitInterrupted = 130;

// Вспомогательные функции-конструкторы
[[nodiscard]] auto make_error(
    ErrorCode code,
    std::string_view message,
    const std::source_location& loc = std::source_location::current()
) -> Error;

/// Переводит системный std::error_code (errno) в ErrorCode.
[[nodiscard]] auto from_error_code(const std::error_code& ec) -> ErrorCode;

/// make_error + from_error_code, сообщение дополняется ec.message().
[[nodiscard]] auto make_system_error(
    const std::error_code& ec,
    std::string_view context,
    const std::source_location& loc = std::source_location::current()
) -> Error;

// Логирование ошибки и возврат
[[nodiscard]] auto log_and_return(Error&& err) -> Error;

} // namespace mtcopy::infra
