#pragma once

#include <string>
#include <string_view>
#include <system_error>
#include <source_location>
#include <expected>

namespace dircopy::infra {

enum class ErrorCode {
    // Фатальные для всей операции
    FileNotFound,
    PermissionDenied,
    NotADirectory,
    InvalidPath,
    UnsupportedFeature,

    // Ошибки ввода-вывода
    DiskFull,
    IoFailure,

    Unknown,
};

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
    [[nodiscard]] auto what() const -> const char*;
};

template<typename T>
using Result = std::expected<T, Error>;

using VoidResult = Result<void>;

[[nodiscard]] auto make_error(
    ErrorCode code,
    std::string_view message,
    const std::source_location& loc = std::source_location::current()
) -> Error;

/// Переводит std::error_code (errno) в Error, добавляя контекст в сообщение:
/// "<context>: <strerror>".
[[nodiscard]] auto from_error_code(
    const std::error_code& ec,
    std::string_view context,
    const std::source_location& loc = std::source_location::current()
) -> Error;

/// То же самое для текущего errno.
[[nodiscard]] auto from_errno(
    std::string_view context,
    const std::source_location& loc = std::source_location::current()
) -> Error;

[[nodiscard]] auto error_code_name(ErrorCode code) -> std::string_view;

} // namespace dircopy::infra
