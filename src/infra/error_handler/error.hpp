#pragma once

#include <string>
#include <string_view>
#include <system_error>
#include <source_location>
#include <expected>
#include <spdlog/spdlog.h>

namespace rescuecp::infra {

enum class ErrorCode {
    // Нарушение предусловий (до копирования первого байта)
    DestinationExists,
    LedgerMissing,
    SizeMismatch,
    BlockSizeMismatch,
    UnsupportedRange,
    InvalidArgument,
    FileNotFound,
    PermissionDenied,
    ConfigError,
    LedgerCorrupt,

    // Сбой чтения носителя: повторяем, затем пишем нули
    MediaError,

    // Неклассифицированные ошибки потока (фатальные)
    StreamFailure,
    PartialReadFailure,
    Unknown,
};

namespace exit_code {
inline constexpr int Clean = 0;
inline constexpr int BadBlocks = 1;
inline constexpr int DestinationExists = 2;
inline constexpr int LedgerMissing = 3;
inline constexpr int Precondition = 4;
inline constexpr int IoFailure = 5;
} // namespace exit_code

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
    [[nodiscard]] auto is_precondition() const -> bool;
    [[nodiscard]] auto to_exit_code() const -> int;
    [[nodiscard]] auto what() const -> const char*;

    /// Only media errors are worth repeating: the block may come back on a later attempt.
    [[nodiscard]] auto is_transient() const -> bool {
        return code == ErrorCode::MediaError;
    }
};

// Псевдонимы для удобства
template<typename T>
using Result = std::expected<T, Error>;

using VoidResult = Result<void>;

[[nodiscard]] auto to_string(ErrorCode code) -> std::string_view;

// Вспомогательные функции-конструкторы
[[nodiscard]] auto make_error(
    ErrorCode code,
    std::string_view message,
    const std::source_location& loc = std::source_location::current()
) -> Error;

/// Builds an error from an errno value, classifying EIO-like failures as MediaError.
[[nodiscard]] auto make_errno_error(
    int err,
    std::string_view context,
    const std::source_location& loc = std::source_location::current()
) -> Error;

// Логирование ошибки и возврат
[[nodiscard]] auto log_and_return(Error&& err) -> Error;

} // namespace rescuecp::infra
