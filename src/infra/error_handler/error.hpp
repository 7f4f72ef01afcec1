#pragma once

#include <string>
#include <string_view>
#include <system_error>
#include <source_location>
#include <expected>
#include <spdlog/spdlog.h>

namespace vaultup::infra {

enum class ErrorCode {
    // Проверка аргументов (до любого I/O)
    InvalidChunkSize,

    // Конфигурация и resume-записи
    MalformedRecord,
    UnsupportedRecordVersion,
    InvalidConfig,

    // Локальный ввод-вывод
    FileNotFound,
    ReadFailed,
    WriteFailed,

    // Удалённое хранилище
    VaultNotFound,
    SessionNotFound,
    PartRejected,
    SizeMismatch,
    ChecksumMismatch,
    RemoteFailure,

    // Системные
    Interrupted,
    InvalidState,
    Unknown,
};

enum class ErrorKind {
    Validation,
    Config,
    Io,
    Remote,
    Interrupted,
    Internal,
};

struct Error {
    ErrorCode code;
    std::string message;
    std::string file;
    int line;
    std::string function;

    Error(ErrorCode c, std::string_view msg,
          const std::source_location& loc = std::source_location::current())
        : code(c)
        , message(msg)
        , file(loc.file_name())
        , line(static_cast<int>(loc.line()))
        , function(loc.function_name())
    {}

    [[nodiscard]] auto kind() const -> ErrorKind;
    [[nodiscard]] auto is_fatal() const -> bool;
    [[nodiscard]] auto to_exit_code() const -> int;
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

[[nodiscard]] auto to_string(ErrorKind kind) -> std::string_view;

// Логирование ошибки и возврат
[[nodiscard]] auto log_and_return(Error&& err) -> Error;

} // namespace vaultup::infra
