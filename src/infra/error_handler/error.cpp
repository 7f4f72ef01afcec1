#include "error.hpp"
#include <fmt/core.h>
#include <cstdlib>

namespace vaultup::infra {

ErrorKind Error::kind() const {
    switch (code) {
        case ErrorCode::InvalidChunkSize:
            return ErrorKind::Validation;
        case ErrorCode::MalformedRecord:
        case ErrorCode::UnsupportedRecordVersion:
        case ErrorCode::InvalidConfig:
            return ErrorKind::Config;
        case ErrorCode::FileNotFound:
        case ErrorCode::ReadFailed:
        case ErrorCode::WriteFailed:
            return ErrorKind::Io;
        case ErrorCode::VaultNotFound:
        case ErrorCode::SessionNotFound:
        case ErrorCode::PartRejected:
        case ErrorCode::SizeMismatch:
        case ErrorCode::ChecksumMismatch:
        case ErrorCode::RemoteFailure:
            return ErrorKind::Remote;
        case ErrorCode::Interrupted:
            return ErrorKind::Interrupted;
        default:
            return ErrorKind::Internal;
    }
}

bool Error::is_fatal() const {
    // Прерывание пользователем оставляет resume-запись и не считается фатальным
    return kind() != ErrorKind::Interrupted;
}

int Error::to_exit_code() const {
    if (code == ErrorCode::ChecksumMismatch) return 22;
    switch (kind()) {
        case ErrorKind::Validation:  return 2;
        case ErrorKind::Config:      return 3;
        case ErrorKind::Io:          return 4;
        case ErrorKind::Remote:      return 5;
        case ErrorKind::Interrupted: return 130; // SIGINT
        default:                     return EXIT_FAILURE;
    }
}

const char* Error::what() const {
    return message.c_str();
}

Error make_error(ErrorCode code, std::string_view message,
                 const std::source_location& loc) {
    return Error{code, std::string(message), loc};
}

std::string_view to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Validation:  return "validation";
        case ErrorKind::Config:      return "config";
        case ErrorKind::Io:          return "io";
        case ErrorKind::Remote:      return "remote";
        case ErrorKind::Interrupted: return "interrupted";
        default:                     return "internal";
    }
}

Error log_and_return(Error&& err) {
    auto level = err.is_fatal() ? spdlog::level::err : spdlog::level::warn;
    spdlog::log(level,
        "[{}:{} in {}] {} error: {}",
        err.file, err.line, err.function,
        to_string(err.kind()), err.message
    );
    return std::move(err);
}

} // namespace vaultup::infra
