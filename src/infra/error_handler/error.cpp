#include "error.hpp"
#include <fmt/core.h>
#include <cerrno>

namespace mtcopy::infra {

std::string_view to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NotFound:         return "not found";
        case ErrorCode::NotADirectory:    return "not a directory";
        case ErrorCode::PermissionDenied: return "permission denied";
        case ErrorCode::InvalidArgument:  return "invalid argument";
        case ErrorCode::AlreadyExists:    return "already exists";
        case ErrorCode::DiskFull:         return "disk full";
        case ErrorCode::Busy:             return "resource busy";
        case ErrorCode::IOError:          return "I/O error";
        case ErrorCode::ChecksumMismatch: return "checksum mismatch";
        case ErrorCode::Interrupted:      return "interrupted";
        case ErrorCode::Unknown:          break;
    }
    return "unknown error";
}

bool Error::is_fatal() const {
    switch (code) {
        case ErrorCode::NotFound:
        case ErrorCode::NotADirectory:
        case ErrorCode::InvalidArgument:
            return true;
        default:
            return false;
    }
}

int Error::to_exit_code() const {
    if (code == ErrorCode::Interrupted) return kExitInterrupted; // SIGINT
    // Ошибка, дошедшая до уровня процесса, всегда ошибка настройки
    return kExitSetupError;
}

const char* Error::what() const {
    return message.c_str();
}

Error make_error(ErrorCode code, std::string_view message,
                 const std::source_location& loc) {
    return Error{code, std::string(message), loc};
}

ErrorCode from_error_code(const std::error_code& ec) {
    if (!ec) return ErrorCode::Unknown;
    if (ec.category() != std::system_category() && ec.category() != std::generic_category()) {
        return ErrorCode::IOError;
    }

    switch (ec.value()) {
        case ENOENT:
            return ErrorCode::NotFound;
        case ENOTDIR:
            return ErrorCode::NotADirectory;
        case EACCES:
        case EPERM:
        case EROFS:
            return ErrorCode::PermissionDenied;
        case EEXIST:
            return ErrorCode::AlreadyExists;
        case ENOSPC:
        case EDQUOT:
            return ErrorCode::DiskFull;
        case EBUSY:
        case EAGAIN:
        case ETXTBSY:
        case EINTR:
            return ErrorCode::Busy;
        case EINVAL:
        case ENAMETOOLONG:
            return ErrorCode::InvalidArgument;
        default:
            return ErrorCode::IOError;
    }
}

Error make_system_error(const std::error_code& ec, std::string_view context,
                        const std::source_location& loc) {
    return Error{from_error_code(ec), fmt::format("{}: {}", context, ec.message()), loc};
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

} // namespace mtcopy::infra
