#include "error.hpp"
#include <cerrno>
#include <cstring>
#include <fmt/core.h>

namespace rescuecp::infra {

bool Error::is_precondition() const {
    switch (code) {
        case ErrorCode::DestinationExists:
        case ErrorCode::LedgerMissing:
        case ErrorCode::SizeMismatch:
        case ErrorCode::BlockSizeMismatch:
        case ErrorCode::UnsupportedRange:
        case ErrorCode::InvalidArgument:
        case ErrorCode::FileNotFound:
        case ErrorCode::PermissionDenied:
        case ErrorCode::ConfigError:
        case ErrorCode::LedgerCorrupt:
            return true;
        default:
            return false;
    }
}

bool Error::is_fatal() const {
    return !is_transient();
}

int Error::to_exit_code() const {
    switch (code) {
        case ErrorCode::DestinationExists: return exit_code::DestinationExists;
        case ErrorCode::LedgerMissing:     return exit_code::LedgerMissing;
        default:
            break;
    }
    if (is_precondition()) return exit_code::Precondition;
    return exit_code::IoFailure;
}

const char* Error::what() const {
    return message.c_str();
}

std::string_view to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::DestinationExists:  return "DestinationExists";
        case ErrorCode::LedgerMissing:      return "LedgerMissing";
        case ErrorCode::SizeMismatch:       return "SizeMismatch";
        case ErrorCode::BlockSizeMismatch:  return "BlockSizeMismatch";
        case ErrorCode::UnsupportedRange:   return "UnsupportedRange";
        case ErrorCode::InvalidArgument:    return "InvalidArgument";
        case ErrorCode::FileNotFound:       return "FileNotFound";
        case ErrorCode::PermissionDenied:   return "PermissionDenied";
        case ErrorCode::ConfigError:        return "ConfigError";
        case ErrorCode::LedgerCorrupt:      return "LedgerCorrupt";
        case ErrorCode::MediaError:         return "MediaError";
        case ErrorCode::StreamFailure:      return "StreamFailure";
        case ErrorCode::PartialReadFailure: return "PartialReadFailure";
        case ErrorCode::Unknown:            return "Unknown";
    }
    return "Unknown";
}

Error make_error(ErrorCode code, std::string_view message,
                 const std::source_location& loc) {
    return Error{code, std::string(message), loc};
}

Error make_errno_error(int err, std::string_view context,
                       const std::source_location& loc) {
    ErrorCode code = ErrorCode::StreamFailure;
    switch (err) {
        case EIO:
#ifdef EREMOTEIO
        case EREMOTEIO:
#endif
#ifdef ENODATA
        case ENODATA:
#endif
            code = ErrorCode::MediaError;
            break;
        case ENOENT:
            code = ErrorCode::FileNotFound;
            break;
        case EACCES:
        case EPERM:
            code = ErrorCode::PermissionDenied;
            break;
        default:
            break;
    }
    return Error{code, fmt::format("{}: {}", context, std::strerror(err)), loc};
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

} // namespace rescuecp::infra
