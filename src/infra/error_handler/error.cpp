#include "error.hpp"
#include <cerrno>
#include <fmt/core.h>

namespace dircopy::infra {

namespace {

auto code_from_errno(int err) -> ErrorCode {
    switch (err) {
        case ENOENT:     return ErrorCode::FileNotFound;
        case EACCES:
        case EPERM:
        case EROFS:      return ErrorCode::PermissionDenied;
        case ENOTDIR:    return ErrorCode::NotADirectory;
        case ENAMETOOLONG:
        case ELOOP:      return ErrorCode::InvalidPath;
        case ENOSPC:
        case EDQUOT:     return ErrorCode::DiskFull;
        case EINVAL:
        case ENOSYS:
        case EOPNOTSUPP: return ErrorCode::UnsupportedFeature;
        default:         return ErrorCode::IoFailure;
    }
}

} // namespace

bool Error::is_fatal() const {
    switch (code) {
        case ErrorCode::FileNotFound:
        case ErrorCode::PermissionDenied:
        case ErrorCode::NotADirectory:
        case ErrorCode::InvalidPath:
        case ErrorCode::DiskFull:
            return true;
        default:
            return false;
    }
}

const char* Error::what() const {
    return message.c_str();
}

Error make_error(ErrorCode code, std::string_view message,
                 const std::source_location& loc) {
    return Error{code, std::string(message), loc};
}

Error from_error_code(const std::error_code& ec, std::string_view context,
                      const std::source_location& loc) {
    const auto code = ec.category() == std::generic_category() ||
                              ec.category() == std::system_category()
                          ? code_from_errno(ec.value())
                          : ErrorCode::Unknown;
    return Error{code, fmt::format("{}: {}", context, ec.message()), loc};
}

Error from_errno(std::string_view context, const std::source_location& loc) {
    return from_error_code(std::error_code(errno, std::generic_category()), context, loc);
}

std::string_view error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::FileNotFound:       return "FileNotFound";
        case ErrorCode::PermissionDenied:   return "PermissionDenied";
        case ErrorCode::NotADirectory:      return "NotADirectory";
        case ErrorCode::InvalidPath:        return "InvalidPath";
        case ErrorCode::UnsupportedFeature: return "UnsupportedFeature";
        case ErrorCode::DiskFull:           return "DiskFull";
        case ErrorCode::IoFailure:          return "IoFailure";
        case ErrorCode::Unknown:            break;
    }
    return "Unknown";
}

} // namespace dircopy::infra
