#include "errors.hpp"

#include <cerrno>
#include <cstring>
#include <utility>

namespace xfer {

namespace {

std::string compose(const std::string& message, const std::filesystem::path& path) {
    if (path.empty()) {
        return message;
    }
    return message + ": " + path.string();
}

} // namespace

const char* to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::NotFound:
        return "NotFound";
    case ErrorKind::PermissionDenied:
        return "PermissionDenied";
    case ErrorKind::IOError:
        return "IOError";
    case ErrorKind::VerificationError:
        return "VerificationError";
    case ErrorKind::Cancelled:
        return "Cancelled";
    }
    return "Unknown";
}

ErrorKind classify_errno(int err) {
    switch (err) {
    case ENOENT:
    case ENOTDIR:
        return ErrorKind::NotFound;
    case EACCES:
    case EPERM:
        return ErrorKind::PermissionDenied;
    default:
        return ErrorKind::IOError;
    }
}

ErrorKind classify(const std::error_code& ec) {
    if (ec.category() == std::generic_category() || ec.category() == std::system_category()) {
        return classify_errno(ec.value());
    }
    return ErrorKind::IOError;
}

TransferError::TransferError(ErrorKind kind, std::filesystem::path path, const std::string& message,
                             std::error_code cause)
    : std::runtime_error(compose(message, path)), kind_(kind), path_(std::move(path)), cause_(cause) {}

void throw_errno(const std::filesystem::path& path, const std::string& what, int err) {
    throw TransferError(classify_errno(err), path, what + " (" + std::strerror(err) + ")",
                        std::error_code(err, std::generic_category()));
}

} // namespace xfer
