#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>

namespace xfer {

enum class ErrorKind {
    NotFound,
    PermissionDenied,
    IOError,
    VerificationError,
    Cancelled,
};

const char* to_string(ErrorKind kind);

ErrorKind classify_errno(int err);
ErrorKind classify(const std::error_code& ec);

class TransferError : public std::runtime_error {
public:
    TransferError(ErrorKind kind, std::filesystem::path path, const std::string& message,
                  std::error_code cause = {});

    ErrorKind kind() const noexcept { return kind_; }
    const std::filesystem::path& path() const noexcept { return path_; }
    const std::error_code& cause() const noexcept { return cause_; }

private:
    ErrorKind kind_;
    std::filesystem::path path_;
    std::error_code cause_;
};

// Throws a TransferError built from errno for an operation on `path`.
[[noreturn]] void throw_errno(const std::filesystem::path& path, const std::string& what, int err);

} // namespace xfer
