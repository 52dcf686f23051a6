#include "io.hpp"

#include "errors.hpp"

#include <cerrno>
#include <utility>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace xfer {

namespace fs = std::filesystem;

FileDescriptor::~FileDescriptor() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

FileDescriptor::FileDescriptor(FileDescriptor&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}

FileDescriptor& FileDescriptor::operator=(FileDescriptor&& other) noexcept {
    if (this != &other) {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
}

FileDescriptor FileDescriptor::open(const fs::path& path, int flags, mode_t mode) {
    int fd = -1;
    do {
        fd = ::open(path.c_str(), flags | O_CLOEXEC, mode);
    } while (fd < 0 && errno == EINTR);
    if (fd < 0) {
        throw_errno(path, "open failed", errno);
    }
    return FileDescriptor(fd);
}

std::uintmax_t FileDescriptor::size(const fs::path& path) const {
    struct stat st {};
    if (::fstat(fd_, &st) != 0) {
        throw_errno(path, "fstat failed", errno);
    }
    return static_cast<std::uintmax_t>(st.st_size);
}

void FileDescriptor::close(const fs::path& path) {
    const int fd = std::exchange(fd_, -1);
    if (fd >= 0 && ::close(fd) != 0 && errno != EINTR) {
        throw_errno(path, "close failed", errno);
    }
}

std::size_t read_at(const FileDescriptor& file, void* buffer, std::size_t length, std::uintmax_t offset,
                    const fs::path& path) {
    auto* out = static_cast<char*>(buffer);
    std::size_t total = 0;
    while (total < length) {
        const ssize_t n = ::pread(file.get(), out + total, length - total, static_cast<off_t>(offset + total));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw_errno(path, "read failed", errno);
        }
        if (n == 0) {
            break;
        }
        total += static_cast<std::size_t>(n);
    }
    return total;
}

void write_all_at(const FileDescriptor& file, const void* buffer, std::size_t length, std::uintmax_t offset,
                  const fs::path& path) {
    const auto* in = static_cast<const char*>(buffer);
    std::size_t total = 0;
    while (total < length) {
        const ssize_t n = ::pwrite(file.get(), in + total, length - total, static_cast<off_t>(offset + total));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw_errno(path, "write failed", errno);
        }
        total += static_cast<std::size_t>(n);
    }
}

} // namespace xfer
