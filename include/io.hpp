#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>

#include <sys/types.h>

namespace xfer {

inline constexpr std::size_t kDefaultChunkSize = 1024 * 1024;

// Owning wrapper around a POSIX file descriptor.
class FileDescriptor {
public:
    FileDescriptor() = default;
    explicit FileDescriptor(int fd) : fd_(fd) {}
    ~FileDescriptor();

    FileDescriptor(FileDescriptor&& other) noexcept;
    FileDescriptor& operator=(FileDescriptor&& other) noexcept;
    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    // Throws TransferError classified from errno.
    static FileDescriptor open(const std::filesystem::path& path, int flags, mode_t mode = 0644);

    int get() const noexcept { return fd_; }
    bool valid() const noexcept { return fd_ >= 0; }

    std::uintmax_t size(const std::filesystem::path& path) const;

    // Closes explicitly so that a failing close(2) on a written file is
    // reported instead of lost in the destructor.
    void close(const std::filesystem::path& path);

private:
    int fd_{-1};
};

// Returns the number of bytes read, 0 at end of file.
std::size_t read_at(const FileDescriptor& file, void* buffer, std::size_t length, std::uintmax_t offset,
                    const std::filesystem::path& path);

void write_all_at(const FileDescriptor& file, const void* buffer, std::size_t length, std::uintmax_t offset,
                  const std::filesystem::path& path);

} // namespace xfer
