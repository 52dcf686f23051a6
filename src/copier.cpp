#include "copier.hpp"

#include "errors.hpp"

#include <algorithm>
#include <cerrno>
#include <system_error>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>

namespace xfer {

namespace fs = std::filesystem;

namespace {

void ensure_parent_directory(const fs::path& destination) {
    const fs::path parent = destination.parent_path();
    if (parent.empty()) {
        return;
    }
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) {
        throw TransferError(classify(ec), parent, "Failed to create destination directory: " + ec.message(), ec);
    }
}

} // namespace

double completion_percent(std::uintmax_t offset, std::uintmax_t total) {
    if (total == 0) {
        return 100.0;
    }
    const double percent = static_cast<double>(offset) / static_cast<double>(total) * 100.0;
    return std::clamp(percent, 0.0, 100.0);
}

ResumableCopier::ResumableCopier(std::size_t chunk_size, const CancellationToken* cancel)
    : chunk_size_(chunk_size == 0 ? kDefaultChunkSize : chunk_size), cancel_(cancel) {}

CopyOutcome ResumableCopier::copy(const CopyTask& task, const ChunkCallback& on_chunk) const {
    CopyOutcome outcome{};

    FileDescriptor source = FileDescriptor::open(task.source_path, O_RDONLY);
    outcome.source_size = source.size(task.source_path);

    struct stat dest_st {};
    bool destination_exists = false;
    if (::stat(task.destination_path.c_str(), &dest_st) == 0) {
        if (!S_ISREG(dest_st.st_mode)) {
            throw TransferError(ErrorKind::IOError, task.destination_path, "Destination exists but is not a regular file");
        }
        destination_exists = true;
    } else if (errno != ENOENT) {
        throw_errno(task.destination_path, "stat failed", errno);
    }

    const std::uintmax_t existing = destination_exists ? static_cast<std::uintmax_t>(dest_st.st_size) : 0;
    if (destination_exists && existing >= outcome.source_size) {
        outcome.mode = CopyMode::AlreadyPresent;
        outcome.resumed_from = existing;
        if (on_chunk) {
            on_chunk(0, existing, 100.0);
        }
        return outcome;
    }

    ensure_parent_directory(task.destination_path);

    int flags = O_WRONLY;
    if (destination_exists) {
        outcome.mode = CopyMode::Resumed;
        outcome.resumed_from = existing;
    } else {
        flags |= O_CREAT | O_TRUNC;
    }
    FileDescriptor destination = FileDescriptor::open(task.destination_path, flags);

    std::vector<char> buffer(chunk_size_);
    std::uintmax_t offset = existing;
    while (true) {
        const std::size_t n = read_at(source, buffer.data(), buffer.size(), offset, task.source_path);
        if (n == 0) {
            break;
        }
        write_all_at(destination, buffer.data(), n, offset, task.destination_path);
        offset += n;
        outcome.bytes_written += n;

        if (on_chunk) {
            on_chunk(n, offset, completion_percent(offset, outcome.source_size));
        }
        if (cancel_ != nullptr && cancel_->cancelled() && offset < outcome.source_size) {
            outcome.completed = false;
            break;
        }
    }

    destination.close(task.destination_path);

    if (outcome.completed && outcome.bytes_written == 0 && on_chunk) {
        on_chunk(0, offset, 100.0);
    }
    return outcome;
}

} // namespace xfer
