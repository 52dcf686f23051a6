#pragma once

#include "copier.hpp"
#include "errors.hpp"
#include "plan.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>

namespace xfer {

// Append-only, timestamped record of what a transfer did, one line per event.
class OperationLog {
public:
    explicit OperationLog(const std::filesystem::path& file);

    void record_copy(const CopyTask& task, const CopyOutcome& outcome);
    void record_error(const CopyTask& task, ErrorKind kind, const std::string& message);
    void record_verified(const CopyTask& task);
    void record_done(std::size_t files_copied, std::uintmax_t bytes_copied, std::size_t errors, bool cancelled);

    const std::filesystem::path& file() const noexcept { return file_; }

private:
    std::filesystem::path file_;
    std::ofstream out_;
    std::mutex mutex_;
    bool write_failed_{false};

    void append(const std::string& line);
};

} // namespace xfer
