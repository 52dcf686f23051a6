#include "oplog.hpp"

#include "log.hpp"

#include <ctime>
#include <sstream>
#include <system_error>

namespace xfer {

namespace fs = std::filesystem;

namespace {

std::string timestamp() {
    const std::time_t now = std::time(nullptr);
    std::tm local{};
    ::localtime_r(&now, &local);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &local);
    return buffer;
}

} // namespace

OperationLog::OperationLog(const fs::path& file) : file_(file) {
    if (file_.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(file_.parent_path(), ec);
    }
    out_.open(file_, std::ios::out | std::ios::app);
    if (!out_) {
        throw TransferError(ErrorKind::IOError, file_, "Cannot open operation log");
    }
}

void OperationLog::record_copy(const CopyTask& task, const CopyOutcome& outcome) {
    std::ostringstream line;
    switch (outcome.mode) {
    case CopyMode::Fresh:
        line << "COPIED ";
        break;
    case CopyMode::Resumed:
        line << "RESUMED ";
        break;
    case CopyMode::AlreadyPresent:
        line << "SKIPPED ";
        break;
    }
    line << task.source_path.string() << " -> " << task.destination_path.string() << " ("
         << outcome.bytes_written << " bytes";
    if (outcome.mode == CopyMode::Resumed) {
        line << " from offset " << outcome.resumed_from;
    }
    line << ")";
    append(line.str());
}

void OperationLog::record_error(const CopyTask& task, ErrorKind kind, const std::string& message) {
    append(std::string("ERROR ") + to_string(kind) + " " + task.source_path.string() + ": " + message);
}

void OperationLog::record_verified(const CopyTask& task) {
    append("VERIFIED " + task.source_path.string() + " == " + task.destination_path.string());
}

void OperationLog::record_done(std::size_t files_copied, std::uintmax_t bytes_copied, std::size_t errors,
                               bool cancelled) {
    std::ostringstream line;
    line << "DONE files=" << files_copied << " bytes=" << bytes_copied << " errors=" << errors
         << " cancelled=" << (cancelled ? "true" : "false");
    append(line.str());
}

void OperationLog::append(const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << "[" << timestamp() << "] " << line << '\n';
    out_.flush();
    if (!out_ && !write_failed_) {
        write_failed_ = true;
        log_warning("failed to append to operation log " + file_.string());
    }
}

} // namespace xfer
