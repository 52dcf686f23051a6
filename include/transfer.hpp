#pragma once

#include "cancel.hpp"
#include "errors.hpp"
#include "io.hpp"
#include "plan.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace xfer {

class OperationLog;

struct TransferOptions {
    bool verify{false};
    // 0 selects default_concurrency().
    std::size_t concurrency{0};
    std::size_t chunk_size{kDefaultChunkSize};
};

// Twice the hardware thread count, clamped to [2, 8].
std::size_t default_concurrency();

struct TaskError {
    std::size_t task_index{0};
    CopyTask task;
    ErrorKind kind{ErrorKind::IOError};
    std::string message;
};

struct ProgressEvent {
    std::size_t task_index{0};
    std::size_t files_done{0};
    std::size_t total_files{0};
    std::uintmax_t bytes_done{0};
    std::uintmax_t total_bytes{0};
    std::filesystem::path current_file;
    double bytes_per_second{0.0};
    double file_percent{0.0};
};

struct TransferResult {
    std::size_t total_files{0};
    std::size_t files_copied{0};
    std::size_t files_resumed{0};
    std::size_t files_already_present{0};
    std::uintmax_t bytes_copied{0};
    std::vector<TaskError> errors;
    bool cancelled{false};
    std::chrono::duration<double> elapsed{};

    bool ok() const { return !cancelled && errors.empty(); }
};

// Implemented by the caller. Callbacks arrive on worker threads but never
// concurrently with each other, and bytes_done never decreases between two
// on_progress calls of one transfer.
class ProgressReporter {
public:
    virtual ~ProgressReporter() = default;

    virtual void on_start(std::size_t /*total_files*/, std::uintmax_t /*total_bytes*/) {}
    virtual void on_progress(const ProgressEvent& event) = 0;
    virtual void on_complete(const TransferResult& /*result*/) {}
};

class TransferCoordinator {
public:
    explicit TransferCoordinator(TransferOptions options = {}, ProgressReporter* reporter = nullptr,
                                 OperationLog* log = nullptr);

    // Attempts every task once. Task failures are collected in the result;
    // only cancellation stops remaining tasks from being dispatched.
    TransferResult execute(const CopyPlan& plan, const CancellationToken& cancel);
    TransferResult execute(const CopyPlan& plan);

private:
    struct TransferState;

    TransferOptions options_;
    ProgressReporter* reporter_;
    OperationLog* log_;

    void prepare_directories(const CopyPlan& plan) const;
    void run_task(std::size_t index, const CopyTask& task, TransferState& state, const CancellationToken& cancel);
    bool verify_task(std::size_t index, const CopyTask& task, TransferState& state,
                     const CancellationToken& cancel);
    void record_error(TransferState& state, std::size_t index, const CopyTask& task, ErrorKind kind,
                      const std::string& message);
    void emit_progress(TransferState& state, std::size_t index, const CopyTask& task, double file_percent);
};

TransferResult run_transfer(const CopyPlan& plan, const TransferOptions& options, ProgressReporter* reporter,
                            const CancellationToken& cancel);

// A plan holding exactly the tasks that failed in `result`, in plan order.
CopyPlan build_retry_plan(const CopyPlan& plan, const TransferResult& result);

// Folds the result of running a retry plan into the result of the run it
// retried. Counters add up; errors and cancellation are the retry's, since
// those tasks are the only ones still outstanding.
void merge_retry(TransferResult& overall, const TransferResult& retry);

} // namespace xfer
