#include "transfer.hpp"

#include "copier.hpp"
#include "fingerprint.hpp"
#include "log.hpp"
#include "oplog.hpp"

#include <algorithm>
#include <atomic>
#include <mutex>
#include <set>
#include <system_error>
#include <thread>
#include <utility>

namespace xfer {

namespace fs = std::filesystem;
using Clock = std::chrono::steady_clock;

struct TransferCoordinator::TransferState {
    std::atomic<std::size_t> next_task{0};
    std::atomic<std::size_t> tasks_finished{0};
    std::atomic<std::size_t> files_completed{0};
    std::atomic<std::size_t> files_resumed{0};
    std::atomic<std::size_t> files_already_present{0};
    // Progress bytes: each task contributes at most its planned size.
    std::atomic<std::uintmax_t> bytes_completed{0};
    std::atomic<std::uintmax_t> bytes_written{0};

    std::mutex errors_mutex;
    std::vector<TaskError> errors;

    std::mutex progress_mutex;
    std::size_t total_files{0};
    std::uintmax_t total_bytes{0};
    Clock::time_point started{Clock::now()};
};

std::size_t default_concurrency() {
    const std::size_t hardware = std::thread::hardware_concurrency();
    return std::clamp<std::size_t>(hardware * 2, 2, 8);
}

TransferCoordinator::TransferCoordinator(TransferOptions options, ProgressReporter* reporter, OperationLog* log)
    : options_(options), reporter_(reporter), log_(log) {}

TransferResult TransferCoordinator::execute(const CopyPlan& plan) {
    const CancellationToken never_cancelled;
    return execute(plan, never_cancelled);
}

TransferResult TransferCoordinator::execute(const CopyPlan& plan, const CancellationToken& cancel) {
    TransferState state;
    state.total_files = plan.tasks.size();
    state.total_bytes = plan.total_bytes;

    if (reporter_ != nullptr) {
        reporter_->on_start(plan.tasks.size(), plan.total_bytes);
    }

    prepare_directories(plan);

    const std::size_t requested = options_.concurrency == 0 ? default_concurrency() : options_.concurrency;
    const std::size_t worker_count = std::max<std::size_t>(1, std::min(requested, plan.tasks.size()));

    auto worker = [&]() {
        while (!cancel.cancelled()) {
            const std::size_t index = state.next_task.fetch_add(1);
            if (index >= plan.tasks.size()) {
                break;
            }
            run_task(index, plan.tasks[index], state, cancel);
        }
    };

    std::vector<std::thread> pool;
    pool.reserve(worker_count);
    for (std::size_t i = 0; i < worker_count; ++i) {
        try {
            pool.emplace_back(worker);
        } catch (const std::system_error& ex) {
            if (pool.empty()) {
                throw;
            }
            log_warning("started only " + std::to_string(pool.size()) + " of " + std::to_string(worker_count) +
                        " workers: " + ex.what());
            break;
        }
    }
    for (auto& thread : pool) {
        thread.join();
    }

    TransferResult result;
    result.total_files = plan.tasks.size();
    result.files_copied = state.files_completed.load();
    result.files_resumed = state.files_resumed.load();
    result.files_already_present = state.files_already_present.load();
    result.bytes_copied = state.bytes_written.load();
    result.errors = std::move(state.errors);
    std::sort(result.errors.begin(), result.errors.end(),
              [](const TaskError& lhs, const TaskError& rhs) { return lhs.task_index < rhs.task_index; });
    result.cancelled = cancel.cancelled() && state.tasks_finished.load() < plan.tasks.size();
    result.elapsed = Clock::now() - state.started;

    if (log_ != nullptr) {
        log_->record_done(result.files_copied, result.bytes_copied, result.errors.size(), result.cancelled);
    }
    if (reporter_ != nullptr) {
        reporter_->on_complete(result);
    }
    return result;
}

void TransferCoordinator::prepare_directories(const CopyPlan& plan) const {
    std::set<fs::path> parents;
    for (const auto& task : plan.tasks) {
        const fs::path parent = task.destination_path.parent_path();
        if (!parent.empty()) {
            parents.insert(parent);
        }
    }

    for (const auto& parent : parents) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            // The affected tasks report the failure when they try to open their destination.
            log_warning("failed to create directory " + parent.string() + ": " + ec.message());
        }
    }
}

void TransferCoordinator::run_task(std::size_t index, const CopyTask& task, TransferState& state,
                                   const CancellationToken& cancel) {
    std::uintmax_t accounted = 0;
    auto account = [&](std::uintmax_t present) {
        const std::uintmax_t target = std::min(present, task.expected_size);
        if (target > accounted) {
            state.bytes_completed.fetch_add(target - accounted);
            accounted = target;
        }
    };

    try {
        const ResumableCopier copier(options_.chunk_size, &cancel);
        const CopyOutcome outcome =
            copier.copy(task, [&](std::uintmax_t chunk_bytes, std::uintmax_t offset, double percent) {
                state.bytes_written.fetch_add(chunk_bytes);
                account(offset);
                emit_progress(state, index, task, percent);
            });

        if (!outcome.completed) {
            log_info("Cancelled after " + std::to_string(outcome.resumed_from + outcome.bytes_written) + " bytes: " +
                     task.destination_path.string());
            return;
        }

        if (log_ != nullptr) {
            log_->record_copy(task, outcome);
        }

        if (options_.verify && !verify_task(index, task, state, cancel)) {
            return;
        }

        account(task.expected_size);
        if (outcome.mode == CopyMode::Resumed) {
            state.files_resumed.fetch_add(1);
        } else if (outcome.mode == CopyMode::AlreadyPresent) {
            state.files_already_present.fetch_add(1);
        }
        state.files_completed.fetch_add(1);
        state.tasks_finished.fetch_add(1);

        switch (outcome.mode) {
        case CopyMode::Fresh:
            log_info("Copied file: " + task.source_path.string() + " -> " + task.destination_path.string() + " (" +
                     std::to_string(outcome.bytes_written) + " bytes)");
            break;
        case CopyMode::Resumed:
            log_info("Resumed file at offset " + std::to_string(outcome.resumed_from) + ": " +
                     task.source_path.string() + " -> " + task.destination_path.string() + " (" +
                     std::to_string(outcome.bytes_written) + " bytes)");
            break;
        case CopyMode::AlreadyPresent:
            log_info("Already transferred: " + task.destination_path.string());
            break;
        }
        emit_progress(state, index, task, 100.0);
    } catch (const TransferError& ex) {
        if (ex.kind() == ErrorKind::Cancelled) {
            return;
        }
        record_error(state, index, task, ex.kind(), ex.what());
    } catch (const std::exception& ex) {
        record_error(state, index, task, ErrorKind::IOError, ex.what());
    }
}

bool TransferCoordinator::verify_task(std::size_t index, const CopyTask& task, TransferState& state,
                                      const CancellationToken& cancel) {
    const ContentHasher hasher(options_.chunk_size, &cancel);
    const Fingerprint source = hasher.fingerprint(task.source_path);
    const Fingerprint destination = hasher.fingerprint(task.destination_path);
    if (source != destination) {
        record_error(state, index, task, ErrorKind::VerificationError,
                     "Fingerprint mismatch: " + source.to_hex() + " != " + destination.to_hex());
        return false;
    }
    if (log_ != nullptr) {
        log_->record_verified(task);
    }
    return true;
}

void TransferCoordinator::record_error(TransferState& state, std::size_t index, const CopyTask& task, ErrorKind kind,
                                       const std::string& message) {
    log_error(std::string(to_string(kind)) + " while copying " + task.source_path.string() + " to " +
              task.destination_path.string() + ": " + message);
    if (log_ != nullptr) {
        log_->record_error(task, kind, message);
    }
    {
        std::lock_guard<std::mutex> lock(state.errors_mutex);
        state.errors.push_back(TaskError{index, task, kind, message});
    }
    state.tasks_finished.fetch_add(1);
    emit_progress(state, index, task, 100.0);
}

void TransferCoordinator::emit_progress(TransferState& state, std::size_t index, const CopyTask& task,
                                        double file_percent) {
    if (reporter_ == nullptr) {
        return;
    }

    // Counters are sampled under the lock, so successive events never go backwards.
    std::lock_guard<std::mutex> lock(state.progress_mutex);
    ProgressEvent event;
    event.task_index = index;
    event.files_done = state.tasks_finished.load();
    event.total_files = state.total_files;
    event.bytes_done = state.bytes_completed.load();
    event.total_bytes = state.total_bytes;
    event.current_file = task.source_path;
    event.file_percent = file_percent;
    const double seconds = std::chrono::duration<double>(Clock::now() - state.started).count();
    if (seconds > 0.0) {
        event.bytes_per_second = static_cast<double>(state.bytes_written.load()) / seconds;
    }
    reporter_->on_progress(event);
}

TransferResult run_transfer(const CopyPlan& plan, const TransferOptions& options, ProgressReporter* reporter,
                            const CancellationToken& cancel) {
    TransferCoordinator coordinator(options, reporter);
    return coordinator.execute(plan, cancel);
}

CopyPlan build_retry_plan(const CopyPlan& plan, const TransferResult& result) {
    std::vector<CopyTask> tasks;
    tasks.reserve(result.errors.size());
    std::set<std::size_t> seen;
    for (const auto& error : result.errors) {
        if (seen.insert(error.task_index).second) {
            tasks.push_back(error.task);
        }
    }
    return CopyPlan::from_tasks(plan.destination_root, std::move(tasks));
}

void merge_retry(TransferResult& overall, const TransferResult& retry) {
    overall.files_copied += retry.files_copied;
    overall.files_resumed += retry.files_resumed;
    overall.files_already_present += retry.files_already_present;
    overall.bytes_copied += retry.bytes_copied;
    overall.errors = retry.errors;
    overall.cancelled = retry.cancelled;
    overall.elapsed += retry.elapsed;
}

} // namespace xfer
