#include "report.hpp"

#include "log.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

namespace xfer {

namespace {

int whole_percent(std::uintmax_t done, std::uintmax_t total) {
    if (total == 0) {
        return 100;
    }
    return static_cast<int>(done * 100 / total);
}

void print_duration(const std::string& label, const std::chrono::duration<double>& d) {
    std::cout << "  " << std::setw(20) << std::left << (label + ":") << std::fixed << std::setprecision(3)
              << d.count() << " s" << std::endl;
}

} // namespace

std::string format_bytes(std::uintmax_t bytes) {
    static const char* const units[] = {"B", "KB", "MB", "GB", "TB"};
    double value = static_cast<double>(bytes);
    std::size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < sizeof(units) / sizeof(units[0])) {
        value /= 1024.0;
        ++unit;
    }
    std::ostringstream os;
    if (unit == 0) {
        os << bytes << " B";
    } else {
        os << std::fixed << std::setprecision(2) << value << " " << units[unit];
    }
    return os.str();
}

void print_plan_summary(const CopyPlan& plan) {
    std::cout << "    Planned " << plan.total_files << " files (" << format_bytes(plan.total_bytes) << ") into "
              << plan.destination_root << std::endl;
    if (plan.conflicts_skipped > 0) {
        std::cout << "    Skipped " << plan.conflicts_skipped << " files with conflicting destinations" << std::endl;
    }
    if (plan.cycles_skipped > 0) {
        std::cout << "    Skipped " << plan.cycles_skipped << " already visited directories" << std::endl;
    }
}

void print_report(const TransferResult& result) {
    std::cout << "\n=== Transfer Summary ===" << std::endl;
    std::cout << "  Files planned:        " << result.total_files << std::endl;
    std::cout << "  Files completed:      " << result.files_copied << std::endl;
    std::cout << "  Files resumed:        " << result.files_resumed << std::endl;
    std::cout << "  Already transferred:  " << result.files_already_present << std::endl;
    std::cout << "  Bytes written:        " << result.bytes_copied << " (" << format_bytes(result.bytes_copied) << ")"
              << std::endl;
    std::cout << "  Errors:               " << result.errors.size() << std::endl;
    std::cout << "  Cancelled:            " << (result.cancelled ? "yes" : "no") << std::endl;
    print_duration("Total elapsed", result.elapsed);

    const double total_seconds = result.elapsed.count();
    if (total_seconds > 0.0) {
        const double mb = static_cast<double>(result.bytes_copied) / (1024.0 * 1024.0);
        std::cout << "  Effective throughput: " << std::fixed << std::setprecision(3) << mb / total_seconds
                  << " MiB/s" << std::endl;
    } else {
        std::cout << "  Effective throughput: n/a" << std::endl;
    }

    if (!result.errors.empty()) {
        std::cout << "\n=== Failed Transfers ===" << std::endl;
        for (const auto& error : result.errors) {
            std::cout << "  [" << to_string(error.kind) << "] " << error.task.source_path.string() << "\n"
                      << "    " << error.message << std::endl;
        }
    }
}

void print_duplicates(const FingerprintIndex& index) {
    if (index.empty()) {
        std::cout << "\nNo duplicate files were found." << std::endl;
    } else {
        std::cout << "\n=== Duplicate Groups ===" << std::endl;
        for (const auto& group : index.groups()) {
            std::cout << "  md5 " << group.fingerprint.to_hex() << "  " << group.paths.size() << " x "
                      << format_bytes(group.file_size) << "\n"
                      << "    original:  " << group.original().string() << "\n";
            for (const auto& path : group.duplicates()) {
                std::cout << "    duplicate: " << path.string() << "\n";
            }
        }
        std::cout << "  Groups:            " << index.size() << "\n"
                  << "  Redundant files:   " << index.redundant_paths().size() << "\n"
                  << "  Reclaimable bytes: " << format_bytes(index.reclaimable_bytes()) << std::endl;
    }

    if (!index.unscannable().empty()) {
        std::cout << "\n=== Unscannable Files ===" << std::endl;
        for (const auto& file : index.unscannable()) {
            std::cout << "  " << file.path.string() << ": " << file.reason << "\n";
        }
        std::cout << std::flush;
    }
}

ConsoleProgressReporter::ConsoleProgressReporter(std::ostream& out) : out_(out) {}

void ConsoleProgressReporter::on_start(std::size_t total_files, std::uintmax_t total_bytes) {
    last_percent_ = -1;
    write_line(out_, "    Transferring " + std::to_string(total_files) + " files (" + format_bytes(total_bytes) + ")");
}

void ConsoleProgressReporter::on_progress(const ProgressEvent& event) {
    const int percent = whole_percent(event.bytes_done, event.total_bytes);
    if (percent == last_percent_) {
        return;
    }
    last_percent_ = percent;
    std::ostringstream line;
    line << "    [" << std::setw(3) << std::right << percent << "%] " << event.files_done << "/" << event.total_files
         << " files, " << format_bytes(event.bytes_done) << " of " << format_bytes(event.total_bytes) << ", "
         << format_bytes(static_cast<std::uintmax_t>(event.bytes_per_second)) << "/s  "
         << event.current_file.filename().string();
    write_line(out_, line.str());
}

void ConsoleProgressReporter::on_complete(const TransferResult& result) {
    if (result.cancelled) {
        write_line(out_, "    Transfer cancelled");
    } else if (result.errors.empty()) {
        write_line(out_, "    Transfer complete");
    } else {
        write_line(out_, "    Transfer finished with " + std::to_string(result.errors.size()) + " errors");
    }
}

ConsoleScanReporter::ConsoleScanReporter(std::ostream& out) : out_(out) {}

void ConsoleScanReporter::on_scan_progress(const ScanProgressEvent& event) {
    const int percent = whole_percent(event.files_hashed, event.files_to_hash);
    if (percent == last_percent_) {
        return;
    }
    last_percent_ = percent;
    std::ostringstream line;
    line << "    [" << std::setw(3) << std::right << percent << "%] hashed " << event.files_hashed << "/"
         << event.files_to_hash << " candidates (" << format_bytes(event.bytes_hashed) << ")";
    write_line(out_, line.str());
}

} // namespace xfer
