#pragma once

#include "duplicates.hpp"
#include "plan.hpp"
#include "transfer.hpp"

#include <chrono>
#include <cstdint>
#include <iosfwd>
#include <string>

namespace xfer {

// 1536 -> "1.50 KB"; steps of 1024 up to TB.
std::string format_bytes(std::uintmax_t bytes);

void print_plan_summary(const CopyPlan& plan);
void print_report(const TransferResult& result);
void print_duplicates(const FingerprintIndex& index);

// Writes a single status line per whole percent of overall progress.
class ConsoleProgressReporter : public ProgressReporter {
public:
    explicit ConsoleProgressReporter(std::ostream& out);

    void on_start(std::size_t total_files, std::uintmax_t total_bytes) override;
    void on_progress(const ProgressEvent& event) override;
    void on_complete(const TransferResult& result) override;

private:
    std::ostream& out_;
    int last_percent_{-1};
};

class ConsoleScanReporter : public ScanProgressReporter {
public:
    explicit ConsoleScanReporter(std::ostream& out);

    void on_scan_progress(const ScanProgressEvent& event) override;

private:
    std::ostream& out_;
    int last_percent_{-1};
};

} // namespace xfer
