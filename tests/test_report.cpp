#include "log.hpp"
#include "report.hpp"
#include "transfer.hpp"

#include <cassert>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    for (std::string line; std::getline(in, line);) {
        lines.push_back(line);
    }
    return lines;
}

void test_format_bytes() {
    assert(xfer::format_bytes(0) == "0 B");
    assert(xfer::format_bytes(1023) == "1023 B");
    assert(xfer::format_bytes(1536) == "1.50 KB");
    assert(xfer::format_bytes(15728640) == "15.00 MB");
    assert(xfer::format_bytes(3ULL * 1024 * 1024 * 1024) == "3.00 GB");
    assert(xfer::format_bytes(2048ULL * 1024 * 1024 * 1024 * 1024) == "2048.00 TB");
}

void test_progress_lines_once_per_percent() {
    std::ostringstream out;
    xfer::ConsoleProgressReporter reporter(out);
    reporter.on_start(2, 200);

    xfer::ProgressEvent event;
    event.total_files = 2;
    event.total_bytes = 200;
    event.current_file = "/data/a.bin";
    for (const std::uintmax_t done : {std::uintmax_t{1}, std::uintmax_t{1}, std::uintmax_t{2}, std::uintmax_t{200}}) {
        event.bytes_done = done;
        reporter.on_progress(event);
    }
    xfer::TransferResult result;
    reporter.on_complete(result);

    const std::vector<std::string> lines = split_lines(out.str());
    assert(lines.size() == 5);
    assert(lines[0] == "    Transferring 2 files (200 B)");
    assert(lines[1].find("[  0%]") != std::string::npos);
    assert(lines[2].find("[  1%]") != std::string::npos);
    assert(lines[3].find("[100%]") != std::string::npos);
    assert(lines[3].find("a.bin") != std::string::npos);
    assert(lines[4] == "    Transfer complete");
}

void test_reporter_and_log_lines_do_not_interleave() {
    std::ostringstream out;
    xfer::ConsoleProgressReporter reporter(out);
    const int kSteps = 2000;

    std::thread progress([&]() {
        xfer::ProgressEvent event;
        event.total_files = 1;
        event.total_bytes = kSteps;
        event.current_file = "/data/progress.bin";
        for (int i = 1; i <= kSteps; ++i) {
            event.bytes_done = static_cast<std::uintmax_t>(i);
            reporter.on_progress(event);
        }
    });
    std::thread logger([&]() {
        for (int i = 0; i < kSteps; ++i) {
            xfer::write_line(out, "    Copied file: /data/other.bin -> /backup/other.bin (42 bytes)");
        }
    });
    progress.join();
    logger.join();

    std::size_t progress_lines = 0;
    std::size_t log_lines = 0;
    for (const auto& line : split_lines(out.str())) {
        if (line == "    Copied file: /data/other.bin -> /backup/other.bin (42 bytes)") {
            ++log_lines;
        } else {
            assert(line.rfind("    [", 0) == 0);
            assert(line.size() > 14 && line.compare(line.size() - 12, 12, "progress.bin") == 0);
            ++progress_lines;
        }
    }
    assert(log_lines == static_cast<std::size_t>(kSteps));
    assert(progress_lines == 101);
}

} // namespace

int main() {
    try {
        test_format_bytes();
        test_progress_lines_once_per_percent();
        test_reporter_and_log_lines_do_not_interleave();
    } catch (const std::exception& ex) {
        std::cerr << "Test failure: " << ex.what() << std::endl;
        return 1;
    }

    std::cout << "All report tests passed." << std::endl;
    return 0;
}
