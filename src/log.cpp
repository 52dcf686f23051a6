#include "log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace xfer {

namespace {

std::mutex& console_mutex() {
    static std::mutex mutex;
    return mutex;
}

std::atomic<bool> quiet_output{false};

} // namespace

void set_quiet(bool quiet) {
    quiet_output.store(quiet);
}

void write_line(std::ostream& out, const std::string& line) {
    std::lock_guard<std::mutex> lock(console_mutex());
    out << line << std::endl;
}

void log_info(const std::string& message) {
    if (quiet_output.load()) {
        return;
    }
    std::lock_guard<std::mutex> lock(console_mutex());
    std::cout << "    " << message << std::endl;
}

void log_warning(const std::string& message) {
    std::lock_guard<std::mutex> lock(console_mutex());
    std::cerr << "    Warning: " << message << std::endl;
}

void log_error(const std::string& message) {
    std::lock_guard<std::mutex> lock(console_mutex());
    std::cerr << "    Error: " << message << std::endl;
}

} // namespace xfer
