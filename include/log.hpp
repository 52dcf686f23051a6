#pragma once

#include <iosfwd>
#include <string>

namespace xfer {

// Console logging shared by concurrent workers; each call emits one whole line.
void log_info(const std::string& message);
void log_warning(const std::string& message);
void log_error(const std::string& message);

// Writes one whole line to `out` under the same lock as the log functions, so
// progress output and log lines never interleave mid-line.
void write_line(std::ostream& out, const std::string& line);

void set_quiet(bool quiet);

} // namespace xfer
