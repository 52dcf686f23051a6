#include "plan.hpp"

#include "errors.hpp"
#include "log.hpp"
#include "walk.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>
#include <unordered_set>
#include <utility>

namespace xfer {

namespace fs = std::filesystem;

namespace {

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool same_location(const fs::path& lhs, const fs::path& rhs) {
    std::error_code ec;
    const bool equivalent = fs::equivalent(lhs, rhs, ec);
    return !ec && equivalent;
}

} // namespace

CopyPlan CopyPlan::from_tasks(fs::path destination_root, std::vector<CopyTask> tasks) {
    CopyPlan plan;
    plan.destination_root = std::move(destination_root);
    plan.tasks = std::move(tasks);
    plan.total_files = plan.tasks.size();
    for (const auto& task : plan.tasks) {
        plan.total_bytes += task.expected_size;
    }
    return plan;
}

bool matches_pattern(const std::string& file_name, const std::vector<std::string>& patterns) {
    if (patterns.empty()) {
        return true;
    }
    const std::string name = to_lower(file_name);
    for (const auto& raw : patterns) {
        const std::string::size_type first = raw.find_first_not_of('*');
        if (first == std::string::npos) {
            return true;
        }
        const std::string suffix = to_lower(raw.substr(first));
        if (name.size() >= suffix.size() && name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0) {
            return true;
        }
    }
    return false;
}

PathPlanner::PathPlanner(PlanOptions options) : options_(std::move(options)) {}

CopyPlan PathPlanner::plan(const std::vector<fs::path>& sources, const fs::path& destination_root) const {
    validate_inputs(sources, destination_root);

    CopyPlan plan;
    plan.destination_root = destination_root;
    std::unordered_set<std::string> destinations;

    TreeWalker walker;
    for (const auto& source : sources) {
        const WalkStats stats = walker.walk(source, [&](const WalkEntry& entry) {
            if (!matches_pattern(entry.path.filename().string(), options_.patterns)) {
                return;
            }
            fs::path destination = destination_root / entry.relative;
            if (!destinations.insert(destination.lexically_normal().string()).second) {
                log_warning("skipping " + entry.path.string() + ": destination " + destination.string() +
                            " is already planned from another source");
                ++plan.conflicts_skipped;
                return;
            }
            plan.total_bytes += entry.size;
            plan.tasks.push_back(CopyTask{entry.path, std::move(destination), entry.size});
        });
        plan.cycles_skipped += stats.cycles_skipped;
    }

    plan.total_files = plan.tasks.size();
    return plan;
}

void PathPlanner::validate_inputs(const std::vector<fs::path>& sources, const fs::path& destination_root) const {
    if (sources.empty()) {
        throw TransferError(ErrorKind::NotFound, {}, "No source paths were given");
    }
    if (destination_root.empty()) {
        throw TransferError(ErrorKind::NotFound, {}, "No destination root was given");
    }

    std::error_code ec;
    if (fs::exists(destination_root, ec) && !fs::is_directory(destination_root, ec)) {
        throw TransferError(ErrorKind::IOError, destination_root, "Destination exists but is not a directory");
    }

    for (const auto& source : sources) {
        if (same_location(source, destination_root)) {
            throw TransferError(ErrorKind::IOError, source, "Source and destination resolve to the same location");
        }
    }
}

CopyPlan plan_transfer(const std::vector<fs::path>& sources, const fs::path& destination_root,
                       const std::vector<std::string>& patterns) {
    PlanOptions options;
    options.patterns = patterns;
    return PathPlanner(options).plan(sources, destination_root);
}

} // namespace xfer
