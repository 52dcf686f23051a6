#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace xfer {

struct CopyTask {
    std::filesystem::path source_path;
    std::filesystem::path destination_path;
    std::uintmax_t expected_size{0};
};

struct CopyPlan {
    std::filesystem::path destination_root;
    std::vector<CopyTask> tasks;
    std::size_t total_files{0};
    // Sum of sizes seen while planning; only used for progress percentages.
    std::uintmax_t total_bytes{0};
    std::size_t conflicts_skipped{0};
    std::size_t cycles_skipped{0};

    static CopyPlan from_tasks(std::filesystem::path destination_root, std::vector<CopyTask> tasks);
};

struct PlanOptions {
    std::vector<std::string> patterns{"*"};
};

// "*" matches everything; any other pattern is a case-insensitive suffix of
// the file name. Leading '*' characters are ignored, so "*.jpg" and ".jpg"
// are the same pattern. An empty pattern list matches everything.
bool matches_pattern(const std::string& file_name, const std::vector<std::string>& patterns);

class PathPlanner {
public:
    explicit PathPlanner(PlanOptions options = {});

    // Builds the complete plan or throws TransferError; no partial plan is
    // ever returned.
    CopyPlan plan(const std::vector<std::filesystem::path>& sources,
                  const std::filesystem::path& destination_root) const;

private:
    PlanOptions options_;

    void validate_inputs(const std::vector<std::filesystem::path>& sources,
                         const std::filesystem::path& destination_root) const;
};

CopyPlan plan_transfer(const std::vector<std::filesystem::path>& sources,
                       const std::filesystem::path& destination_root,
                       const std::vector<std::string>& patterns = {"*"});

} // namespace xfer
