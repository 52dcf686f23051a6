#include "errors.hpp"
#include "log.hpp"
#include "plan.hpp"
#include "test_support.hpp"
#include "walk.hpp"

#include <algorithm>
#include <cassert>
#include <filesystem>
#include <iostream>
#include <set>
#include <stdexcept>
#include <string>

#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;
using xfer_test::TempDir;
using xfer_test::make_content;
using xfer_test::write_file;

namespace {

std::set<fs::path> destinations(const xfer::CopyPlan& plan) {
    std::set<fs::path> result;
    for (const auto& task : plan.tasks) {
        result.insert(task.destination_path);
    }
    return result;
}

void test_pattern_matching() {
    assert(xfer::matches_pattern("anything.bin", {"*"}));
    assert(xfer::matches_pattern("anything.bin", {}));
    assert(xfer::matches_pattern("Photo.JPG", {".jpg"}));
    assert(xfer::matches_pattern("photo.jpg", {"*.JPG"}));
    assert(xfer::matches_pattern("notes.txt", {".jpg", "txt"}));
    assert(!xfer::matches_pattern("photo.jpeg", {".jpg"}));
    assert(!xfer::matches_pattern("g", {".jpg"}));
}

void test_mirrors_relative_paths() {
    TempDir source;
    TempDir dest;
    write_file(source.path / "top.bin", make_content(100));
    write_file(source.path / "a" / "b" / "c.txt", make_content(250, 2));
    fs::create_directories(source.path / "empty");

    const xfer::CopyPlan plan = xfer::plan_transfer({source.path}, dest.path);

    assert(plan.total_files == 2);
    assert(plan.tasks.size() == 2);
    assert(plan.total_bytes == 350);
    const std::set<fs::path> expected = {dest.path / "top.bin", dest.path / "a" / "b" / "c.txt"};
    assert(destinations(plan) == expected);
    for (const auto& task : plan.tasks) {
        assert(task.expected_size == fs::file_size(task.source_path));
    }
}

void test_scenario_totals() {
    TempDir source;
    TempDir dest;
    write_file(source.path / "ten.bin", make_content(10 * 1024 * 1024, 3));
    write_file(source.path / "zero.bin", "");
    write_file(source.path / "five.bin", make_content(5 * 1024 * 1024, 4));

    const xfer::CopyPlan plan = xfer::plan_transfer({source.path}, dest.path);
    assert(plan.total_files == 3);
    assert(plan.total_bytes == 15728640);
}

void test_pattern_filtering() {
    TempDir source;
    TempDir dest;
    write_file(source.path / "x.JPG", "x");
    write_file(source.path / "sub" / "y.txt", "yy");
    write_file(source.path / "z.jpeg", "zzz");

    const xfer::CopyPlan jpg = xfer::plan_transfer({source.path}, dest.path, {".jpg"});
    assert(jpg.total_files == 1);
    assert(jpg.tasks.front().destination_path == dest.path / "x.JPG");

    const xfer::CopyPlan text = xfer::plan_transfer({source.path}, dest.path, {"*.TXT"});
    assert(text.total_files == 1);
    assert(text.tasks.front().destination_path == dest.path / "sub" / "y.txt");

    const xfer::CopyPlan everything = xfer::plan_transfer({source.path}, dest.path, {"*"});
    assert(everything.total_files == 3);
    assert(everything.total_bytes == 6);
}

void test_multiple_roots_merge_into_one_destination() {
    TempDir first;
    TempDir second;
    TempDir dest;
    write_file(first.path / "x" / "1.txt", "one");
    write_file(first.path / "shared.txt", "from first");
    write_file(second.path / "y" / "2.txt", "two");
    write_file(second.path / "shared.txt", "from second");

    const xfer::CopyPlan plan = xfer::plan_transfer({first.path, second.path}, dest.path);

    assert(plan.total_files == 3);
    assert(plan.conflicts_skipped == 1);
    const std::set<fs::path> expected = {dest.path / "x" / "1.txt", dest.path / "y" / "2.txt",
                                         dest.path / "shared.txt"};
    assert(destinations(plan) == expected);
    const auto shared = std::find_if(plan.tasks.begin(), plan.tasks.end(), [&](const xfer::CopyTask& task) {
        return task.destination_path == dest.path / "shared.txt";
    });
    assert(shared != plan.tasks.end());
    assert(shared->source_path == first.path / "shared.txt");
}

void test_single_file_source() {
    TempDir source;
    TempDir dest;
    write_file(source.path / "report.pdf", make_content(42));

    const xfer::CopyPlan plan = xfer::plan_transfer({source.path / "report.pdf"}, dest.path);
    assert(plan.total_files == 1);
    assert(plan.tasks.front().destination_path == dest.path / "report.pdf");
    assert(plan.total_bytes == 42);
}

void test_symlink_cycle_is_skipped() {
    TempDir source;
    TempDir dest;
    write_file(source.path / "a" / "file.txt", "data");
    write_file(source.path / "root.txt", "root");
    fs::create_directory_symlink(source.path, source.path / "a" / "loop");
    fs::create_directory_symlink(source.path / "a", source.path / "again");

    const xfer::CopyPlan plan = xfer::plan_transfer({source.path}, dest.path);

    assert(plan.total_files == 2);
    assert(plan.cycles_skipped >= 2);
}

void test_missing_root_is_not_found() {
    TempDir dest;
    bool thrown = false;
    try {
        xfer::plan_transfer({dest.path / "does-not-exist"}, dest.path / "out");
    } catch (const xfer::TransferError& ex) {
        thrown = true;
        assert(ex.kind() == xfer::ErrorKind::NotFound);
    }
    assert(thrown);
}

void test_unreadable_root_is_permission_denied() {
    if (::geteuid() == 0) {
        std::cout << "Skipping permission test when running as root." << std::endl;
        return;
    }
    TempDir source;
    TempDir dest;
    write_file(source.path / "locked" / "secret.txt", "secret");
    fs::permissions(source.path / "locked", fs::perms::none);

    bool thrown = false;
    try {
        xfer::plan_transfer({source.path / "locked"}, dest.path);
    } catch (const xfer::TransferError& ex) {
        thrown = true;
        assert(ex.kind() == xfer::ErrorKind::PermissionDenied);
    }
    fs::permissions(source.path / "locked", fs::perms::owner_all);
    assert(thrown);
}

void test_unreadable_subdirectory_is_skipped() {
    if (::geteuid() == 0) {
        std::cout << "Skipping unreadable subdirectory test when running as root." << std::endl;
        return;
    }
    TempDir source;
    TempDir dest;
    write_file(source.path / "ok.txt", "fine");
    write_file(source.path / "locked" / "hidden.txt", "hidden");
    fs::permissions(source.path / "locked", fs::perms::none);

    const xfer::CopyPlan plan = xfer::plan_transfer({source.path}, dest.path);
    const xfer::WalkStats stats = xfer::TreeWalker().walk(source.path, [](const xfer::WalkEntry&) {});
    fs::permissions(source.path / "locked", fs::perms::owner_all);

    assert(plan.total_files == 1);
    assert(plan.tasks.front().source_path == source.path / "ok.txt");
    assert(stats.files_visited == 1);
    assert(stats.entries_skipped == 1);
}

void test_invalid_inputs() {
    TempDir source;
    TempDir dest;
    write_file(dest.path / "not_a_dir", "x");

    bool no_sources = false;
    try {
        xfer::plan_transfer({}, dest.path);
    } catch (const xfer::TransferError&) {
        no_sources = true;
    }
    assert(no_sources);

    bool file_destination = false;
    try {
        xfer::plan_transfer({source.path}, dest.path / "not_a_dir");
    } catch (const xfer::TransferError& ex) {
        file_destination = true;
        assert(ex.kind() == xfer::ErrorKind::IOError);
    }
    assert(file_destination);

    bool same_location = false;
    try {
        xfer::plan_transfer({source.path}, source.path);
    } catch (const xfer::TransferError&) {
        same_location = true;
    }
    assert(same_location);
}

} // namespace

int main() {
    xfer::set_quiet(true);
    try {
        test_pattern_matching();
        test_mirrors_relative_paths();
        test_scenario_totals();
        test_pattern_filtering();
        test_multiple_roots_merge_into_one_destination();
        test_single_file_source();
        test_symlink_cycle_is_skipped();
        test_missing_root_is_not_found();
        test_unreadable_root_is_permission_denied();
        test_unreadable_subdirectory_is_skipped();
        test_invalid_inputs();
    } catch (const std::exception& ex) {
        std::cerr << "Test failure: " << ex.what() << std::endl;
        return 1;
    }

    std::cout << "All planner tests passed." << std::endl;
    return 0;
}
