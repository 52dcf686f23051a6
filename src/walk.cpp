#include "walk.hpp"

#include "errors.hpp"
#include "log.hpp"

#include <algorithm>
#include <cerrno>
#include <set>
#include <system_error>
#include <utility>
#include <vector>

#include <sys/stat.h>
#include <unistd.h>

namespace xfer {

namespace fs = std::filesystem;

namespace {

WalkEntry make_entry(const fs::path& path, const fs::path& relative, const struct stat& st, bool is_symlink) {
    WalkEntry entry;
    entry.path = path;
    entry.relative = relative;
    entry.size = static_cast<std::uintmax_t>(st.st_size);
    entry.device = static_cast<std::uintmax_t>(st.st_dev);
    entry.inode = static_cast<std::uintmax_t>(st.st_ino);
    entry.is_symlink = is_symlink;
    return entry;
}

bool is_symlink_path(const fs::path& path) {
    struct stat lst {};
    return ::lstat(path.c_str(), &lst) == 0 && S_ISLNK(lst.st_mode);
}

} // namespace

TreeWalker::TreeWalker(const CancellationToken* cancel) : cancel_(cancel) {}

WalkStats TreeWalker::walk(const fs::path& root, const Visitor& visit) {
    WalkStats stats{};

    struct stat root_st {};
    if (::stat(root.c_str(), &root_st) != 0) {
        throw_errno(root, "Cannot access source root", errno);
    }

    if (S_ISREG(root_st.st_mode)) {
        ++stats.files_visited;
        visit(make_entry(root, root.filename(), root_st, is_symlink_path(root)));
        return stats;
    }
    if (!S_ISDIR(root_st.st_mode)) {
        throw TransferError(ErrorKind::IOError, root, "Source root is neither a directory nor a regular file");
    }
    if (::access(root.c_str(), R_OK | X_OK) != 0) {
        throw_errno(root, "Cannot read source root", errno);
    }

    std::set<std::pair<dev_t, ino_t>> visited;
    visited.emplace(root_st.st_dev, root_st.st_ino);

    std::vector<fs::path> pending{fs::path{}};
    while (!pending.empty() && !cancelled()) {
        const fs::path relative_dir = std::move(pending.back());
        pending.pop_back();
        const fs::path dir = relative_dir.empty() ? root : root / relative_dir;
        ++stats.directories_visited;

        std::error_code ec;
        std::vector<fs::path> names;
        fs::directory_iterator it(dir, ec);
        if (ec) {
            log_warning("failed to open directory " + dir.string() + ": " + ec.message());
            ++stats.entries_skipped;
            continue;
        }
        fs::directory_iterator end;
        for (; it != end; it.increment(ec)) {
            names.push_back(it->path().filename());
        }
        if (ec) {
            log_warning("incomplete listing of " + dir.string() + ": " + ec.message());
        }
        std::sort(names.begin(), names.end());

        std::vector<fs::path> subdirs;
        for (const auto& name : names) {
            const fs::path path = dir / name;
            const fs::path relative = relative_dir / name;

            struct stat st {};
            if (::stat(path.c_str(), &st) != 0) {
                const int err = errno;
                if (is_symlink_path(path)) {
                    log_warning("skipping dangling symlink " + path.string());
                } else {
                    log_warning("entry vanished or unreadable " + path.string() + ": " +
                                std::error_code(err, std::generic_category()).message());
                }
                ++stats.entries_skipped;
                continue;
            }

            if (S_ISDIR(st.st_mode)) {
                if (!visited.emplace(st.st_dev, st.st_ino).second) {
                    log_warning("skipping already visited directory (symlink cycle): " + path.string());
                    ++stats.cycles_skipped;
                    continue;
                }
                subdirs.push_back(relative);
                continue;
            }

            if (!S_ISREG(st.st_mode)) {
                log_info("Skipping non-regular entry: " + path.string());
                ++stats.entries_skipped;
                continue;
            }

            ++stats.files_visited;
            visit(make_entry(path, relative, st, is_symlink_path(path)));
        }

        // Reverse push keeps subdirectories popping in name order.
        for (auto rit = subdirs.rbegin(); rit != subdirs.rend(); ++rit) {
            pending.push_back(std::move(*rit));
        }
    }

    return stats;
}

} // namespace xfer
