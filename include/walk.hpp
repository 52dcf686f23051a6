#pragma once

#include "cancel.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>

namespace xfer {

struct WalkEntry {
    std::filesystem::path path;
    std::filesystem::path relative;
    std::uintmax_t size{0};
    // Identity of the file the path resolves to; hard links and symlinks to
    // one file share it.
    std::uintmax_t device{0};
    std::uintmax_t inode{0};
    // True when `path` itself is a symlink to a regular file.
    bool is_symlink{false};
};

struct WalkStats {
    std::size_t directories_visited{0};
    std::size_t files_visited{0};
    std::size_t cycles_skipped{0};
    std::size_t entries_skipped{0};
};

// Depth-first walk that follows symlinks but enters every real directory
// (device, inode) at most once. Entries of a directory are visited in name
// order, so the walk order is reproducible for an unchanged tree.
class TreeWalker {
public:
    using Visitor = std::function<void(const WalkEntry&)>;

    explicit TreeWalker(const CancellationToken* cancel = nullptr);

    // Throws TransferError when the root itself is missing or unreadable.
    // Problems below the root are logged and skipped.
    WalkStats walk(const std::filesystem::path& root, const Visitor& visit);

private:
    const CancellationToken* cancel_;

    bool cancelled() const { return cancel_ != nullptr && cancel_->cancelled(); }
};

} // namespace xfer
