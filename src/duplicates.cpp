#include "duplicates.hpp"

#include "errors.hpp"
#include "log.hpp"
#include "transfer.hpp"
#include "walk.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <system_error>
#include <thread>
#include <utility>

namespace xfer {

namespace fs = std::filesystem;

namespace {

std::string normalize_extension(std::string extension) {
    extension.erase(0, extension.find_first_not_of('.'));
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return extension;
}

struct Candidate {
    fs::path path;
    std::uintmax_t size{0};
    std::optional<Fingerprint> fingerprint;
    std::string failure;
};

} // namespace

std::vector<fs::path> DuplicateGroup::duplicates() const {
    if (paths.size() < 2) {
        return {};
    }
    return std::vector<fs::path>(paths.begin() + 1, paths.end());
}

std::uintmax_t DuplicateGroup::reclaimable_bytes() const {
    return paths.size() < 2 ? 0 : file_size * (paths.size() - 1);
}

void FingerprintIndex::add(const Fingerprint& fingerprint, fs::path path, std::uintmax_t size) {
    const auto it = positions_.find(fingerprint);
    if (it == positions_.end()) {
        positions_.emplace(fingerprint, groups_.size());
        groups_.push_back(DuplicateGroup{fingerprint, size, {std::move(path)}});
        return;
    }
    groups_[it->second].paths.push_back(std::move(path));
}

void FingerprintIndex::add_unscannable(fs::path path, std::string reason) {
    unscannable_.push_back(UnscannableFile{std::move(path), std::move(reason)});
}

void FingerprintIndex::discard_singletons() {
    groups_.erase(std::remove_if(groups_.begin(), groups_.end(),
                                 [](const DuplicateGroup& group) { return group.paths.size() < 2; }),
                  groups_.end());
    positions_.clear();
    for (std::size_t i = 0; i < groups_.size(); ++i) {
        positions_.emplace(groups_[i].fingerprint, i);
    }
}

const DuplicateGroup* FingerprintIndex::find(const Fingerprint& fingerprint) const {
    const auto it = positions_.find(fingerprint);
    return it == positions_.end() ? nullptr : &groups_[it->second];
}

std::vector<fs::path> FingerprintIndex::redundant_paths() const {
    std::vector<fs::path> result;
    for (const auto& group : groups_) {
        const auto duplicates = group.duplicates();
        result.insert(result.end(), duplicates.begin(), duplicates.end());
    }
    return result;
}

std::uintmax_t FingerprintIndex::reclaimable_bytes() const {
    std::uintmax_t total = 0;
    for (const auto& group : groups_) {
        total += group.reclaimable_bytes();
    }
    return total;
}

bool matches_extension(const fs::path& path, const std::vector<std::string>& extensions) {
    if (extensions.empty()) {
        return true;
    }
    const std::string actual = normalize_extension(path.extension().string());
    if (actual.empty()) {
        return false;
    }
    for (const auto& extension : extensions) {
        if (normalize_extension(extension) == actual) {
            return true;
        }
    }
    return false;
}

DuplicateScanner::DuplicateScanner(ScanOptions options, ScanProgressReporter* reporter,
                                   const CancellationToken* cancel)
    : options_(std::move(options)), reporter_(reporter), cancel_(cancel) {}

FingerprintIndex DuplicateScanner::scan(const fs::path& root) const {
    std::error_code ec;
    const fs::path absolute_root = fs::absolute(root, ec);
    if (ec) {
        throw TransferError(classify(ec), root, "Cannot resolve scan root: " + ec.message(), ec);
    }

    std::vector<Candidate> candidates;
    std::size_t files_seen = 0;
    // Symlinks and extra hard links name a file already in the tree, never a
    // second copy of its bytes.
    std::set<std::pair<std::uintmax_t, std::uintmax_t>> seen_inodes;
    TreeWalker walker(cancel_);
    const WalkStats stats = walker.walk(absolute_root, [&](const WalkEntry& entry) {
        ++files_seen;
        if (entry.is_symlink) {
            log_info("Skipping symlink: " + entry.path.string());
            return;
        }
        if (entry.size < options_.min_size || !matches_extension(entry.path, options_.extensions)) {
            return;
        }
        if (!seen_inodes.emplace(entry.device, entry.inode).second) {
            log_info("Skipping additional hard link: " + entry.path.string());
            return;
        }
        candidates.push_back(Candidate{entry.path, entry.size, std::nullopt, {}});
    });
    if (stats.cycles_skipped > 0) {
        log_info("Skipped " + std::to_string(stats.cycles_skipped) + " already visited directories");
    }

    // A file whose size no other candidate shares cannot have a duplicate.
    std::map<std::uintmax_t, std::size_t> size_counts;
    for (const auto& candidate : candidates) {
        ++size_counts[candidate.size];
    }
    std::vector<std::size_t> to_hash;
    for (std::size_t i = 0; i < candidates.size(); ++i) {
        if (size_counts[candidates[i].size] > 1) {
            to_hash.push_back(i);
        }
    }

    std::atomic<std::size_t> next{0};
    std::atomic<std::size_t> hashed{0};
    std::atomic<std::uintmax_t> bytes_hashed{0};
    std::mutex progress_mutex;
    const ContentHasher hasher(options_.chunk_size, cancel_);

    auto worker = [&]() {
        std::size_t i;
        while ((i = next.fetch_add(1)) < to_hash.size()) {
            if (cancel_ != nullptr && cancel_->cancelled()) {
                break;
            }
            Candidate& candidate = candidates[to_hash[i]];
            try {
                candidate.fingerprint = hasher.fingerprint(candidate.path);
                bytes_hashed.fetch_add(candidate.size);
            } catch (const TransferError& ex) {
                if (ex.kind() == ErrorKind::Cancelled) {
                    break;
                }
                candidate.failure = ex.what();
            } catch (const std::exception& ex) {
                candidate.failure = ex.what();
            }
            hashed.fetch_add(1);
            if (reporter_ != nullptr) {
                std::lock_guard<std::mutex> lock(progress_mutex);
                ScanProgressEvent event;
                event.files_seen = files_seen;
                event.candidates = candidates.size();
                event.files_hashed = hashed.load();
                event.files_to_hash = to_hash.size();
                event.bytes_hashed = bytes_hashed.load();
                event.current_file = candidate.path;
                reporter_->on_scan_progress(event);
            }
        }
    };

    const std::size_t requested = options_.threads == 0 ? default_concurrency() : options_.threads;
    const std::size_t thread_count = std::max<std::size_t>(1, std::min(requested, to_hash.size()));
    std::vector<std::thread> pool;
    pool.reserve(thread_count);
    for (std::size_t t = 0; t < thread_count; ++t) {
        try {
            pool.emplace_back(worker);
        } catch (const std::system_error& ex) {
            if (pool.empty()) {
                throw;
            }
            log_warning("started only " + std::to_string(pool.size()) + " hashing threads: " + ex.what());
            break;
        }
    }
    for (auto& thread : pool) {
        thread.join();
    }

    if (cancel_ != nullptr && cancel_->cancelled()) {
        throw TransferError(ErrorKind::Cancelled, absolute_root, "Duplicate scan cancelled");
    }

    // Insertion in walk order keeps the first path of every group stable.
    FingerprintIndex index;
    for (auto& candidate : candidates) {
        if (candidate.fingerprint) {
            index.add(*candidate.fingerprint, std::move(candidate.path), candidate.size);
        } else if (!candidate.failure.empty()) {
            log_warning("cannot fingerprint " + candidate.path.string() + ": " + candidate.failure);
            index.add_unscannable(std::move(candidate.path), std::move(candidate.failure));
        }
    }
    index.discard_singletons();
    return index;
}

FingerprintIndex scan_duplicates(const fs::path& root, std::uintmax_t min_size,
                                 const std::vector<std::string>& extensions) {
    ScanOptions options;
    options.min_size = min_size;
    options.extensions = extensions;
    return DuplicateScanner(options).scan(root);
}

} // namespace xfer
