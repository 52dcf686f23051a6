#pragma once

#include "cancel.hpp"
#include "fingerprint.hpp"
#include "io.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <unordered_map>
#include <vector>

namespace xfer {

// Files sharing one content fingerprint. paths[0] is the first occurrence in
// walk order and is called the original; this is an ordering convention only.
struct DuplicateGroup {
    Fingerprint fingerprint;
    std::uintmax_t file_size{0};
    std::vector<std::filesystem::path> paths;

    const std::filesystem::path& original() const { return paths.front(); }
    std::vector<std::filesystem::path> duplicates() const;
    std::uintmax_t reclaimable_bytes() const;
};

struct UnscannableFile {
    std::filesystem::path path;
    std::string reason;
};

// Fingerprint -> paths. Two files land in the same group iff their MD5
// digests are equal; there is no byte-by-byte confirmation, so a deliberately
// crafted collision would be reported as a duplicate. The index never touches
// the files it describes; deleting or moving them is up to the caller.
class FingerprintIndex {
public:
    void add(const Fingerprint& fingerprint, std::filesystem::path path, std::uintmax_t size);
    void add_unscannable(std::filesystem::path path, std::string reason);

    // Drops every fingerprint that has a single path.
    void discard_singletons();

    const std::vector<DuplicateGroup>& groups() const noexcept { return groups_; }
    std::size_t size() const noexcept { return groups_.size(); }
    bool empty() const noexcept { return groups_.empty(); }
    const DuplicateGroup* find(const Fingerprint& fingerprint) const;

    // Every path except each group's original, in group order.
    std::vector<std::filesystem::path> redundant_paths() const;
    std::uintmax_t reclaimable_bytes() const;
    const std::vector<UnscannableFile>& unscannable() const noexcept { return unscannable_; }

private:
    std::vector<DuplicateGroup> groups_;
    std::unordered_map<Fingerprint, std::size_t, FingerprintHash> positions_;
    std::vector<UnscannableFile> unscannable_;
};

struct ScanOptions {
    std::uintmax_t min_size{1};
    // Case-insensitive extensions, with or without the leading dot. Empty
    // accepts every file.
    std::vector<std::string> extensions;
    // 0 selects default_concurrency().
    std::size_t threads{0};
    std::size_t chunk_size{kDefaultChunkSize};
};

struct ScanProgressEvent {
    std::size_t files_seen{0};
    std::size_t candidates{0};
    std::size_t files_hashed{0};
    std::size_t files_to_hash{0};
    std::uintmax_t bytes_hashed{0};
    std::filesystem::path current_file;
};

class ScanProgressReporter {
public:
    virtual ~ScanProgressReporter() = default;

    virtual void on_scan_progress(const ScanProgressEvent& event) = 0;
};

bool matches_extension(const std::filesystem::path& path, const std::vector<std::string>& extensions);

class DuplicateScanner {
public:
    explicit DuplicateScanner(ScanOptions options = {}, ScanProgressReporter* reporter = nullptr,
                              const CancellationToken* cancel = nullptr);

    // Symlinked files are not scanned, and a file reachable through several
    // hard links is scanned once under the first path the walk meets, so no
    // group ever lists two names for one inode.
    // Throws TransferError when root is missing or unreadable, or with kind
    // Cancelled when the token fires. Files that fail to hash are listed in
    // FingerprintIndex::unscannable() instead.
    FingerprintIndex scan(const std::filesystem::path& root) const;

private:
    ScanOptions options_;
    ScanProgressReporter* reporter_;
    const CancellationToken* cancel_;
};

FingerprintIndex scan_duplicates(const std::filesystem::path& root, std::uintmax_t min_size,
                                 const std::vector<std::string>& extensions = {});

} // namespace xfer
