#pragma once

#include "cancel.hpp"
#include "io.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace xfer {

// A content fingerprint is an MD5 digest of a file's bytes. It is used only to
// test equality of content. MD5 collisions can be constructed on purpose, so two
// files with equal fingerprints are the same content with overwhelming
// probability inside a trusted tree, never a security guarantee.
class Fingerprint {
public:
    static constexpr std::size_t kSize = 16;
    using Bytes = std::array<std::uint8_t, kSize>;

    Fingerprint() = default;
    explicit Fingerprint(const Bytes& bytes) : bytes_(bytes) {}

    const Bytes& bytes() const noexcept { return bytes_; }
    std::string to_hex() const;

    bool operator==(const Fingerprint& other) const { return bytes_ == other.bytes_; }
    bool operator!=(const Fingerprint& other) const { return bytes_ != other.bytes_; }
    bool operator<(const Fingerprint& other) const { return bytes_ < other.bytes_; }

private:
    Bytes bytes_{};
};

struct FingerprintHash {
    std::size_t operator()(const Fingerprint& fingerprint) const noexcept;
};

class ContentHasher {
public:
    explicit ContentHasher(std::size_t chunk_size = kDefaultChunkSize, const CancellationToken* cancel = nullptr);

    // Streams the file from start_offset to its end. Throws TransferError with
    // IOError when the file cannot be read to completion (including a file that
    // shrinks while it is being read) and Cancelled when the token fires.
    Fingerprint fingerprint(const std::filesystem::path& path, std::uintmax_t start_offset = 0) const;

private:
    std::size_t chunk_size_;
    const CancellationToken* cancel_;
};

} // namespace xfer
