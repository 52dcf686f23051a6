#include "fingerprint.hpp"

#include "errors.hpp"

#include <cstdio>
#include <cstring>
#include <memory>
#include <vector>

#include <fcntl.h>
#include <openssl/evp.h>

namespace xfer {

namespace fs = std::filesystem;

namespace {

using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

[[noreturn]] void throw_digest_error(const fs::path& path, const char* step) {
    throw TransferError(ErrorKind::IOError, path, std::string("MD5 digest ") + step + " failed");
}

} // namespace

std::string Fingerprint::to_hex() const {
    std::string result;
    result.reserve(kSize * 2);
    for (const auto byte : bytes_) {
        char hex[3];
        std::snprintf(hex, sizeof(hex), "%02x", byte);
        result += hex;
    }
    return result;
}

std::size_t FingerprintHash::operator()(const Fingerprint& fingerprint) const noexcept {
    // The digest is already uniformly distributed; its first word is enough.
    std::size_t value = 0;
    std::memcpy(&value, fingerprint.bytes().data(), sizeof(value));
    return value;
}

ContentHasher::ContentHasher(std::size_t chunk_size, const CancellationToken* cancel)
    : chunk_size_(chunk_size == 0 ? kDefaultChunkSize : chunk_size), cancel_(cancel) {}

Fingerprint ContentHasher::fingerprint(const fs::path& path, std::uintmax_t start_offset) const {
    FileDescriptor file = FileDescriptor::open(path, O_RDONLY);
    const std::uintmax_t size_at_open = file.size(path);

    DigestContext ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx) {
        throw_digest_error(path, "allocation");
    }
    if (EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1) {
        throw_digest_error(path, "init");
    }

    std::vector<unsigned char> buffer(chunk_size_);
    std::uintmax_t offset = start_offset;
    while (true) {
        if (cancel_ != nullptr && cancel_->cancelled()) {
            throw TransferError(ErrorKind::Cancelled, path, "Fingerprint cancelled");
        }
        const std::size_t n = read_at(file, buffer.data(), buffer.size(), offset, path);
        if (n == 0) {
            break;
        }
        if (EVP_DigestUpdate(ctx.get(), buffer.data(), n) != 1) {
            throw_digest_error(path, "update");
        }
        offset += n;
    }

    if (offset < size_at_open) {
        throw TransferError(ErrorKind::IOError, path, "File shrank while it was being fingerprinted");
    }

    Fingerprint::Bytes digest{};
    unsigned int digest_length = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &digest_length) != 1 || digest_length != Fingerprint::kSize) {
        throw_digest_error(path, "finalization");
    }
    return Fingerprint(digest);
}

} // namespace xfer
