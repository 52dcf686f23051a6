#include "cancel.hpp"
#include "errors.hpp"
#include "fingerprint.hpp"
#include "test_support.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <unordered_set>

namespace fs = std::filesystem;
using xfer_test::TempDir;
using xfer_test::make_content;
using xfer_test::write_file;

namespace {

void test_known_digests() {
    TempDir dir;
    write_file(dir.path / "abc.txt", "abc");
    write_file(dir.path / "empty.txt", "");

    const xfer::ContentHasher hasher;
    assert(hasher.fingerprint(dir.path / "abc.txt").to_hex() == "900150983cd24fb0d6963f7d28e17f72");
    assert(hasher.fingerprint(dir.path / "empty.txt").to_hex() == "d41d8cd98f00b204e9800998ecf8427e");
}

void test_chunk_size_does_not_change_digest() {
    TempDir dir;
    const fs::path file = dir.path / "data.bin";
    write_file(file, make_content(1024 * 1024 + 123, 9));

    const xfer::Fingerprint reference = xfer::ContentHasher().fingerprint(file);
    for (const std::size_t chunk : {std::size_t{1}, std::size_t{7}, std::size_t{4096}, std::size_t{3 * 1024 * 1024}}) {
        assert(xfer::ContentHasher(chunk).fingerprint(file) == reference);
    }
}

void test_single_byte_difference() {
    TempDir dir;
    std::string content = make_content(64 * 1024, 5);
    write_file(dir.path / "a.bin", content);
    content[content.size() / 2] = static_cast<char>(content[content.size() / 2] ^ 0x01);
    write_file(dir.path / "b.bin", content);

    const xfer::ContentHasher hasher;
    const xfer::Fingerprint a = hasher.fingerprint(dir.path / "a.bin");
    const xfer::Fingerprint b = hasher.fingerprint(dir.path / "b.bin");
    assert(a != b);
    assert(a.to_hex().size() == 32);

    std::unordered_set<xfer::Fingerprint, xfer::FingerprintHash> set{a, b, a};
    assert(set.size() == 2);
}

void test_start_offset() {
    TempDir dir;
    write_file(dir.path / "prefixed.txt", "xyzabc");

    const xfer::ContentHasher hasher(2);
    assert(hasher.fingerprint(dir.path / "prefixed.txt", 3).to_hex() == "900150983cd24fb0d6963f7d28e17f72");
}

void test_missing_file() {
    TempDir dir;
    bool thrown = false;
    try {
        xfer::ContentHasher().fingerprint(dir.path / "gone.bin");
    } catch (const xfer::TransferError& ex) {
        thrown = true;
        assert(ex.kind() == xfer::ErrorKind::NotFound);
    }
    assert(thrown);
}

void test_cancellation() {
    TempDir dir;
    write_file(dir.path / "data.bin", make_content(4096));

    xfer::CancellationToken cancel;
    cancel.cancel();
    bool thrown = false;
    try {
        xfer::ContentHasher(512, &cancel).fingerprint(dir.path / "data.bin");
    } catch (const xfer::TransferError& ex) {
        thrown = true;
        assert(ex.kind() == xfer::ErrorKind::Cancelled);
    }
    assert(thrown);
}

} // namespace

int main() {
    try {
        test_known_digests();
        test_chunk_size_does_not_change_digest();
        test_single_byte_difference();
        test_start_offset();
        test_missing_file();
        test_cancellation();
    } catch (const std::exception& ex) {
        std::cerr << "Test failure: " << ex.what() << std::endl;
        return 1;
    }

    std::cout << "All fingerprint tests passed." << std::endl;
    return 0;
}
