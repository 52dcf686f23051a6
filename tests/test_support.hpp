#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>

namespace xfer_test {

namespace fs = std::filesystem;

struct TempDir {
    fs::path path;

    TempDir() {
        static std::atomic<unsigned> counter{0};
        auto base = fs::temp_directory_path();
        path = base / fs::path("xferkit_test_" +
                               std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) + "_" +
                               std::to_string(counter.fetch_add(1)));
        fs::create_directories(path);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;
};

// Deterministic, non-repeating-looking content so offsets matter.
inline std::string make_content(std::size_t size, std::uint32_t seed = 1) {
    std::string data(size, '\0');
    std::uint32_t state = seed * 2654435761u + 1;
    for (std::size_t i = 0; i < size; ++i) {
        state = state * 1103515245u + 12345u;
        data[i] = static_cast<char>((state >> 16) & 0xff);
    }
    return data;
}

inline void write_file(const fs::path& file, const std::string& content) {
    fs::create_directories(file.parent_path());
    std::ofstream output(file, std::ios::binary | std::ios::trunc);
    output.write(content.data(), static_cast<std::streamsize>(content.size()));
    if (!output) {
        throw std::runtime_error("Failed to write fixture " + file.string());
    }
}

inline std::string read_file(const fs::path& file) {
    std::ifstream input(file, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>());
}

} // namespace xfer_test
