#pragma once

#include "cancel.hpp"
#include "io.hpp"
#include "plan.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>

namespace xfer {

enum class CopyMode {
    Fresh,
    Resumed,
    AlreadyPresent,
};

struct CopyOutcome {
    CopyMode mode{CopyMode::Fresh};
    std::uintmax_t source_size{0};
    std::uintmax_t resumed_from{0};
    std::uintmax_t bytes_written{0};
    // False when cancellation stopped the copy between two chunks; the partial
    // destination is left in place for a later resume.
    bool completed{true};
};

class ResumableCopier {
public:
    // Called after every chunk with the chunk length, the number of bytes now
    // present at the destination and the file's completion percentage in
    // [0, 100]. A file that needs no writing reports once with chunk_bytes 0.
    using ChunkCallback = std::function<void(std::uintmax_t chunk_bytes, std::uintmax_t offset, double percent)>;

    explicit ResumableCopier(std::size_t chunk_size = kDefaultChunkSize, const CancellationToken* cancel = nullptr);

    // Throws TransferError naming the failing path.
    CopyOutcome copy(const CopyTask& task, const ChunkCallback& on_chunk = {}) const;

private:
    std::size_t chunk_size_;
    const CancellationToken* cancel_;
};

double completion_percent(std::uintmax_t offset, std::uintmax_t total);

} // namespace xfer
