#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace rangefetch {

// One contiguous byte range, end inclusive. Offsets use modular arithmetic:
// a zero-length chunk has end + 1 == start (end wraps when start is 0).
struct ChunkSpec {
    std::size_t index{0};
    std::uint64_t start{0};
    std::uint64_t end{0};

    [[nodiscard]] std::uint64_t length() const noexcept { return end - start + 1; }
    [[nodiscard]] bool empty() const noexcept { return length() == 0; }
};

struct ChunkResult {
    std::size_t index{0};
    bool success{false};
    std::string error;
};

// Splits [0, total_size) into exactly `workers` chunks of floor(total_size / workers)
// bytes; the last chunk absorbs the remainder. Throws std::invalid_argument when
// total_size or workers is zero.
[[nodiscard]] std::vector<ChunkSpec> planChunks(std::uint64_t total_size, std::size_t workers);

// <final_path>.part<index>
[[nodiscard]] std::filesystem::path partPath(const std::filesystem::path& final_path,
                                             std::size_t index);

} // namespace rangefetch
