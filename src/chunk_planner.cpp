#include "rangefetch/chunk.hpp"

#include <stdexcept>

namespace rangefetch {

std::vector<ChunkSpec> planChunks(std::uint64_t total_size, std::size_t workers) {
    if (total_size == 0) {
        throw std::invalid_argument("Cannot plan chunks for an empty resource");
    }
    if (workers == 0) {
        throw std::invalid_argument("Worker count must be at least 1");
    }

    const std::uint64_t base = total_size / workers;

    std::vector<ChunkSpec> chunks;
    chunks.reserve(workers);
    for (std::size_t i = 0; i < workers; ++i) {
        ChunkSpec chunk;
        chunk.index = i;
        chunk.start = static_cast<std::uint64_t>(i) * base;
        chunk.end = (i + 1 == workers) ? total_size - 1
                                       : static_cast<std::uint64_t>(i + 1) * base - 1;
        chunks.push_back(chunk);
    }
    return chunks;
}

std::filesystem::path partPath(const std::filesystem::path& final_path, std::size_t index) {
    std::filesystem::path part = final_path;
    part += ".part" + std::to_string(index);
    return part;
}

} // namespace rangefetch
