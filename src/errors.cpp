#include "rangefetch/errors.hpp"

#include <fmt/format.h>

namespace rangefetch {

ChunkTransferError::ChunkTransferError(std::size_t chunk_index, const std::string& message)
    : TransferError(fmt::format("chunk {}: {}", chunk_index, message)),
      chunk_index_(chunk_index) {}

JobAbortedError::JobAbortedError(std::size_t failed_chunks, std::size_t total_chunks)
    : Error(fmt::format("{} of {} chunks failed", failed_chunks, total_chunks)),
      failed_chunks_(failed_chunks),
      total_chunks_(total_chunks) {}

} // namespace rangefetch
