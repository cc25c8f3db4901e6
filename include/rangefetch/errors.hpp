#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace rangefetch {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Transport or HTTP-status failure of a single request.
class TransferError : public Error {
public:
    using Error::Error;
};

class ChunkTransferError : public TransferError {
public:
    ChunkTransferError(std::size_t chunk_index, const std::string& message);

    [[nodiscard]] std::size_t chunkIndex() const noexcept { return chunk_index_; }

private:
    std::size_t chunk_index_;
};

class ResolutionError : public Error {
public:
    using Error::Error;
};

class JobAbortedError : public Error {
public:
    JobAbortedError(std::size_t failed_chunks, std::size_t total_chunks);

    [[nodiscard]] std::size_t failedChunks() const noexcept { return failed_chunks_; }
    [[nodiscard]] std::size_t totalChunks() const noexcept { return total_chunks_; }

private:
    std::size_t failed_chunks_;
    std::size_t total_chunks_;
};

class MergeIntegrityError : public Error {
public:
    using Error::Error;
};

} // namespace rangefetch
