#include "rangefetch/chunk_fetcher.hpp"
#include "rangefetch/detail/file_utils.hpp"
#include "rangefetch/errors.hpp"

#include <cstdio>
#include <exception>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace rangefetch {

namespace {
constexpr std::size_t kWriteBufferSize = 1024 * 1024;
} // namespace

ChunkFetcher::ChunkFetcher(HttpTransport& transport, JobProgress& progress)
    : transport_(transport), progress_(progress) {}

ChunkResult ChunkFetcher::fetch(const std::string& url, const ChunkSpec& chunk,
                                const std::filesystem::path& part_path) noexcept {
    ChunkResult result;
    result.index = chunk.index;
    try {
        transfer(url, chunk, part_path);
        result.success = true;
    } catch (const ChunkTransferError& ex) {
        result.index = ex.chunkIndex();
        result.error = ex.what();
        spdlog::warn("Chunk {} [{}-{}] failed: {}", ex.chunkIndex(), chunk.start, chunk.end,
                     result.error);
        detail::removeQuietly(part_path);
    } catch (const std::exception& ex) {
        result.error = ex.what();
        spdlog::warn("Chunk {} [{}-{}] failed: {}", chunk.index, chunk.start, chunk.end,
                     result.error);
        detail::removeQuietly(part_path);
    }
    return result;
}

void ChunkFetcher::transfer(const std::string& url, const ChunkSpec& chunk,
                            const std::filesystem::path& part_path) {
    detail::FilePtr file = detail::openFile(part_path, "wb");
    if (!file) {
        throw ChunkTransferError(chunk.index,
                                 fmt::format("cannot create part file {}", part_path.string()));
    }
    std::setvbuf(file.get(), nullptr, _IOFBF, kWriteBufferSize);

    if (!chunk.empty()) {
        const std::uint64_t expected = chunk.length();
        std::uint64_t written = 0;
        std::string sink_error;

        const BodySink sink = [&](const char* data, std::size_t size) {
            if (written + size > expected) {
                sink_error = fmt::format("server sent more than the requested {} bytes", expected);
                return false;
            }
            if (std::fwrite(data, 1, size, file.get()) != size) {
                sink_error = fmt::format("cannot write part file {}", part_path.string());
                return false;
            }
            written += size;
            progress_.add(size);
            return true;
        };

        long status = 0;
        try {
            status = transport_.stream(url, ByteRange{chunk.start, chunk.end}, sink);
        } catch (const TransferError& ex) {
            throw ChunkTransferError(chunk.index, sink_error.empty() ? ex.what() : sink_error);
        }

        if (status != 206) {
            spdlog::debug("Chunk {} [{}-{}] answered HTTP {} instead of 206", chunk.index,
                          chunk.start, chunk.end, status);
        }

        if (written != expected) {
            throw ChunkTransferError(
                chunk.index, fmt::format("incomplete range: received {} of {} bytes", written,
                                         expected));
        }
    }

    if (!detail::closeFile(file)) {
        throw ChunkTransferError(chunk.index,
                                 fmt::format("cannot finish part file {}", part_path.string()));
    }
    spdlog::debug("Chunk {} [{}-{}] complete", chunk.index, chunk.start, chunk.end);
}

} // namespace rangefetch
