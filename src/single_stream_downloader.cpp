#include "rangefetch/single_stream_downloader.hpp"
#include "rangefetch/detail/file_utils.hpp"
#include "rangefetch/detail/scope_exit.hpp"
#include "rangefetch/errors.hpp"

#include <cstdio>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace rangefetch {

namespace {
constexpr std::size_t kWriteBufferSize = 1024 * 1024;
} // namespace

SingleStreamDownloader::SingleStreamDownloader(HttpTransport& transport, JobProgress& progress)
    : transport_(transport), progress_(progress) {}

std::uint64_t SingleStreamDownloader::download(const std::string& url,
                                               const std::filesystem::path& final_path,
                                               std::uint64_t expected_size) {
    detail::FilePtr file = detail::openFile(final_path, "wb");
    if (!file) {
        throw Error(fmt::format("cannot create {}", final_path.string()));
    }
    std::setvbuf(file.get(), nullptr, _IOFBF, kWriteBufferSize);

    auto discard = detail::makeScopeExit([&] {
        file.reset();
        spdlog::warn("Removing incomplete {}", final_path.string());
        detail::removeQuietly(final_path);
    });

    std::uint64_t written = 0;
    bool write_failed = false;
    const BodySink sink = [&](const char* data, std::size_t size) {
        if (std::fwrite(data, 1, size, file.get()) != size) {
            write_failed = true;
            return false;
        }
        written += size;
        progress_.add(size);
        return true;
    };

    try {
        transport_.stream(url, std::nullopt, sink);
    } catch (const TransferError&) {
        if (write_failed) {
            throw Error(fmt::format("cannot write {}", final_path.string()));
        }
        throw;
    }

    if (expected_size > 0 && written != expected_size) {
        throw TransferError(
            fmt::format("stream ended after {} of {} bytes", written, expected_size));
    }
    if (!detail::closeFile(file)) {
        throw Error(fmt::format("cannot finish {}", final_path.string()));
    }
    discard.dismiss();
    return written;
}

} // namespace rangefetch
