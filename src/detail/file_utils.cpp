#include "rangefetch/detail/file_utils.hpp"

#include <system_error>

#include <spdlog/spdlog.h>

namespace rangefetch::detail {

FilePtr openFile(const std::filesystem::path& path, const char* mode) {
    return FilePtr{std::fopen(path.c_str(), mode)};
}

bool closeFile(FilePtr& file) noexcept {
    if (!file) {
        return false;
    }
    const bool flushed = std::fflush(file.get()) == 0;
    const bool closed = std::fclose(file.release()) == 0;
    return flushed && closed;
}

bool removeQuietly(const std::filesystem::path& path) noexcept {
    std::error_code ec;
    const bool removed = std::filesystem::remove(path, ec);
    if (ec) {
        spdlog::warn("Cannot remove {}: {}", path.string(), ec.message());
        return false;
    }
    return removed;
}

} // namespace rangefetch::detail
