#pragma once

#include <cstdint>
#include <string>

namespace rangefetch {

// Name used when the resolved URL carries no usable file name.
inline constexpr const char* kPlaceholderFileName = "unknown_file";

struct DownloadTarget {
    std::string direct_url;
    std::string file_name;
    std::uint64_t total_size{0};
    bool supports_ranges{false};

    // Chunked transfer needs both a known size and byte-range support.
    [[nodiscard]] bool supportsChunking() const noexcept {
        return total_size > 0 && supports_ranges;
    }
};

} // namespace rangefetch
