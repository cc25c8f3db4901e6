#pragma once

#include "http_transport.hpp"
#include "progress.hpp"

#include <cstdint>
#include <filesystem>
#include <string>

namespace rangefetch {

// One unranged streamed GET written straight to the final path. Used when the
// size is unknown or the server does not accept byte ranges.
class SingleStreamDownloader {
public:
    SingleStreamDownloader(HttpTransport& transport, JobProgress& progress);

    // `expected_size` of 0 means unknown; otherwise a short stream is a failure.
    // Throws TransferError or Error; a failed download leaves no file behind.
    // Returns the number of bytes written.
    std::uint64_t download(const std::string& url, const std::filesystem::path& final_path,
                           std::uint64_t expected_size = 0);

private:
    HttpTransport& transport_;
    JobProgress& progress_;
};

} // namespace rangefetch
