#pragma once

#include "chunk.hpp"
#include "http_transport.hpp"
#include "progress.hpp"

#include <filesystem>
#include <string>

namespace rangefetch {

// Transfers one chunk into its own part store. Never throws: every failure is
// reported through ChunkResult and leaves no part store behind.
class ChunkFetcher {
public:
    ChunkFetcher(HttpTransport& transport, JobProgress& progress);

    [[nodiscard]] ChunkResult fetch(const std::string& url, const ChunkSpec& chunk,
                                    const std::filesystem::path& part_path) noexcept;

private:
    void transfer(const std::string& url, const ChunkSpec& chunk,
                  const std::filesystem::path& part_path);

    HttpTransport& transport_;
    JobProgress& progress_;
};

} // namespace rangefetch
