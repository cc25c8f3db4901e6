#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <set>

namespace rangefetch {

// Output paths held by the jobs of one run. Jobs sharing a registry never
// write the same final file or the same part stores.
class OutputRegistry {
public:
    // Claims `desired`, or the first free "<stem> (N)<ext>" beside it when
    // another job already holds that path.
    [[nodiscard]] std::filesystem::path claim(const std::filesystem::path& desired);

    void release(const std::filesystem::path& path);

    [[nodiscard]] bool isClaimed(const std::filesystem::path& path) const;
    [[nodiscard]] std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::set<std::filesystem::path> claimed_;
};

using OutputRegistryPtr = std::shared_ptr<OutputRegistry>;

} // namespace rangefetch
