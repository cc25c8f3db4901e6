#pragma once

#include <cstddef>
#include <filesystem>

namespace rangefetch {

// Concatenates <final>.part0 .. <final>.part<N-1> into <final>, in index order.
class MergeAssembler {
public:
    // Throws MergeIntegrityError when a part is missing or unreadable and Error
    // when the final file cannot be written; no final file survives a failure.
    // Part stores are removed on every exit path.
    void merge(const std::filesystem::path& final_path, std::size_t part_count) const;

    // Removes whatever part stores of this job still exist. Missing parts are
    // not an error, so calling it twice is harmless. Returns the number removed.
    static std::size_t removeParts(const std::filesystem::path& final_path,
                                   std::size_t part_count) noexcept;
};

} // namespace rangefetch
