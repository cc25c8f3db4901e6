#pragma once

#include <string_view>

namespace rangefetch {

enum class JobState {
    Init,
    Resolving,
    Planning,
    Fetching,
    FallbackFetching,
    Merging,
    Done,
    Failed,
};

[[nodiscard]] std::string_view to_string(JobState state) noexcept;

} // namespace rangefetch
