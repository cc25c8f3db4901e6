#include "rangefetch/job_state.hpp"

namespace rangefetch {

std::string_view to_string(JobState state) noexcept {
    switch (state) {
    case JobState::Init:
        return "init";
    case JobState::Resolving:
        return "resolving";
    case JobState::Planning:
        return "planning";
    case JobState::Fetching:
        return "fetching";
    case JobState::FallbackFetching:
        return "fallback_fetching";
    case JobState::Merging:
        return "merging";
    case JobState::Done:
        return "done";
    case JobState::Failed:
        return "failed";
    }
    return "unknown";
}

} // namespace rangefetch
