#pragma once

#include <utility>

namespace rangefetch::detail {

// Runs a callable when the scope is left, unless dismissed first.
template <typename FunctionT>
class ScopeExit {
public:
    explicit ScopeExit(FunctionT&& function) : function_(std::forward<FunctionT>(function)) {}

    ScopeExit(const ScopeExit&) = delete;
    ScopeExit& operator=(const ScopeExit&) = delete;

    ~ScopeExit() {
        if (active_) {
            function_();
        }
    }

    void dismiss() noexcept { active_ = false; }

private:
    FunctionT function_;
    bool active_{true};
};

template <typename FunctionT>
ScopeExit<FunctionT> makeScopeExit(FunctionT&& function) {
    return ScopeExit<FunctionT>(std::forward<FunctionT>(function));
}

} // namespace rangefetch::detail
