#pragma once

#include "failure.hpp"

#include <chrono>

namespace batchdl {

struct RetryDecision {
    bool should_retry{false};
    std::chrono::milliseconds delay{0};
};

class RetryPolicy {
public:
    RetryPolicy(int retry_count, std::chrono::milliseconds retry_delay);

    // `attempt` is the zero-based index of the attempt that just failed.
    [[nodiscard]] RetryDecision decide(int attempt, FailureKind kind) const noexcept;

    [[nodiscard]] static bool isTransient(FailureKind kind) noexcept;

private:
    int retry_count_;
    std::chrono::milliseconds retry_delay_;
};

} // namespace batchdl
