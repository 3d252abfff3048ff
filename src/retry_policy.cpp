#include "batchdl/retry_policy.hpp"

#include <fmt/format.h>

namespace batchdl {

RetryPolicy::RetryPolicy(int retry_count, std::chrono::milliseconds retry_delay)
    : retry_count_(retry_count), retry_delay_(retry_delay) {
    if (retry_count_ < 0) {
        throw ConfigError(fmt::format("Invalid retry count: {}. Must be a non-negative integer.", retry_count_));
    }
    if (retry_delay_.count() < 0) {
        throw ConfigError(fmt::format("Invalid retry delay: {} ms. Must be non-negative.", retry_delay_.count()));
    }
}

bool RetryPolicy::isTransient(FailureKind kind) noexcept {
    switch (kind) {
    case FailureKind::TransientNetwork:
    case FailureKind::ServerOverload:
    case FailureKind::LengthMismatch:
        return true;
    default:
        return false;
    }
}

RetryDecision RetryPolicy::decide(int attempt, FailureKind kind) const noexcept {
    // The partial file is discarded and the fetch restarts at zero; this is not an attempt.
    if (kind == FailureKind::RangeMismatch) {
        return {true, std::chrono::milliseconds{0}};
    }
    if (!isTransient(kind) || attempt >= retry_count_) {
        return {false, std::chrono::milliseconds{0}};
    }
    return {true, retry_delay_};
}

} // namespace batchdl
