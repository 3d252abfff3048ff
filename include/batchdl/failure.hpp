#pragma once

#include <stdexcept>

namespace batchdl {

enum class FailureKind {
    TransientNetwork,
    ServerRejected,
    ServerOverload,
    RangeMismatch,
    LengthMismatch,
    FileSystem,
    InvalidUrl,
    Cancelled
};

const char* toString(FailureKind kind) noexcept;

[[nodiscard]] bool isSuccessStatus(long http_status) noexcept;

// Maps a non-success HTTP status to ServerOverload (5xx, 408, 429) or ServerRejected.
[[nodiscard]] FailureKind classifyHttpStatus(long http_status) noexcept;

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace batchdl
