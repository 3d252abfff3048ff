#pragma once

#include "http_transport.hpp"

#include <cstdint>
#include <filesystem>
#include <system_error>

namespace batchdl {

struct ResumePlan {
    std::uint64_t offset{0};
    bool truncate{true};
    bool already_complete{false};
    std::uint64_t local_size{0};
};

/**
 * Decides where a transfer continues from.
 *
 * Resuming needs a declared total length and range support. Without both the
 * transfer restarts at zero and the partial file is truncated. A local file at
 * least as large as the declared total is taken as complete.
 *
 * `ec` is set when the destination exists but is not a readable regular file.
 */
[[nodiscard]] ResumePlan planResume(const std::filesystem::path& destination,
                                    const RemoteInfo& remote,
                                    std::error_code& ec);

} // namespace batchdl
