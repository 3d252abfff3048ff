#pragma once

#include "detail/file_utils.hpp"
#include "failure.hpp"
#include "http_transport.hpp"

#include <cstddef>
#include <cstdint>
#include <ctime>
#include <functional>
#include <optional>
#include <string>

namespace batchdl {

struct FetchRequest {
    std::string url;
    std::uint64_t offset{0};
    std::optional<std::uint64_t> expected_total;
};

struct FetchOutcome {
    bool ok{false};
    FailureKind failure{FailureKind::TransientNetwork};
    std::uint64_t bytes_written{0};
    std::string message;
    std::optional<std::time_t> last_modified;
};

class RangeFetcher {
public:
    // Receives the number of bytes written by this fetch so far.
    using ProgressFn = std::function<void(std::uint64_t bytes_written)>;

    static constexpr std::size_t kChunkSize = 8192;

    RangeFetcher(HttpTransport& transport, Timeouts timeouts);

    // Streams the response body into `file`, which must be positioned at
    // `request.offset`. The file is flushed and closed before returning.
    [[nodiscard]] FetchOutcome fetch(const FetchRequest& request,
                                     detail::FilePtr file,
                                     const ProgressFn& on_progress,
                                     const StopSignal& stop) const;

private:
    HttpTransport& transport_;
    Timeouts timeouts_;
};

} // namespace batchdl
