#pragma once

#include "failure.hpp"
#include "stop_signal.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <ctime>
#include <functional>
#include <optional>
#include <string>

namespace batchdl {

struct Timeouts {
    std::chrono::seconds connect{30};
    // Maximum time without receiving a single byte.
    std::chrono::seconds read{30};
};

enum class TransportError {
    None,
    ConnectFailed,
    TimedOut,
    Aborted,     // a ResponseHandler callback refused the response
    Cancelled,   // the StopSignal fired
    BadUrl,      // malformed URL or unsupported scheme
    Rejected,    // refused by the peer in a way a retry cannot fix (TLS, login, redirect loop)
    Other
};

struct TransportResult {
    TransportError error{TransportError::None};
    long http_status{0};
    std::string message;
    std::optional<std::time_t> last_modified;
};

struct RemoteInfo {
    long http_status{0};
    std::optional<std::uint64_t> content_length;
    bool accepts_ranges{false};
    std::optional<std::time_t> last_modified;
};

struct ProbeResult {
    TransportResult transfer;
    RemoteInfo remote;
};

struct ResponseHandler {
    // Called once with the final status before the first body chunk. Returning false aborts.
    std::function<bool(long http_status)> on_status;
    // Returning false aborts the transfer.
    std::function<bool(const char* data, std::size_t size)> on_body;
};

class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    // HEAD `url`. Aborts with TransportError::Cancelled once `stop` fires.
    [[nodiscard]] virtual ProbeResult probe(const std::string& url,
                                            const Timeouts& timeouts,
                                            const StopSignal& stop) = 0;

    // GET `url`, with `Range: bytes=<offset>-` when offset > 0.
    [[nodiscard]] virtual TransportResult get(const std::string& url,
                                              std::uint64_t offset,
                                              const Timeouts& timeouts,
                                              const ResponseHandler& handler,
                                              const StopSignal& stop) = 0;
};

// Failure kind of a transfer that ended with `error` before a usable HTTP status.
[[nodiscard]] FailureKind failureFromTransport(TransportError error) noexcept;

} // namespace batchdl
