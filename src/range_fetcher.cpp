#include "batchdl/range_fetcher.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <utility>

#include <fmt/format.h>

namespace batchdl {

namespace {

FetchOutcome failed(FailureKind kind, std::string message) {
    FetchOutcome outcome;
    outcome.failure = kind;
    outcome.message = std::move(message);
    return outcome;
}

} // namespace

RangeFetcher::RangeFetcher(HttpTransport& transport, Timeouts timeouts)
    : transport_(transport), timeouts_(timeouts) {}

FetchOutcome RangeFetcher::fetch(const FetchRequest& request,
                                 detail::FilePtr file,
                                 const ProgressFn& on_progress,
                                 const StopSignal& stop) const {
    if (!file) {
        return failed(FailureKind::FileSystem, "Destination file is not open");
    }

    const bool range_requested = request.offset > 0;
    bool range_ignored = false;
    bool status_rejected = false;
    bool write_failed = false;
    bool overflow = false;
    std::string write_error;
    std::uint64_t written = 0;

    ResponseHandler handler;
    handler.on_status = [&](long status) {
        // A full body (200) or 416 answering a range request cannot be appended safely.
        if (range_requested && (status == 200 || status == 416)) {
            range_ignored = true;
            return false;
        }
        if (!isSuccessStatus(status)) {
            status_rejected = true;
            return false;
        }
        return true;
    };
    handler.on_body = [&](const char* data, std::size_t size) {
        while (size > 0) {
            const std::size_t chunk = std::min(size, kChunkSize);
            if (request.expected_total && request.offset + written + chunk > *request.expected_total) {
                overflow = true;
                return false;
            }
            if (std::fwrite(data, 1, chunk, file.get()) != chunk) {
                write_failed = true;
                write_error = std::strerror(errno);
                return false;
            }
            written += chunk;
            data += chunk;
            size -= chunk;
            if (on_progress) {
                on_progress(written);
            }
        }
        return true;
    };

    const TransportResult result = transport_.get(request.url, request.offset, timeouts_, handler, stop);

    if (std::fflush(file.get()) != 0 && !write_failed) {
        write_failed = true;
        write_error = std::strerror(errno);
    }
    if (std::fclose(file.release()) != 0 && !write_failed) {
        write_failed = true;
        write_error = std::strerror(errno);
    }

    FetchOutcome outcome;
    outcome.bytes_written = written;
    outcome.last_modified = result.last_modified;

    if (write_failed) {
        outcome.failure = FailureKind::FileSystem;
        outcome.message = fmt::format("Failed to write output file: {}", write_error);
        return outcome;
    }
    if (overflow) {
        outcome.failure = FailureKind::LengthMismatch;
        outcome.message = fmt::format("Server sent more than the declared {} bytes", *request.expected_total);
        return outcome;
    }

    const bool status_ignores_range = range_requested && (result.http_status == 200 || result.http_status == 416);
    if (range_ignored || (result.error == TransportError::None && status_ignores_range)) {
        outcome.failure = FailureKind::RangeMismatch;
        outcome.message = fmt::format("Range request from offset {} answered with status {}",
                                      request.offset, result.http_status);
        return outcome;
    }
    if (status_rejected || (result.http_status != 0 && !isSuccessStatus(result.http_status))) {
        outcome.failure = classifyHttpStatus(result.http_status);
        outcome.message = fmt::format("Download failed with status code {}", result.http_status);
        return outcome;
    }

    if (result.error == TransportError::Cancelled) {
        outcome.failure = FailureKind::Cancelled;
        outcome.message = "Transfer cancelled";
        return outcome;
    }
    if (result.error != TransportError::None) {
        outcome.failure = failureFromTransport(result.error);
        outcome.message = result.message.empty() ? "Network error" : result.message;
        return outcome;
    }

    if (request.expected_total && request.offset + written < *request.expected_total) {
        outcome.failure = FailureKind::TransientNetwork;
        outcome.message = fmt::format("Transfer ended early at {} of {} bytes",
                                      request.offset + written, *request.expected_total);
        return outcome;
    }

    outcome.ok = true;
    return outcome;
}

} // namespace batchdl
