#pragma once

#include "batchdl/http_transport.hpp"

#include <curl/curl.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace batchdl::detail {

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

// Runs curl_global_init once per process; throws std::runtime_error on failure.
void ensureCurlInitialized();

[[nodiscard]] TransportError classifyCurlCode(CURLcode code) noexcept;

// Error of a finished curl_easy_perform. `refused` is set when a ResponseHandler callback declined the data.
[[nodiscard]] TransportError transferError(CURLcode code, bool refused) noexcept;

// Headers of the last response seen; redirect hops reset it.
struct ResponseHeaders {
    bool saw_accept_ranges{false};
    std::string accept_ranges;

    // Absent or "bytes" counts as range support.
    [[nodiscard]] bool acceptsRanges() const { return !saw_accept_ranges || accept_ranges == "bytes"; }
};

void parseHeaderLine(std::string_view line, ResponseHeaders& headers);

// A HEAD reporting zero or no length leaves the size undeclared.
[[nodiscard]] std::optional<std::uint64_t> declaredLength(curl_off_t length) noexcept;

} // namespace batchdl::detail
