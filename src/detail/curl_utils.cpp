#include "batchdl/detail/curl_utils.hpp"
#include "batchdl/detail/string_utils.hpp"

#include <cstdlib>
#include <mutex>
#include <stdexcept>

namespace batchdl::detail {

void ensureCurlInitialized() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("Failed to initialize libcurl");
        }
        std::atexit([] { curl_global_cleanup(); });
    });
}

TransportError classifyCurlCode(CURLcode code) noexcept {
    switch (code) {
    case CURLE_OK:
        return TransportError::None;
    case CURLE_COULDNT_RESOLVE_HOST:
    case CURLE_COULDNT_RESOLVE_PROXY:
    case CURLE_COULDNT_CONNECT:
    case CURLE_SSL_CONNECT_ERROR:
        return TransportError::ConnectFailed;
    case CURLE_OPERATION_TIMEDOUT:
        return TransportError::TimedOut;
    case CURLE_ABORTED_BY_CALLBACK:
        return TransportError::Cancelled;
    case CURLE_WRITE_ERROR:
        return TransportError::Aborted;
    case CURLE_UNSUPPORTED_PROTOCOL:
    case CURLE_URL_MALFORMAT:
        return TransportError::BadUrl;
    case CURLE_PEER_FAILED_VERIFICATION:
    case CURLE_SSL_CERTPROBLEM:
    case CURLE_SSL_CACERT_BADFILE:
    case CURLE_TOO_MANY_REDIRECTS:
    case CURLE_LOGIN_DENIED:
    case CURLE_REMOTE_ACCESS_DENIED:
        return TransportError::Rejected;
    default:
        return TransportError::Other;
    }
}

TransportError transferError(CURLcode code, bool refused) noexcept {
    if (code == CURLE_OK) {
        return TransportError::None;
    }
    if (refused) {
        return TransportError::Aborted;
    }
    // A write error nobody asked for is a broken transfer, not a refusal.
    if (code == CURLE_WRITE_ERROR) {
        return TransportError::Other;
    }
    return classifyCurlCode(code);
}

void parseHeaderLine(std::string_view line, ResponseHeaders& headers) {
    if (line.rfind("HTTP/", 0) == 0) {
        headers = ResponseHeaders{};
        return;
    }

    const auto colon = line.find(':');
    if (colon == std::string_view::npos) {
        return;
    }
    const std::string name{line.substr(0, colon)};
    if (toLower(trim(name)) == "accept-ranges") {
        headers.saw_accept_ranges = true;
        headers.accept_ranges = toLower(trim(std::string{line.substr(colon + 1)}));
    }
}

std::optional<std::uint64_t> declaredLength(curl_off_t length) noexcept {
    if (length <= 0) {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(length);
}

} // namespace batchdl::detail
