#include "batchdl/curl_transport.hpp"
#include "batchdl/detail/curl_utils.hpp"

#include <string>
#include <string_view>
#include <utility>

#include <curl/curl.h>

namespace batchdl {

namespace {

struct GetContext {
    CURL* curl{nullptr};
    const ResponseHandler* handler{nullptr};
    bool status_delivered{false};
    bool refused{false};
};

size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
    const size_t total = size * nitems;
    detail::parseHeaderLine(std::string_view(buffer, total), *static_cast<detail::ResponseHeaders*>(userdata));
    return total;
}

size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<GetContext*>(userdata);
    const size_t total = size * nmemb;

    if (!ctx->status_delivered) {
        ctx->status_delivered = true;
        long code = 0;
        curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &code);
        if (ctx->handler->on_status && !ctx->handler->on_status(code)) {
            ctx->refused = true;
            return 0;
        }
    }

    if (ctx->handler->on_body && !ctx->handler->on_body(ptr, total)) {
        ctx->refused = true;
        return 0;
    }
    return total;
}

int transferInfoCallback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* stop = static_cast<const StopSignal*>(clientp);
    return stop->stopRequested() ? 1 : 0;
}

void setCommonOptions(CURL* curl, const std::string& url, const Timeouts& timeouts, const std::string& user_agent) {
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent.c_str());
    curl_easy_setopt(curl, CURLOPT_FILETIME, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(timeouts.connect.count()));
    // Read timeout: abort when fewer than 1 byte/s arrives for `read` seconds.
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, static_cast<long>(timeouts.read.count()));
}

void watchStopSignal(CURL* curl, const StopSignal& stop) {
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, &transferInfoCallback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, const_cast<StopSignal*>(&stop));
}

std::optional<std::time_t> remoteFileTime(CURL* curl) {
    curl_off_t filetime = -1;
    if (curl_easy_getinfo(curl, CURLINFO_FILETIME_T, &filetime) != CURLE_OK || filetime < 0) {
        return std::nullopt;
    }
    return static_cast<std::time_t>(filetime);
}

} // namespace

CurlTransport::CurlTransport(std::string user_agent) : user_agent_(std::move(user_agent)) {
    detail::ensureCurlInitialized();
}

ProbeResult CurlTransport::probe(const std::string& url, const Timeouts& timeouts, const StopSignal& stop) {
    ProbeResult result;
    if (stop.stopRequested()) {
        result.transfer.error = TransportError::Cancelled;
        result.transfer.message = "Stop requested";
        return result;
    }

    detail::CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
    if (!curl) {
        result.transfer.error = TransportError::Other;
        result.transfer.message = "Failed to allocate curl handle";
        return result;
    }

    detail::ResponseHeaders headers;
    setCommonOptions(curl.get(), url, timeouts, user_agent_);
    curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, &headerCallback);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &headers);
    watchStopSignal(curl.get(), stop);

    const CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        result.transfer.error = detail::transferError(res, false);
        result.transfer.message = std::string{"curl error: "} + curl_easy_strerror(res);
        return result;
    }

    long code = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &code);
    result.transfer.http_status = code;
    result.remote.http_status = code;
    if (code < 200 || code >= 300) {
        return result;
    }

    curl_off_t length = -1;
    curl_easy_getinfo(curl.get(), CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length);
    result.remote.content_length = detail::declaredLength(length);
    result.remote.accepts_ranges = headers.acceptsRanges();
    result.remote.last_modified = remoteFileTime(curl.get());
    result.transfer.last_modified = result.remote.last_modified;
    return result;
}

TransportResult CurlTransport::get(const std::string& url,
                                   std::uint64_t offset,
                                   const Timeouts& timeouts,
                                   const ResponseHandler& handler,
                                   const StopSignal& stop) {
    TransportResult result;
    if (stop.stopRequested()) {
        result.error = TransportError::Cancelled;
        result.message = "Stop requested";
        return result;
    }

    detail::CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
    if (!curl) {
        result.error = TransportError::Other;
        result.message = "Failed to allocate curl handle";
        return result;
    }

    GetContext ctx{curl.get(), &handler};
    const std::string range = std::to_string(offset) + "-";

    setCommonOptions(curl.get(), url, timeouts, user_agent_);
    if (offset > 0) {
        curl_easy_setopt(curl.get(), CURLOPT_RANGE, range.c_str());
    }
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &writeCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);
    watchStopSignal(curl.get(), stop);

    const CURLcode res = curl_easy_perform(curl.get());

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &result.http_status);
    result.last_modified = remoteFileTime(curl.get());
    if (res != CURLE_OK) {
        result.error = detail::transferError(res, ctx.refused);
        result.message = std::string{"curl error: "} + curl_easy_strerror(res);
    }
    return result;
}

} // namespace batchdl
