#include <catch2/catch.hpp>

#include "batchdl/detail/curl_utils.hpp"
#include "batchdl/retry_policy.hpp"

using namespace batchdl;
using namespace batchdl::detail;

TEST_CASE("curl codes for unreachable hosts and timeouts are retryable", "[curl]") {
    CHECK(classifyCurlCode(CURLE_OK) == TransportError::None);
    CHECK(classifyCurlCode(CURLE_COULDNT_RESOLVE_HOST) == TransportError::ConnectFailed);
    CHECK(classifyCurlCode(CURLE_COULDNT_CONNECT) == TransportError::ConnectFailed);
    CHECK(classifyCurlCode(CURLE_OPERATION_TIMEDOUT) == TransportError::TimedOut);
    CHECK(classifyCurlCode(CURLE_RECV_ERROR) == TransportError::Other);

    for (const auto code : {CURLE_COULDNT_RESOLVE_HOST, CURLE_OPERATION_TIMEDOUT, CURLE_RECV_ERROR}) {
        CHECK(RetryPolicy::isTransient(failureFromTransport(classifyCurlCode(code))));
    }
}

TEST_CASE("curl codes a retry cannot fix are permanent", "[curl]") {
    CHECK(classifyCurlCode(CURLE_UNSUPPORTED_PROTOCOL) == TransportError::BadUrl);
    CHECK(classifyCurlCode(CURLE_URL_MALFORMAT) == TransportError::BadUrl);
    CHECK(classifyCurlCode(CURLE_PEER_FAILED_VERIFICATION) == TransportError::Rejected);
    CHECK(classifyCurlCode(CURLE_TOO_MANY_REDIRECTS) == TransportError::Rejected);
    CHECK(classifyCurlCode(CURLE_LOGIN_DENIED) == TransportError::Rejected);

    CHECK(failureFromTransport(TransportError::BadUrl) == FailureKind::InvalidUrl);
    CHECK(failureFromTransport(TransportError::Rejected) == FailureKind::ServerRejected);
    for (const auto code : {CURLE_UNSUPPORTED_PROTOCOL, CURLE_PEER_FAILED_VERIFICATION, CURLE_TOO_MANY_REDIRECTS}) {
        CHECK_FALSE(RetryPolicy::isTransient(failureFromTransport(classifyCurlCode(code))));
    }
}

TEST_CASE("callback aborts are told apart from stop requests and broken writes", "[curl]") {
    CHECK(transferError(CURLE_OK, false) == TransportError::None);
    CHECK(transferError(CURLE_WRITE_ERROR, true) == TransportError::Aborted);
    CHECK(transferError(CURLE_WRITE_ERROR, false) == TransportError::Other);
    CHECK(transferError(CURLE_ABORTED_BY_CALLBACK, false) == TransportError::Cancelled);
    CHECK(transferError(CURLE_OPERATION_TIMEDOUT, false) == TransportError::TimedOut);
    CHECK(failureFromTransport(TransportError::Cancelled) == FailureKind::Cancelled);
}

TEST_CASE("Accept-Ranges header is read case-insensitively", "[curl]") {
    ResponseHeaders headers;
    CHECK(headers.acceptsRanges());

    parseHeaderLine("HTTP/1.1 200 OK\r\n", headers);
    parseHeaderLine("Content-Length: 42\r\n", headers);
    parseHeaderLine("accept-RANGES:  None \r\n", headers);
    CHECK(headers.saw_accept_ranges);
    CHECK(headers.accept_ranges == "none");
    CHECK_FALSE(headers.acceptsRanges());

    parseHeaderLine("Accept-Ranges: Bytes\r\n", headers);
    CHECK(headers.acceptsRanges());
}

TEST_CASE("each redirect hop starts a fresh header block", "[curl]") {
    ResponseHeaders headers;
    parseHeaderLine("HTTP/1.1 302 Found\r\n", headers);
    parseHeaderLine("Accept-Ranges: none\r\n", headers);
    parseHeaderLine("Location: https://mirror/file.bin\r\n", headers);
    parseHeaderLine("\r\n", headers);
    CHECK_FALSE(headers.acceptsRanges());

    parseHeaderLine("HTTP/2 200\r\n", headers);
    parseHeaderLine("content-type: application/octet-stream\r\n", headers);
    CHECK_FALSE(headers.saw_accept_ranges);
    CHECK(headers.acceptsRanges());
}

TEST_CASE("zero or missing length from HEAD is undeclared", "[curl]") {
    CHECK_FALSE(declaredLength(-1).has_value());
    CHECK_FALSE(declaredLength(0).has_value());
    REQUIRE(declaredLength(4096).has_value());
    CHECK(*declaredLength(4096) == 4096);
}
