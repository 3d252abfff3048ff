#include "batchdl/failure.hpp"
#include "batchdl/http_transport.hpp"

namespace batchdl {

const char* toString(FailureKind kind) noexcept {
    switch (kind) {
    case FailureKind::TransientNetwork:
        return "TransientNetwork";
    case FailureKind::ServerRejected:
        return "ServerRejected";
    case FailureKind::ServerOverload:
        return "ServerOverload";
    case FailureKind::RangeMismatch:
        return "RangeMismatch";
    case FailureKind::LengthMismatch:
        return "LengthMismatch";
    case FailureKind::FileSystem:
        return "FileSystem";
    case FailureKind::InvalidUrl:
        return "InvalidUrl";
    case FailureKind::Cancelled:
        return "Cancelled";
    }
    return "Unknown";
}

bool isSuccessStatus(long http_status) noexcept {
    return http_status >= 200 && http_status < 300;
}

FailureKind classifyHttpStatus(long http_status) noexcept {
    if (http_status >= 500 || http_status == 408 || http_status == 429) {
        return FailureKind::ServerOverload;
    }
    return FailureKind::ServerRejected;
}

FailureKind failureFromTransport(TransportError error) noexcept {
    switch (error) {
    case TransportError::Cancelled:
        return FailureKind::Cancelled;
    case TransportError::BadUrl:
        return FailureKind::InvalidUrl;
    case TransportError::Rejected:
        return FailureKind::ServerRejected;
    case TransportError::None:
    case TransportError::ConnectFailed:
    case TransportError::TimedOut:
    case TransportError::Aborted:
    case TransportError::Other:
        break;
    }
    return FailureKind::TransientNetwork;
}

} // namespace batchdl
