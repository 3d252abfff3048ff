#include "batchdl/transfer_state.hpp"

#include <stdexcept>
#include <utility>

#include <fmt/format.h>

namespace batchdl {

const char* toString(TransferStatus status) noexcept {
    switch (status) {
    case TransferStatus::Pending:
        return "Pending";
    case TransferStatus::InProgress:
        return "InProgress";
    case TransferStatus::Completed:
        return "Completed";
    case TransferStatus::Failed:
        return "Failed";
    }
    return "Unknown";
}

TransferState::TransferState(std::size_t id, std::string source_url, std::filesystem::path destination_path)
    : task_id(id),
      url(std::move(source_url)),
      destination(std::move(destination_path)) {}

void TransferState::advance(TransferStatus next) {
    const bool allowed =
        (status == TransferStatus::Pending && next == TransferStatus::InProgress) ||
        (status == TransferStatus::InProgress &&
         (next == TransferStatus::Completed || next == TransferStatus::Failed));
    if (!allowed) {
        throw std::logic_error(fmt::format("Illegal transfer transition {} -> {} for {}",
                                           toString(status), toString(next), url));
    }
    status = next;
}

bool TransferState::isTerminal() const noexcept {
    return status == TransferStatus::Completed || status == TransferStatus::Failed;
}

} // namespace batchdl
