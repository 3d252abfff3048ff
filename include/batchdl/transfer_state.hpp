#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace batchdl {

enum class TransferStatus {
    Pending,
    InProgress,
    Completed,
    Failed
};

const char* toString(TransferStatus status) noexcept;

struct TransferState {
    TransferState(std::size_t id, std::string source_url, std::filesystem::path destination_path);

    // Moves status forward; throws std::logic_error on any backward or repeated transition.
    void advance(TransferStatus next);
    [[nodiscard]] bool isTerminal() const noexcept;

    std::size_t task_id{0};
    std::string url;
    std::filesystem::path destination;
    std::optional<std::uint64_t> bytes_expected;
    std::uint64_t bytes_downloaded{0};
    int attempt{0};
    TransferStatus status{TransferStatus::Pending};
};

} // namespace batchdl
