#pragma once

#include "failure.hpp"
#include "transfer_state.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace batchdl {

struct TaskResult {
    std::size_t task_id{0};
    std::string url;
    std::filesystem::path destination;
    TransferStatus status{TransferStatus::Pending};
    std::optional<FailureKind> failure;
    std::string message;
    std::uint64_t bytes_downloaded{0};
    std::optional<std::uint64_t> bytes_expected;
    int attempts{0};
    bool already_complete{false};

    [[nodiscard]] bool succeeded() const noexcept { return status == TransferStatus::Completed; }
};

struct RunSummary {
    std::size_t completed{0};
    std::size_t failed{0};
    std::vector<TaskResult> failures;
    std::vector<std::string> not_started;

    [[nodiscard]] bool allSucceeded() const noexcept { return failed == 0 && not_started.empty(); }
};

} // namespace batchdl
