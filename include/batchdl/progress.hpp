#pragma once

#include "task_result.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace batchdl {

struct Progress {
    std::size_t task_id{0};
    std::string url;
    std::string filename;
    std::optional<std::uint64_t> total_bytes;
    std::uint64_t downloaded_bytes{0};
};

// Receives progress from worker threads; implementations must be thread-safe.
class ProgressReporter {
public:
    virtual ~ProgressReporter() = default;

    virtual void onProgress(const Progress& progress) = 0;
    virtual void onTaskFinished(const TaskResult& result) = 0;
};

class NullProgressReporter final : public ProgressReporter {
public:
    void onProgress(const Progress&) override {}
    void onTaskFinished(const TaskResult&) override {}
};

} // namespace batchdl
