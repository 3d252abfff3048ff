#pragma once

#include "download_task.hpp"
#include "event_log.hpp"
#include "http_transport.hpp"
#include "progress.hpp"
#include "stop_signal.hpp"
#include "task_result.hpp"
#include "transfer_state.hpp"

#include <atomic>
#include <cstddef>
#include <deque>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace batchdl {

struct PoolOptions {
    int max_workers{1};
    std::filesystem::path downloads_folder;
    TaskOptions task;
};

class WorkerPool {
public:
    // Throws ConfigError when max_workers < 1.
    WorkerPool(PoolOptions options, HttpTransport& transport, EventLog& log, ProgressReporter& progress);

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    [[nodiscard]] RunSummary run(const std::vector<std::string>& urls);

    // Safe to call from any thread, before or during run().
    void requestStop();

    [[nodiscard]] static std::vector<std::filesystem::path> assignDestinations(
        const std::filesystem::path& folder, const std::vector<std::string>& urls);

private:
    void workerLoop();
    void recordResult(TaskResult result);

    PoolOptions options_;
    HttpTransport& transport_;
    EventLog& log_;
    ProgressReporter& progress_;
    StopSignal stop_;

    std::mutex queue_mutex_;
    std::deque<TransferState> queue_;

    std::atomic<std::size_t> completed_{0};
    std::atomic<std::size_t> failed_{0};
    std::mutex results_mutex_;
    std::vector<TaskResult> failures_;
};

} // namespace batchdl
