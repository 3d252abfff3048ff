#pragma once

#include "event_log.hpp"
#include "http_transport.hpp"
#include "progress.hpp"
#include "retry_policy.hpp"
#include "stop_signal.hpp"
#include "task_result.hpp"
#include "transfer_state.hpp"

#include <chrono>
#include <memory>

namespace batchdl {

struct TaskOptions {
    Timeouts timeouts;
    RetryPolicy retry{0, std::chrono::milliseconds{0}};
    std::chrono::milliseconds progress_interval{200};
    bool preserve_mtime{true};
};

class DownloadTask {
public:
    DownloadTask(TransferState state,
                 HttpTransport& transport,
                 const TaskOptions& options,
                 EventLog& log,
                 ProgressReporter& progress);
    ~DownloadTask();

    DownloadTask(const DownloadTask&) = delete;
    DownloadTask& operator=(const DownloadTask&) = delete;

    // Runs the transfer to a terminal status. Never throws for per-task failures.
    TaskResult run(const StopSignal& stop);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace batchdl
