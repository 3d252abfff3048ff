#include "batchdl/worker_pool.hpp"
#include "batchdl/failure.hpp"
#include "batchdl/url_list.hpp"

#include <algorithm>
#include <optional>
#include <set>
#include <thread>
#include <utility>

#include <fmt/format.h>

namespace batchdl {

WorkerPool::WorkerPool(PoolOptions options, HttpTransport& transport, EventLog& log, ProgressReporter& progress)
    : options_(std::move(options)), transport_(transport), log_(log), progress_(progress) {
    if (options_.max_workers < 1) {
        throw ConfigError(fmt::format("max_workers must be a positive integer, got {}", options_.max_workers));
    }
}

std::vector<std::filesystem::path> WorkerPool::assignDestinations(const std::filesystem::path& folder,
                                                                  const std::vector<std::string>& urls) {
    std::vector<std::filesystem::path> destinations;
    destinations.reserve(urls.size());
    std::set<std::string> taken;

    for (const auto& url : urls) {
        std::string name = fileNameFromUrl(url);
        const std::filesystem::path subfolder = subfolderFor(name);
        if (!taken.insert((subfolder / name).string()).second) {
            const std::filesystem::path base{name};
            const std::string stem = base.stem().string();
            const std::string extension = base.extension().string();
            for (int n = 1;; ++n) {
                std::string candidate = fmt::format("{} ({}){}", stem, n, extension);
                if (taken.insert((subfolder / candidate).string()).second) {
                    name = std::move(candidate);
                    break;
                }
            }
        }
        destinations.push_back(subfolder.empty() ? folder / name : folder / subfolder / name);
    }
    return destinations;
}

RunSummary WorkerPool::run(const std::vector<std::string>& urls) {
    RunSummary summary;
    if (urls.empty()) {
        log_.runSummary(summary);
        return summary;
    }

    completed_ = 0;
    failed_ = 0;
    {
        std::lock_guard<std::mutex> lock(results_mutex_);
        failures_.clear();
    }

    const auto destinations = assignDestinations(options_.downloads_folder, urls);
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        queue_.clear();
        for (std::size_t i = 0; i < urls.size(); ++i) {
            queue_.emplace_back(i, urls[i], destinations[i]);
        }
    }

    const std::size_t worker_count = std::min(static_cast<std::size_t>(options_.max_workers), urls.size());
    std::vector<std::thread> workers;
    workers.reserve(worker_count);
    try {
        for (std::size_t i = 0; i < worker_count; ++i) {
            workers.emplace_back([this]() { workerLoop(); });
        }
    } catch (...) {
        requestStop();
        for (auto& worker : workers) {
            worker.join();
        }
        throw;
    }

    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }

    summary.completed = completed_.load();
    summary.failed = failed_.load();
    {
        std::lock_guard<std::mutex> lock(results_mutex_);
        summary.failures = std::move(failures_);
        failures_.clear();
    }
    std::sort(summary.failures.begin(), summary.failures.end(),
              [](const TaskResult& a, const TaskResult& b) { return a.task_id < b.task_id; });
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        for (const auto& state : queue_) {
            summary.not_started.push_back(state.url);
        }
        queue_.clear();
    }

    log_.runSummary(summary);
    return summary;
}

void WorkerPool::requestStop() { stop_.requestStop(); }

void WorkerPool::workerLoop() {
    while (!stop_.stopRequested()) {
        std::optional<TransferState> next;
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            if (queue_.empty()) {
                return;
            }
            next.emplace(std::move(queue_.front()));
            queue_.pop_front();
        }

        DownloadTask task(std::move(*next), transport_, options_.task, log_, progress_);
        recordResult(task.run(stop_));
    }
}

void WorkerPool::recordResult(TaskResult result) {
    if (result.succeeded()) {
        ++completed_;
    } else {
        ++failed_;
    }

    std::lock_guard<std::mutex> lock(results_mutex_);
    progress_.onTaskFinished(result);
    if (!result.succeeded()) {
        failures_.push_back(std::move(result));
    }
}

} // namespace batchdl
