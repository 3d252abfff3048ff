#pragma once

#include "batchdl/event_log.hpp"
#include "batchdl/progress.hpp"
#include "batchdl/task_result.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <mutex>
#include <random>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

namespace batchdl::testing {

namespace fs = std::filesystem;

class TempDir {
public:
    TempDir() {
        std::random_device rd;
        std::mt19937_64 gen(rd());
        std::uniform_int_distribution<unsigned long long> dist;
        path_ = fs::temp_directory_path() / ("batchdl-test-" + std::to_string(dist(gen)));
        fs::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
};

inline std::string readFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

inline void writeFile(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

// Shifted copies of this pattern differ, so a misaligned append shows up in the content.
inline std::string makeBody(std::size_t size, unsigned seed = 7) {
    std::string body(size, '\0');
    for (std::size_t i = 0; i < size; ++i) {
        body[i] = static_cast<char>((i * 31 + seed + i / 251) % 256);
    }
    return body;
}

inline bool waitUntil(const std::function<bool()>& condition,
                      std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return condition();
}

struct RetryEvent {
    std::string url;
    int attempt{0};
    FailureKind kind{FailureKind::TransientNetwork};
};

class RecordingEventLog final : public EventLog {
public:
    void taskStarted(const TransferState& state) override {
        std::lock_guard<std::mutex> lock(mutex_);
        started.push_back(state.url);
    }

    void retrying(const TransferState& state, FailureKind kind, const std::string&, std::chrono::milliseconds) override {
        std::lock_guard<std::mutex> lock(mutex_);
        retries.push_back({state.url, state.attempt, kind});
    }

    void taskSucceeded(const TaskResult& result) override {
        std::lock_guard<std::mutex> lock(mutex_);
        succeeded.push_back(result);
    }

    void taskFailed(const TaskResult& result) override {
        std::lock_guard<std::mutex> lock(mutex_);
        failed.push_back(result);
    }

    void warning(const std::string&, const std::string& message) override {
        std::lock_guard<std::mutex> lock(mutex_);
        warnings.push_back(message);
    }

    void runSummary(const RunSummary& summary) override {
        std::lock_guard<std::mutex> lock(mutex_);
        summaries.push_back(summary);
    }

    std::vector<std::string> started;
    std::vector<RetryEvent> retries;
    std::vector<TaskResult> succeeded;
    std::vector<TaskResult> failed;
    std::vector<std::string> warnings;
    std::vector<RunSummary> summaries;

private:
    std::mutex mutex_;
};

class RecordingProgressReporter final : public ProgressReporter {
public:
    void onProgress(const Progress& progress) override {
        std::lock_guard<std::mutex> lock(mutex_);
        updates.push_back(progress);
    }

    void onTaskFinished(const TaskResult& result) override {
        std::lock_guard<std::mutex> lock(mutex_);
        finished.push_back(result);
    }

    std::vector<Progress> updates;
    std::vector<TaskResult> finished;

private:
    std::mutex mutex_;
};

} // namespace batchdl::testing
