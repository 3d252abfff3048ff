#pragma once

#include "failure.hpp"
#include "task_result.hpp"
#include "transfer_state.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

namespace spdlog {
class logger;
}

namespace batchdl {

// Structured run events. Called concurrently from worker threads.
class EventLog {
public:
    virtual ~EventLog() = default;

    virtual void taskStarted(const TransferState& state) = 0;
    virtual void retrying(const TransferState& state,
                          FailureKind kind,
                          const std::string& reason,
                          std::chrono::milliseconds delay) = 0;
    virtual void taskSucceeded(const TaskResult& result) = 0;
    virtual void taskFailed(const TaskResult& result) = 0;
    virtual void warning(const std::string& url, const std::string& message) = 0;
    virtual void runSummary(const RunSummary& summary) = 0;
};

class SpdlogEventLog final : public EventLog {
public:
    explicit SpdlogEventLog(std::shared_ptr<spdlog::logger> logger);

    void taskStarted(const TransferState& state) override;
    void retrying(const TransferState& state,
                  FailureKind kind,
                  const std::string& reason,
                  std::chrono::milliseconds delay) override;
    void taskSucceeded(const TaskResult& result) override;
    void taskFailed(const TaskResult& result) override;
    void warning(const std::string& url, const std::string& message) override;
    void runSummary(const RunSummary& summary) override;

private:
    std::shared_ptr<spdlog::logger> logger_;
};

// Logger writing to stderr (when `console` is set) and to `log_file`.
std::shared_ptr<spdlog::logger> makeLogger(const std::filesystem::path& log_file, bool console);

} // namespace batchdl
