#include "batchdl/event_log.hpp"

#include <utility>
#include <vector>

#include <fmt/format.h>
#include <spdlog/logger.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace batchdl {

namespace {

std::string describeSize(const std::optional<std::uint64_t>& bytes) {
    return bytes ? fmt::format("{} bytes", *bytes) : std::string{"unknown size"};
}

} // namespace

SpdlogEventLog::SpdlogEventLog(std::shared_ptr<spdlog::logger> logger) : logger_(std::move(logger)) {}

void SpdlogEventLog::taskStarted(const TransferState& state) {
    logger_->info("Starting download: {} -> {}", state.url, state.destination.string());
}

void SpdlogEventLog::retrying(const TransferState& state,
                              FailureKind kind,
                              const std::string& reason,
                              std::chrono::milliseconds delay) {
    logger_->warn("Retry attempt {} for {} after {}: {} (waiting {} ms)",
                  state.attempt + 1, state.url, toString(kind), reason, delay.count());
}

void SpdlogEventLog::taskSucceeded(const TaskResult& result) {
    if (result.already_complete) {
        logger_->info("Skipping download: {} (file already exists and is up to date, {})",
                      result.url, describeSize(result.bytes_expected));
        return;
    }
    logger_->info("Downloaded: {} ({} bytes, {} attempt(s))", result.url, result.bytes_downloaded, result.attempts);
}

void SpdlogEventLog::taskFailed(const TaskResult& result) {
    logger_->error("Download failed for '{}' after {} attempt(s): {} - {}",
                   result.url, result.attempts,
                   result.failure ? toString(*result.failure) : "Unknown",
                   result.message);
}

void SpdlogEventLog::warning(const std::string& url, const std::string& message) {
    logger_->warn("{}: {}", url, message);
}

void SpdlogEventLog::runSummary(const RunSummary& summary) {
    logger_->info("Run finished: {} completed, {} failed, {} not started",
                  summary.completed, summary.failed, summary.not_started.size());
    for (const auto& failure : summary.failures) {
        logger_->error("  failed: {} [{}] {}",
                       failure.url,
                       failure.failure ? toString(*failure.failure) : "Unknown",
                       failure.message);
    }
    for (const auto& url : summary.not_started) {
        logger_->warn("  not started: {}", url);
    }
    if (summary.allSucceeded()) {
        logger_->info("All downloads completed successfully.");
    }
    logger_->flush();
}

std::shared_ptr<spdlog::logger> makeLogger(const std::filesystem::path& log_file, bool console) {
    std::vector<spdlog::sink_ptr> sinks;
    if (console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    }
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file.string()));

    auto logger = std::make_shared<spdlog::logger>("batchdl", sinks.begin(), sinks.end());
    logger->set_pattern("%Y-%m-%d %H:%M:%S - %l - %v");
    logger->set_level(spdlog::level::info);
    logger->flush_on(spdlog::level::warn);
    return logger;
}

} // namespace batchdl
