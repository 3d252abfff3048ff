#include "batchdl/download_task.hpp"
#include "batchdl/detail/file_utils.hpp"
#include "batchdl/range_fetcher.hpp"
#include "batchdl/resume_planner.hpp"
#include "batchdl/url_list.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <utility>

#include <fmt/format.h>

namespace batchdl {

class DownloadTask::Impl {
public:
    Impl(TransferState state,
         HttpTransport& transport,
         const TaskOptions& options,
         EventLog& log,
         ProgressReporter& progress)
        : state_(std::move(state)),
          transport_(transport),
          options_(options),
          log_(log),
          progress_(progress),
          fetcher_(transport, options.timeouts) {}

    TaskResult run(const StopSignal& stop) {
        state_.advance(TransferStatus::InProgress);
        log_.taskStarted(state_);

        if (!isValidUrl(state_.url)) {
            return finish(TransferStatus::Failed, FailureKind::InvalidUrl,
                          fmt::format("Invalid URL: {}", state_.url));
        }

        while (true) {
            if (stop.stopRequested()) {
                return finish(TransferStatus::Failed, FailureKind::Cancelled, "Stop requested");
            }

            const auto failure = attemptOnce(stop);
            if (!failure) {
                return finish(TransferStatus::Completed, std::nullopt, {});
            }

            if (failure->kind == FailureKind::RangeMismatch || failure->kind == FailureKind::LengthMismatch) {
                std::error_code ec;
                if (!detail::discardPartial(state_.destination, ec)) {
                    return finish(TransferStatus::Failed, FailureKind::FileSystem,
                                  fmt::format("Cannot discard partial file: {}", ec.message()));
                }
                state_.bytes_downloaded = 0;
            }
            // The server ignored our range once; later attempts restart from zero without asking again.
            if (failure->kind == FailureKind::RangeMismatch && remote_) {
                remote_->accepts_ranges = false;
            }

            const RetryDecision decision = options_.retry.decide(state_.attempt, failure->kind);
            if (!decision.should_retry) {
                return finish(TransferStatus::Failed, failure->kind, failure->message);
            }

            log_.retrying(state_, failure->kind, failure->message, decision.delay);
            if (stop.waitFor(decision.delay)) {
                return finish(TransferStatus::Failed, FailureKind::Cancelled, "Stop requested while waiting to retry");
            }
            if (failure->kind != FailureKind::RangeMismatch) {
                ++state_.attempt;
            }
        }
    }

private:
    struct AttemptFailure {
        FailureKind kind;
        std::string message;
    };

    std::optional<AttemptFailure> attemptOnce(const StopSignal& stop) {
        if (!remote_) {
            const ProbeResult probe = transport_.probe(state_.url, options_.timeouts, stop);
            if (probe.transfer.error != TransportError::None) {
                return AttemptFailure{failureFromTransport(probe.transfer.error), probe.transfer.message};
            }
            remote_ = probe.remote;
            // Servers refusing HEAD still get a GET; resume stays off without metadata.
            if (!isSuccessStatus(remote_->http_status)) {
                remote_->content_length.reset();
                remote_->accepts_ranges = false;
            }
            state_.bytes_expected = remote_->content_length;
        }

        std::error_code ec;
        const ResumePlan plan = planResume(state_.destination, *remote_, ec);
        if (ec) {
            return AttemptFailure{FailureKind::FileSystem,
                                  fmt::format("Cannot inspect {}: {}", state_.destination.string(), ec.message())};
        }
        if (plan.already_complete) {
            already_complete_ = true;
            state_.bytes_downloaded = state_.bytes_expected.value_or(plan.local_size);
            reportProgress(true);
            return std::nullopt;
        }

        if (!ensureParentFolder(ec)) {
            return AttemptFailure{FailureKind::FileSystem,
                                  fmt::format("Cannot create folder for {}: {}", state_.destination.string(),
                                              ec.message())};
        }

        std::string open_error;
        auto file = detail::openForWrite(state_.destination, plan.truncate, open_error);
        if (!file) {
            return AttemptFailure{FailureKind::FileSystem, open_error};
        }
        state_.bytes_downloaded = plan.offset;
        reportProgress(true);

        const FetchRequest request{state_.url, plan.offset, state_.bytes_expected};
        const FetchOutcome outcome = fetcher_.fetch(
            request,
            std::move(file),
            [this, offset = plan.offset](std::uint64_t written) {
                state_.bytes_downloaded = offset + written;
                reportProgress(false);
            },
            stop);

        state_.bytes_downloaded = plan.offset + outcome.bytes_written;
        reportProgress(true);
        if (!outcome.ok) {
            return AttemptFailure{outcome.failure, outcome.message};
        }

        const auto mtime = outcome.last_modified ? outcome.last_modified : remote_->last_modified;
        if (options_.preserve_mtime && mtime) {
            if (!detail::setModificationTime(state_.destination, *mtime, ec)) {
                log_.warning(state_.url, fmt::format("Could not set modified time of {}: {}",
                                                     state_.destination.string(), ec.message()));
            }
        }
        return std::nullopt;
    }

    bool ensureParentFolder(std::error_code& ec) const {
        const auto parent = state_.destination.parent_path();
        if (parent.empty()) {
            return true;
        }
        std::filesystem::create_directories(parent, ec);
        return !ec;
    }

    void reportProgress(bool force) {
        const auto now = std::chrono::steady_clock::now();
        if (!force && now - last_report_ < options_.progress_interval) {
            return;
        }
        last_report_ = now;
        progress_.onProgress(Progress{state_.task_id,
                                      state_.url,
                                      state_.destination.filename().string(),
                                      state_.bytes_expected,
                                      state_.bytes_downloaded});
    }

    TaskResult finish(TransferStatus status, std::optional<FailureKind> kind, std::string message) {
        state_.advance(status);

        TaskResult result;
        result.task_id = state_.task_id;
        result.url = state_.url;
        result.destination = state_.destination;
        result.status = state_.status;
        result.failure = kind;
        result.message = std::move(message);
        result.bytes_downloaded = state_.bytes_downloaded;
        result.bytes_expected = state_.bytes_expected;
        result.attempts = state_.attempt + 1;
        result.already_complete = already_complete_;

        if (result.succeeded()) {
            log_.taskSucceeded(result);
        } else {
            log_.taskFailed(result);
        }
        return result;
    }

    TransferState state_;
    HttpTransport& transport_;
    TaskOptions options_;
    EventLog& log_;
    ProgressReporter& progress_;
    RangeFetcher fetcher_;
    std::optional<RemoteInfo> remote_;
    bool already_complete_{false};
    std::chrono::steady_clock::time_point last_report_{};
};

DownloadTask::DownloadTask(TransferState state,
                           HttpTransport& transport,
                           const TaskOptions& options,
                           EventLog& log,
                           ProgressReporter& progress)
    : impl_(std::make_unique<Impl>(std::move(state), transport, options, log, progress)) {}

DownloadTask::~DownloadTask() = default;

TaskResult DownloadTask::run(const StopSignal& stop) { return impl_->run(stop); }

} // namespace batchdl
