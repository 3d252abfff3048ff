#include <catch2/catch.hpp>

#include "batchdl/event_log.hpp"

#include <memory>
#include <sstream>

#include <spdlog/logger.h>
#include <spdlog/sinks/ostream_sink.h>

using namespace batchdl;
using namespace std::chrono_literals;

namespace {

struct CapturedLog {
    std::ostringstream stream;
    std::shared_ptr<spdlog::logger> logger;

    CapturedLog() {
        auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(stream);
        logger = std::make_shared<spdlog::logger>("test", sink);
        logger->set_pattern("%l %v");
    }
};

} // namespace

TEST_CASE("retry and failure events carry URL, attempt and kind", "[log]") {
    CapturedLog captured;
    SpdlogEventLog log(captured.logger);

    TransferState state{0, "https://host/b.bin", "/tmp/b.bin"};
    state.attempt = 1;
    log.retrying(state, FailureKind::ServerOverload, "Download failed with status code 503", 2000ms);

    TaskResult failed;
    failed.url = "https://host/b.bin";
    failed.status = TransferStatus::Failed;
    failed.failure = FailureKind::ServerRejected;
    failed.message = "Download failed with status code 404";
    failed.attempts = 1;
    log.taskFailed(failed);
    captured.logger->flush();

    const std::string text = captured.stream.str();
    CHECK_THAT(text, Catch::Contains("warning Retry attempt 2 for https://host/b.bin after ServerOverload"));
    CHECK_THAT(text, Catch::Contains("waiting 2000 ms"));
    CHECK_THAT(text, Catch::Contains("error Download failed for 'https://host/b.bin' after 1 attempt(s): ServerRejected"));
}

TEST_CASE("run summary lists failed and unstarted URLs", "[log]") {
    CapturedLog captured;
    SpdlogEventLog log(captured.logger);

    RunSummary summary;
    summary.completed = 1;
    summary.failed = 1;
    TaskResult failed;
    failed.url = "https://host/b.bin";
    failed.failure = FailureKind::ServerRejected;
    failed.message = "Download failed with status code 404";
    summary.failures.push_back(failed);
    summary.not_started.push_back("https://host/c.bin");

    log.runSummary(summary);

    const std::string text = captured.stream.str();
    CHECK_THAT(text, Catch::Contains("1 completed, 1 failed, 1 not started"));
    CHECK_THAT(text, Catch::Contains("failed: https://host/b.bin [ServerRejected]"));
    CHECK_THAT(text, Catch::Contains("not started: https://host/c.bin"));
    CHECK_THAT(text, !Catch::Contains("All downloads completed successfully."));
}

TEST_CASE("skipped files are logged as up to date", "[log]") {
    CapturedLog captured;
    SpdlogEventLog log(captured.logger);

    TaskResult done;
    done.url = "https://host/a.bin";
    done.status = TransferStatus::Completed;
    done.already_complete = true;
    done.bytes_expected = 1000;
    log.taskSucceeded(done);

    CHECK_THAT(captured.stream.str(), Catch::Contains("Skipping download: https://host/a.bin"));
}
