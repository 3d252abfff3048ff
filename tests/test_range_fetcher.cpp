#include <catch2/catch.hpp>

#include "batchdl/range_fetcher.hpp"
#include "batchdl/retry_policy.hpp"
#include "fake_transport.hpp"
#include "test_helpers.hpp"

using namespace batchdl;
using namespace batchdl::testing;

namespace {

const std::string kUrl = "https://host/file.bin";

FetchOutcome fetchInto(FakeTransport& transport, const fs::path& path, std::uint64_t offset,
                       std::optional<std::uint64_t> expected, std::vector<std::uint64_t>* progress = nullptr) {
    std::string error;
    auto file = detail::openForWrite(path, offset == 0, error);
    REQUIRE(file);

    StopSignal stop;
    const RangeFetcher fetcher{transport, Timeouts{}};
    return fetcher.fetch({kUrl, offset, expected}, std::move(file),
                         [progress](std::uint64_t written) {
                             if (progress) {
                                 progress->push_back(written);
                             }
                         },
                         stop);
}

} // namespace

TEST_CASE("full fetch writes the body and reports chunks", "[fetcher]") {
    TempDir dir;
    const auto body = makeBody(2500);
    FakeTransport transport;
    transport.add(kUrl, {body});

    std::vector<std::uint64_t> progress;
    const auto outcome = fetchInto(transport, dir.path() / "out.bin", 0, body.size(), &progress);

    REQUIRE(outcome.ok);
    CHECK(outcome.bytes_written == body.size());
    CHECK(readFile(dir.path() / "out.bin") == body);
    CHECK(transport.offsets(kUrl) == std::vector<std::uint64_t>{0});
    REQUIRE(progress.size() == 3);
    CHECK(progress.back() == body.size());
}

TEST_CASE("ranged fetch appends the remainder", "[fetcher]") {
    TempDir dir;
    const auto path = dir.path() / "out.bin";
    const auto body = makeBody(3000);
    writeFile(path, body.substr(0, 1200));

    FakeTransport transport;
    transport.add(kUrl, {body});
    const auto outcome = fetchInto(transport, path, 1200, body.size());

    REQUIRE(outcome.ok);
    CHECK(outcome.bytes_written == 1800);
    CHECK(transport.offsets(kUrl) == std::vector<std::uint64_t>{1200});
    CHECK(readFile(path) == body);
}

TEST_CASE("full response to a range request is a range mismatch", "[fetcher]") {
    TempDir dir;
    const auto path = dir.path() / "out.bin";
    const auto body = makeBody(3000);
    writeFile(path, body.substr(0, 1200));

    FakeResource resource{body};
    resource.honour_ranges = false;
    FakeTransport transport;
    transport.add(kUrl, resource);

    const auto outcome = fetchInto(transport, path, 1200, body.size());

    CHECK_FALSE(outcome.ok);
    CHECK(outcome.failure == FailureKind::RangeMismatch);
    CHECK(outcome.bytes_written == 0);
    CHECK(readFile(path) == body.substr(0, 1200));
}

TEST_CASE("error statuses are classified and not written", "[fetcher]") {
    TempDir dir;
    const auto path = dir.path() / "out.bin";
    FakeResource resource{makeBody(100)};

    SECTION("client error") {
        resource.status = 404;
        FakeTransport transport;
        transport.add(kUrl, resource);
        const auto outcome = fetchInto(transport, path, 0, std::nullopt);
        CHECK(outcome.failure == FailureKind::ServerRejected);
        CHECK_THAT(outcome.message, Catch::Contains("404"));
    }
    SECTION("server error") {
        resource.status = 503;
        FakeTransport transport;
        transport.add(kUrl, resource);
        const auto outcome = fetchInto(transport, path, 0, std::nullopt);
        CHECK(outcome.failure == FailureKind::ServerOverload);
    }
    SECTION("too many requests") {
        resource.status = 429;
        FakeTransport transport;
        transport.add(kUrl, resource);
        const auto outcome = fetchInto(transport, path, 0, std::nullopt);
        CHECK(outcome.failure == FailureKind::ServerOverload);
    }
    CHECK(std::filesystem::file_size(path) == 0);
}

TEST_CASE("network failures are transient", "[fetcher]") {
    TempDir dir;
    const auto path = dir.path() / "out.bin";
    const auto body = makeBody(5000);

    SECTION("connection refused") {
        FakeResource resource{body};
        resource.connect_failures = 1;
        FakeTransport transport;
        transport.add(kUrl, resource);
        const auto outcome = fetchInto(transport, path, 0, body.size());
        CHECK(outcome.failure == FailureKind::TransientNetwork);
        CHECK(outcome.bytes_written == 0);
    }
    SECTION("timeout mid-stream keeps the bytes already written") {
        FakeResource resource{body};
        resource.cuts = 1;
        resource.cut_after = 2000;
        FakeTransport transport;
        transport.add(kUrl, resource);
        const auto outcome = fetchInto(transport, path, 0, body.size());
        CHECK(outcome.failure == FailureKind::TransientNetwork);
        CHECK(outcome.bytes_written == 2000);
        CHECK(readFile(path) == body.substr(0, 2000));
    }
}

TEST_CASE("transport errors a retry cannot fix are permanent", "[fetcher]") {
    TempDir dir;
    const auto path = dir.path() / "out.bin";
    FakeResource resource{makeBody(100)};

    SECTION("unsupported scheme") {
        resource.fail_with = TransportError::BadUrl;
        FakeTransport transport;
        transport.add(kUrl, resource);
        const auto outcome = fetchInto(transport, path, 0, std::nullopt);
        CHECK(outcome.failure == FailureKind::InvalidUrl);
        CHECK_FALSE(RetryPolicy::isTransient(outcome.failure));
    }
    SECTION("peer verification failed") {
        resource.fail_with = TransportError::Rejected;
        FakeTransport transport;
        transport.add(kUrl, resource);
        const auto outcome = fetchInto(transport, path, 0, std::nullopt);
        CHECK(outcome.failure == FailureKind::ServerRejected);
        CHECK_FALSE(RetryPolicy::isTransient(outcome.failure));
    }
}

TEST_CASE("more bytes than declared aborts with a length mismatch", "[fetcher]") {
    TempDir dir;
    FakeTransport transport;
    transport.add(kUrl, {makeBody(3000)});

    const auto outcome = fetchInto(transport, dir.path() / "out.bin", 0, 2000);

    CHECK_FALSE(outcome.ok);
    CHECK(outcome.failure == FailureKind::LengthMismatch);
    CHECK(outcome.bytes_written <= 2000);
}

TEST_CASE("missing file handle is a file-system failure", "[fetcher]") {
    FakeTransport transport;
    transport.add(kUrl, {makeBody(10)});
    StopSignal stop;
    const RangeFetcher fetcher{transport, Timeouts{}};

    const auto outcome = fetcher.fetch({kUrl, 0, std::nullopt}, detail::FilePtr{}, {}, stop);

    CHECK(outcome.failure == FailureKind::FileSystem);
    CHECK(transport.getCount(kUrl) == 0);
}
