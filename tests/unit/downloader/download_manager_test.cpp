#include <gtest/gtest.h>
#include <convey/downloader/downloader.hpp>

#include "../../common/fake_http_adapter.h"
#include "../../common/test_helpers.h"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using namespace convey::downloader;
using namespace std::chrono_literals;
using convey::tests::FakeHttpAdapter;
using convey::tests::make_payload;
using convey::tests::read_file;
using convey::tests::ScopedEnv;
using convey::tests::TempDir;
using convey::tests::write_file;

namespace {

constexpr std::size_t kChunk = 64 * 1024;

DownloaderConfig fast_config() {
    DownloaderConfig cfg;
    cfg.defaultChunkSizeBytes = kChunk;
    cfg.retry.maxAttempts = 5;
    cfg.retry.initialBackoff = 1ms;
    cfg.retry.multiplier = 2.0;
    cfg.retry.maxBackoff = 4ms;
    return cfg;
}

// Manager wired to an in-memory server and the real disk writer / sidecar store
struct Harness {
    explicit Harness(DownloaderConfig cfg = fast_config()) {
        auto adapter = std::make_unique<FakeHttpAdapter>();
        http = adapter.get();
        manager = makeDownloadManagerWithDependencies(cfg, std::move(adapter), nullptr, nullptr);
    }

    DownloadRequest request(const std::string& url) const {
        DownloadRequest req;
        req.url = url;
        req.destinationDir = tmp.path();
        return req;
    }

    TempDir tmp;
    FakeHttpAdapter* http{nullptr};
    std::unique_ptr<IDownloadManager> manager;
};

FakeHttpAdapter::Resource resource(std::string body, std::optional<std::string> etag = "v1") {
    FakeHttpAdapter::Resource r;
    r.body = std::move(body);
    r.etag = std::move(etag);
    return r;
}

} // namespace

TEST(DownloadManager, ResumesAfterConnectionDrop) {
    Harness h;
    const std::string url = "https://example.com/files/big.bin";
    const auto body = make_payload(10 * 1024 * 1024);
    h.http->add(url, resource(body));
    h.http->addFault(url, {4000000, ErrorCode::TransientNetwork, "connection reset by peer"});

    auto req = h.request(url);
    req.checksum = Checksum{HashAlgo::Sha256, sha256Hex(body)};
    auto result = h.manager->download(req);

    ASSERT_TRUE(result.completed()) << (result.error ? result.error->message : "");
    EXPECT_EQ(result.attempts, 2);
    EXPECT_EQ(h.http->offsets(url), (std::vector<std::uint64_t>{0, 4000000}));
    EXPECT_EQ(result.sizeBytes, body.size());
    EXPECT_EQ(result.sha256, sha256Hex(body));
    EXPECT_EQ(result.destination, h.tmp.path() / "big.bin");
    EXPECT_EQ(read_file(result.destination), body);
    EXPECT_FALSE(fs::exists(stagingPathFor(result.destination)));
    EXPECT_FALSE(fs::exists(sidecarPathFor(stagingPathFor(result.destination))));

    // The resumed request is conditional on the same version
    auto ifRanges = h.http->ifRanges(url);
    ASSERT_EQ(ifRanges.size(), 2u);
    EXPECT_EQ(ifRanges[1], std::optional<std::string>("\"v1\""));
}

TEST(DownloadManager, RootUrlGetsGeneratedName) {
    Harness h;
    const std::string url = "https://example.com/";
    auto r = resource("<html></html>");
    r.contentType = "text/html";
    h.http->add(url, r);

    auto result = h.manager->download(h.request(url));
    ASSERT_TRUE(result.completed());
    const auto name = result.destination.filename().string();
    EXPECT_EQ(name.rfind("download-", 0), 0u);
    EXPECT_EQ(name.substr(name.size() - 5), ".html");
    EXPECT_EQ(read_file(result.destination), "<html></html>");
}

TEST(DownloadManager, DeclaredFilenameIsUsed) {
    Harness h;
    const std::string url = "https://example.com/get?id=1";
    auto r = resource("data");
    r.declaredFilename = "report.csv";
    h.http->add(url, r);

    auto result = h.manager->download(h.request(url));
    ASSERT_TRUE(result.completed());
    EXPECT_EQ(result.destination, h.tmp.path() / "report.csv");
}

TEST(DownloadManager, CancelledDownloadKeepsWholeChunksAndResumesLater) {
    Harness h;
    h.http->deliverySize = 1000; // not aligned with the chunk size
    const std::string url = "https://example.com/c.bin";
    const auto body = make_payload(1024 * 1024);
    h.http->add(url, resource(body));

    std::atomic<bool> cancel{false};
    auto onProgress = [&](const ProgressEvent& ev) {
        if (ev.downloadedBytes >= 2 * kChunk)
            cancel = true;
    };
    auto result = h.manager->download(h.request(url), onProgress, [&] { return cancel.load(); });

    EXPECT_EQ(result.status, DownloadStatus::Cancelled);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->code, ErrorCode::Cancelled);
    const auto dest = h.tmp.path() / "c.bin";
    EXPECT_FALSE(fs::exists(dest));
    ASSERT_TRUE(fs::exists(stagingPathFor(dest)));
    EXPECT_EQ(fs::file_size(stagingPathFor(dest)), 2 * kChunk);
    EXPECT_TRUE(fs::exists(sidecarPathFor(stagingPathFor(dest))));

    // A later call picks up where the cancelled one stopped
    auto resumed = h.manager->download(h.request(url));
    ASSERT_TRUE(resumed.completed());
    EXPECT_EQ(resumed.resumedFrom, 2 * kChunk);
    EXPECT_EQ(h.http->offsets(url).back(), 2 * kChunk);
    EXPECT_EQ(read_file(dest), body);
    EXPECT_EQ(resumed.sha256, sha256Hex(body));
}

TEST(DownloadManager, FailureLeavesDestinationUntouched) {
    Harness h;
    const std::string url = "https://example.com/keep.txt";
    const auto dest = write_file(h.tmp / "keep.txt", "old content");
    h.http->add(url, resource(make_payload(200000)));
    h.http->addFault(url, {100000, ErrorCode::ServerError, "HTTP 403"});

    auto result = h.manager->download(h.request(url));
    EXPECT_EQ(result.status, DownloadStatus::Failed);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->code, ErrorCode::ServerError);
    // Not retried
    EXPECT_EQ(result.attempts, 1);
    EXPECT_EQ(h.http->offsets(url).size(), 1u);
    EXPECT_EQ(read_file(dest), "old content");
    // Staging stays for a later resume
    ASSERT_TRUE(fs::exists(stagingPathFor(dest)));
    EXPECT_EQ(fs::file_size(stagingPathFor(dest)), 100000u);
}

TEST(DownloadManager, CleanupOnFailureRemovesStaging) {
    Harness h;
    const std::string url = "https://example.com/gone.bin";
    h.http->add(url, resource(make_payload(5000)));
    h.http->addFault(url, {2000, ErrorCode::ServerError, "HTTP 410"});

    auto req = h.request(url);
    req.cleanupOnFailure = true;
    auto result = h.manager->download(req);
    EXPECT_EQ(result.status, DownloadStatus::Failed);
    const auto dest = h.tmp.path() / "gone.bin";
    EXPECT_FALSE(fs::exists(stagingPathFor(dest)));
    EXPECT_FALSE(fs::exists(sidecarPathFor(stagingPathFor(dest))));
    EXPECT_FALSE(fs::exists(dest));
}

TEST(DownloadManager, GivesUpAfterMaxAttempts) {
    auto cfg = fast_config();
    cfg.retry.maxAttempts = 3;
    Harness h(cfg);
    const std::string url = "https://example.com/flaky.bin";
    h.http->add(url, resource(make_payload(100000)));
    h.http->addFault(url, {1000});
    h.http->addFault(url, {2000});
    h.http->addFault(url, {3000});

    auto result = h.manager->download(h.request(url));
    EXPECT_EQ(result.status, DownloadStatus::Failed);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->code, ErrorCode::TransientNetwork);
    EXPECT_EQ(result.error->message.rfind("Giving up after 3 attempts", 0), 0u);
    EXPECT_NE(result.error->message.find("connection reset by peer"), std::string::npos);
    EXPECT_EQ(result.attempts, 3);
    EXPECT_EQ(h.http->offsets(url), (std::vector<std::uint64_t>{0, 1000, 2000}));
    EXPECT_FALSE(fs::exists(h.tmp.path() / "flaky.bin"));
}

TEST(DownloadManager, IgnoredRangeRestartsFromZero) {
    Harness h;
    const std::string url = "https://example.com/norange.bin";
    const auto body = make_payload(300000);
    auto r = resource(body);
    r.ignoreRanges = 1;
    h.http->add(url, r);
    h.http->addFault(url, {150000});

    std::vector<ProgressEvent> events;
    auto result = h.manager->download(h.request(url),
                                      [&](const ProgressEvent& ev) { events.push_back(ev); });
    ASSERT_TRUE(result.completed()) << (result.error ? result.error->message : "");
    EXPECT_EQ(h.http->offsets(url), (std::vector<std::uint64_t>{0, 150000, 0}));
    EXPECT_EQ(result.attempts, 2);
    EXPECT_EQ(result.resumedFrom, 0u);
    EXPECT_EQ(read_file(result.destination), body);
    EXPECT_EQ(result.sha256, sha256Hex(body));
    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events.back().phase, TransferPhase::Done);

    // The restart stays inside one progress scope
    int terminal = 0;
    std::uint64_t last = 0;
    for (const auto& ev : events) {
        if (ev.phase == TransferPhase::Done || ev.phase == TransferPhase::Failed)
            ++terminal;
        EXPECT_GE(ev.downloadedBytes, last);
        last = ev.downloadedBytes;
    }
    EXPECT_EQ(terminal, 1);
    EXPECT_EQ(events.back().downloadedBytes, body.size());
}

TEST(DownloadManager, ResourceChangedMidTransferRestartsWithFreshValidators) {
    Harness h;
    const std::string url = "https://example.com/x.bin";
    const auto v1 = make_payload(300000, 1);
    const auto v2 = make_payload(400000, 2);
    h.http->add(url, resource(v1, "v1"));
    h.http->replaceAfter(url, 1, resource(v2, "v2"));
    h.http->addFault(url, {150000});
    h.http->addFault(url, {200000});

    std::vector<ProgressEvent> events;
    auto result = h.manager->download(h.request(url),
                                      [&](const ProgressEvent& ev) { events.push_back(ev); });
    ASSERT_TRUE(result.completed()) << (result.error ? result.error->message : "");
    EXPECT_EQ(read_file(result.destination), v2);
    EXPECT_EQ(result.sizeBytes, v2.size());
    EXPECT_EQ(result.sha256, sha256Hex(v2));
    EXPECT_EQ(result.etag, std::optional<std::string>("v2"));

    // Drop, stale If-Range answered in full, restart, drop, resume against the new ETag
    EXPECT_EQ(h.http->offsets(url), (std::vector<std::uint64_t>{0, 150000, 0, 200000}));
    const auto ifRanges = h.http->ifRanges(url);
    ASSERT_EQ(ifRanges.size(), 4u);
    EXPECT_EQ(ifRanges[1], std::optional<std::string>("\"v1\""));
    EXPECT_EQ(ifRanges[3], std::optional<std::string>("\"v2\""));
    EXPECT_EQ(h.http->probeCount(), 2);
    EXPECT_EQ(result.attempts, 3);

    int terminal = 0;
    for (const auto& ev : events) {
        if (ev.phase == TransferPhase::Done || ev.phase == TransferPhase::Failed)
            ++terminal;
    }
    EXPECT_EQ(terminal, 1);
    EXPECT_FALSE(fs::exists(result.destination.string() + ".part.json"));
}

TEST(DownloadManager, RangeIgnoredTwiceIsServerError) {
    Harness h;
    const std::string url = "https://example.com/stubborn.bin";
    auto r = resource(make_payload(300000));
    r.ignoreRanges = 5;
    h.http->add(url, r);
    h.http->addFault(url, {100000});
    h.http->addFault(url, {100000});

    auto result = h.manager->download(h.request(url));
    EXPECT_EQ(result.status, DownloadStatus::Failed);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->code, ErrorCode::ServerError);
}

TEST(DownloadManager, ProgressIsMonotonicWithinTransfer) {
    Harness h;
    const std::string url = "https://example.com/progress.bin";
    const auto body = make_payload(1024 * 1024 + 123);
    h.http->add(url, resource(body));
    h.http->addFault(url, {500000});

    std::vector<ProgressEvent> events;
    auto result = h.manager->download(h.request(url),
                                      [&](const ProgressEvent& ev) { events.push_back(ev); });
    ASSERT_TRUE(result.completed());
    ASSERT_GE(events.size(), 3u);
    EXPECT_EQ(events.front().phase, TransferPhase::Resolving);
    for (size_t i = 1; i < events.size(); ++i) {
        EXPECT_GE(events[i].downloadedBytes, events[i - 1].downloadedBytes) << "event " << i;
        if (events[i].percentage && events[i - 1].percentage) {
            EXPECT_GE(*events[i].percentage, *events[i - 1].percentage);
        }
    }
    EXPECT_EQ(events.back().phase, TransferPhase::Done);
    EXPECT_EQ(events.back().downloadedBytes, body.size());
    ASSERT_TRUE(events.back().percentage.has_value());
    EXPECT_FLOAT_EQ(*events.back().percentage, 100.0f);
}

TEST(DownloadManager, ConcurrentDownloadsAreIndependent) {
    Harness h;
    constexpr int kCount = 4;
    std::vector<std::string> bodies;
    for (int i = 0; i < kCount; ++i) {
        bodies.push_back(make_payload(300000 + static_cast<std::size_t>(i) * 1000,
                                      static_cast<unsigned>(i + 1)));
        const auto url = "https://example.com/par" + std::to_string(i) + ".bin";
        h.http->add(url, resource(bodies.back()));
        h.http->addFault(url, {static_cast<std::uint64_t>(50000 + i * 10000)});
    }

    std::vector<FinalResult> results(kCount);
    std::vector<std::thread> threads;
    for (int i = 0; i < kCount; ++i) {
        threads.emplace_back([&, i] {
            results[static_cast<size_t>(i)] = h.manager->download(
                h.request("https://example.com/par" + std::to_string(i) + ".bin"));
        });
    }
    for (auto& t : threads)
        t.join();

    for (int i = 0; i < kCount; ++i) {
        const auto& r = results[static_cast<size_t>(i)];
        ASSERT_TRUE(r.completed()) << r.url;
        EXPECT_EQ(read_file(r.destination), bodies[static_cast<size_t>(i)]);
        EXPECT_EQ(r.attempts, 2);
    }
}

TEST(DownloadManager, ResumesStagingFromPreviousRun) {
    Harness h;
    const std::string url = "https://example.com/prev.bin";
    const auto body = make_payload(20000);
    h.http->add(url, resource(body));

    const auto dest = h.tmp.path() / "prev.bin";
    write_file(stagingPathFor(dest), body.substr(0, 3000));
    auto store = makeJsonResumeStore();
    ASSERT_TRUE(store->save(stagingPathFor(dest),
                            IResumeStore::State{url, std::string("v1"), std::nullopt, 20000})
                    .ok());

    auto result = h.manager->download(h.request(url));
    ASSERT_TRUE(result.completed());
    EXPECT_EQ(result.resumedFrom, 3000u);
    EXPECT_EQ(h.http->offsets(url), (std::vector<std::uint64_t>{3000}));
    EXPECT_EQ(read_file(dest), body);
    EXPECT_EQ(result.sha256, sha256Hex(body));
}

TEST(DownloadManager, ChangedResourceRestartsFromZero) {
    Harness h;
    const std::string url = "https://example.com/changed.bin";
    const auto body = make_payload(20000, 3);
    h.http->add(url, resource(body, "v2"));

    const auto dest = h.tmp.path() / "changed.bin";
    write_file(stagingPathFor(dest), std::string(5000, 'x'));
    auto store = makeJsonResumeStore();
    ASSERT_TRUE(store->save(stagingPathFor(dest),
                            IResumeStore::State{url, std::string("v1"), std::nullopt, 20000})
                    .ok());

    auto result = h.manager->download(h.request(url));
    ASSERT_TRUE(result.completed());
    EXPECT_EQ(result.resumedFrom, 0u);
    EXPECT_EQ(h.http->offsets(url), (std::vector<std::uint64_t>{0}));
    EXPECT_EQ(read_file(dest), body);
}

TEST(DownloadManager, UnverifiableStagingFollowsConfig) {
    const std::string url = "https://example.com/novalidators.bin";
    const auto body = make_payload(8000);

    for (bool allow : {true, false}) {
        auto cfg = fast_config();
        cfg.resumeWithoutValidators = allow;
        Harness h(cfg);
        h.http->add(url, resource(body, std::nullopt));
        const auto dest = h.tmp.path() / "novalidators.bin";
        write_file(stagingPathFor(dest), body.substr(0, 1000));

        auto result = h.manager->download(h.request(url));
        ASSERT_TRUE(result.completed());
        EXPECT_EQ(result.resumedFrom, allow ? 1000u : 0u);
        EXPECT_EQ(read_file(dest), body);
    }
}

TEST(DownloadManager, NoResumeRequestStartsOver) {
    Harness h;
    const std::string url = "https://example.com/fresh.bin";
    const auto body = make_payload(8000);
    h.http->add(url, resource(body));
    const auto dest = h.tmp.path() / "fresh.bin";
    write_file(stagingPathFor(dest), body.substr(0, 1000));

    auto req = h.request(url);
    req.resume = false;
    auto result = h.manager->download(req);
    ASSERT_TRUE(result.completed());
    EXPECT_EQ(result.resumedFrom, 0u);
    EXPECT_EQ(h.http->offsets(url), (std::vector<std::uint64_t>{0}));
}

TEST(DownloadManager, ExpiredDeadlineIsTimeout) {
    Harness h;
    const std::string url = "https://example.com/late.bin";
    h.http->add(url, resource("abc"));

    auto req = h.request(url);
    req.deadline = std::chrono::steady_clock::now() - 1s;
    auto result = h.manager->download(req);
    EXPECT_EQ(result.status, DownloadStatus::Failed);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->code, ErrorCode::Timeout);
    EXPECT_TRUE(h.http->offsets(url).empty());
}

TEST(DownloadManager, TimeBudgetStartsWithEachDownload) {
    Harness h;
    const std::string first = "https://example.com/first.bin";
    const std::string second = "https://example.com/second.bin";
    h.http->add(first, resource("first"));
    h.http->add(second, resource("second"));

    std::vector<DownloadRequest> reqs{h.request(first), h.request(second)};
    for (auto& r : reqs)
        r.timeBudget = 500ms;

    // The first download outlives the second one's budget
    auto slowFirst = [&](const ProgressEvent& ev) {
        if (ev.url == first && ev.phase == TransferPhase::Done)
            std::this_thread::sleep_for(700ms);
    };
    auto results = h.manager->downloadMany(reqs, slowFirst, {});
    ASSERT_EQ(results.size(), 2u);
    EXPECT_TRUE(results[0].completed());
    EXPECT_TRUE(results[1].completed()) << (results[1].error ? results[1].error->message : "");

    auto expired = h.request(first);
    expired.timeBudget = 0ms;
    auto late = h.manager->download(expired);
    ASSERT_TRUE(late.error.has_value());
    EXPECT_EQ(late.error->code, ErrorCode::Timeout);
}

TEST(DownloadManager, ChecksumMismatchDiscardsStaging) {
    Harness h;
    const std::string url = "https://example.com/bad.bin";
    h.http->add(url, resource("tampered"));

    auto req = h.request(url);
    req.checksum = Checksum{HashAlgo::Sha256, sha256Hex("original")};
    auto result = h.manager->download(req);
    EXPECT_EQ(result.status, DownloadStatus::Failed);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->code, ErrorCode::ChecksumMismatch);
    const auto dest = h.tmp.path() / "bad.bin";
    EXPECT_FALSE(fs::exists(dest));
    EXPECT_FALSE(fs::exists(stagingPathFor(dest)));
}

TEST(DownloadManager, OverwriteNeverRefusesExistingDestination) {
    Harness h;
    const std::string url = "https://example.com/exists.txt";
    h.http->add(url, resource("new"));
    write_file(h.tmp / "exists.txt", "mine");

    auto req = h.request(url);
    req.overwrite = OverwritePolicy::Never;
    auto result = h.manager->download(req);
    EXPECT_EQ(result.status, DownloadStatus::Failed);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->code, ErrorCode::DestinationError);
    EXPECT_EQ(read_file(h.tmp / "exists.txt"), "mine");
    EXPECT_TRUE(h.http->offsets(url).empty());
}

TEST(DownloadManager, UnreachableResourceFailsWithoutAttempts) {
    Harness h;
    const std::string url = "https://unreachable.invalid/x";
    h.http->failProbe(url, Error{ErrorCode::Unreachable, "Could not resolve host"});

    auto result = h.manager->download(h.request(url));
    EXPECT_EQ(result.status, DownloadStatus::Failed);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->code, ErrorCode::Unreachable);
    EXPECT_EQ(result.attempts, 0);
}

TEST(DownloadManager, EmptyUrlIsInvalid) {
    Harness h;
    auto result = h.manager->download(h.request(""));
    EXPECT_EQ(result.status, DownloadStatus::Failed);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->code, ErrorCode::InvalidArgument);
}

TEST(DownloadManager, UnknownLengthCompletes) {
    Harness h;
    const std::string url = "https://example.com/stream";
    auto r = resource(make_payload(70000));
    r.declareLength = false;
    h.http->add(url, r);

    std::vector<ProgressEvent> events;
    auto result = h.manager->download(h.request(url),
                                      [&](const ProgressEvent& ev) { events.push_back(ev); });
    ASSERT_TRUE(result.completed());
    EXPECT_EQ(result.sizeBytes, 70000u);
    for (const auto& ev : events) {
        if (ev.phase == TransferPhase::Streaming) {
            EXPECT_FALSE(ev.percentage.has_value());
        }
    }
}

TEST(DownloadManager, CacheServesRepeatDownloads) {
    ScopedEnv noDisable("CONVEY_DISABLE_DOWNLOAD_CACHE", std::nullopt);
    TempDir cacheRoot;
    auto cfg = fast_config();
    cfg.cacheDir = cacheRoot.path();
    Harness h(cfg);
    const std::string url = "https://example.com/model.bin";
    const auto body = make_payload(50000);
    h.http->add(url, resource(body));

    auto req = h.request(url);
    req.useCache = true;
    auto first = h.manager->download(req);
    ASSERT_TRUE(first.completed());
    EXPECT_FALSE(first.fromCache);
    EXPECT_EQ(h.http->probeCount(), 1);

    TempDir otherDir;
    req.destinationDir = otherDir.path();
    auto second = h.manager->download(req);
    ASSERT_TRUE(second.completed());
    EXPECT_TRUE(second.fromCache);
    EXPECT_EQ(h.http->probeCount(), 1);
    EXPECT_EQ(second.destination, otherDir.path() / "model.bin");
    EXPECT_EQ(read_file(second.destination), body);
    EXPECT_EQ(second.sha256, sha256Hex(body));

    h.manager->clearCache();
    auto third = h.manager->download(req);
    ASSERT_TRUE(third.completed());
    EXPECT_FALSE(third.fromCache);
    EXPECT_EQ(h.http->probeCount(), 2);
}

TEST(DownloadManager, DownloadManySkipsAfterCancel) {
    Harness h;
    h.http->add("https://example.com/1", resource("one"));
    h.http->add("https://example.com/2", resource("two"));

    std::vector<DownloadRequest> reqs = {h.request("https://example.com/1"),
                                         h.request("https://example.com/2")};
    auto done = h.manager->downloadMany(reqs);
    ASSERT_EQ(done.size(), 2u);
    EXPECT_TRUE(done[0].completed());
    EXPECT_TRUE(done[1].completed());

    auto skipped = h.manager->downloadMany(reqs, {}, [] { return true; });
    ASSERT_EQ(skipped.size(), 2u);
    EXPECT_TRUE(skipped[0].cancelled());
    EXPECT_TRUE(skipped[1].cancelled());
    EXPECT_EQ(skipped[1].url, "https://example.com/2");
}

TEST(DownloadManager, ResolveNameAndDiscard) {
    Harness h;
    const std::string url = "https://example.com/dir/file.tar";
    h.http->add(url, resource("tarball"));

    auto name = h.manager->resolveName(h.request(url));
    ASSERT_TRUE(name.ok());
    EXPECT_EQ(name.value(), "file.tar");

    const auto dest = h.tmp.path() / "file.tar";
    write_file(stagingPathFor(dest), "partial");
    write_file(sidecarPathFor(stagingPathFor(dest)), "{}");
    ASSERT_TRUE(h.manager->discard(h.request(url)).ok());
    EXPECT_FALSE(fs::exists(stagingPathFor(dest)));
    EXPECT_FALSE(fs::exists(sidecarPathFor(stagingPathFor(dest))));
}
