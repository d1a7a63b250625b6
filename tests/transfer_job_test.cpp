#include "../client/transfer_job.hpp"
#include "fake_remote.hpp"
#include "temp_dir.hpp"
#include <gtest/gtest.h>
#include <filesystem>

namespace fs = std::filesystem;
using std::chrono::milliseconds;

namespace {

JobOptions small_opts(int conns) {
    JobOptions o;
    o.part_size          = 1000;
    o.connections        = conns;
    o.retry.max_attempts = 3;
    o.retry.max_wait     = milliseconds(5);
    o.retry.default_wait = milliseconds(1);
    return o;
}

std::vector<u8> drain(DownloadJob& job) {
    std::vector<u8> out;
    job.for_each_chunk([&](const std::vector<u8>& c) { out.insert(out.end(), c.begin(), c.end()); });
    return out;
}

} // namespace

// ---------------------------------------------------------------
// Download
// ---------------------------------------------------------------

TEST(DownloadJob, ChunksArriveInFileOrder) {
    FakeCloud cloud;
    auto data = pattern_bytes(10500);
    u64 id = cloud.put_object(data);
    CancelToken token;

    DownloadJob job(connected_session(cloud), FileLocation{1, id, data.size()}, small_opts(3), token);
    EXPECT_EQ(job.plan().part_count, 11u);
    EXPECT_EQ(job.plan().budgets, (std::vector<u32>{4, 4, 3}));

    std::vector<size_t> sizes;
    std::vector<u8> got;
    for (;;) {
        auto chunk = job.next_chunk();
        if (chunk.empty()) break;
        sizes.push_back(chunk.size());
        got.insert(got.end(), chunk.begin(), chunk.end());
    }
    EXPECT_EQ(got, data);
    ASSERT_EQ(sizes.size(), 11u);
    EXPECT_EQ(sizes.back(), 500u);
    EXPECT_TRUE(job.finished());
    EXPECT_EQ(job.bytes_received(), data.size());
    EXPECT_EQ(job.open_workers(), 0u);
    EXPECT_EQ(cloud.open_count(), 3);
    EXPECT_EQ(cloud.close_count(), 3);
    EXPECT_TRUE(job.next_chunk().empty());
}

TEST(DownloadJob, ConnectionsOpenLazily) {
    FakeCloud cloud;
    u64 id = cloud.put_object(pattern_bytes(4000));
    CancelToken token;
    DownloadJob job(connected_session(cloud), FileLocation{1, id, 4000}, small_opts(2), token);
    EXPECT_EQ(cloud.open_count(), 0);
    job.next_chunk();
    EXPECT_EQ(cloud.open_count(), 2);
}

TEST(DownloadJob, RequestsOverlapWithinARound) {
    FakeCloud cloud;
    cloud.op_delay = milliseconds(20);
    u64 id = cloud.put_object(pattern_bytes(8000));
    CancelToken token;
    DownloadJob job(connected_session(cloud), FileLocation{1, id, 8000}, small_opts(4), token);
    EXPECT_EQ(drain(job).size(), 8000u);
    EXPECT_GT(cloud.max_in_flight.load(), 1);
    EXPECT_LE(cloud.max_in_flight.load(), 4);
}

TEST(DownloadJob, HomeEndpointSkipsHandshake) {
    FakeCloud cloud;
    u64 id = cloud.put_object(pattern_bytes(5000));
    CancelToken token;
    DownloadJob job(connected_session(cloud), FileLocation{1, id, 5000}, small_opts(4), token);
    drain(job);
    EXPECT_EQ(cloud.exports, 0);
    EXPECT_EQ(cloud.imports, 0);
    EXPECT_EQ(cloud.keyed_opens, 4);
}

TEST(DownloadJob, OtherEndpointRunsHandshakeOnce) {
    FakeCloud cloud;
    auto data = pattern_bytes(5000);
    u64 id = cloud.put_object(data);
    CancelToken token;
    DownloadJob job(connected_session(cloud), FileLocation{2, id, data.size()}, small_opts(4), token);
    EXPECT_EQ(drain(job), data);
    EXPECT_EQ(cloud.exports, 1);
    EXPECT_EQ(cloud.imports, 1);
    EXPECT_EQ(cloud.keyed_opens, 3);
}

TEST(ConnectionFactory, FailedImportKeepsItsErrorWhenCleanupThrows) {
    FakeCloud cloud;
    cloud.fail_import     = true;
    cloud.fail_disconnect = true;
    ConnectionFactory factory(connected_session(cloud), 2);
    try {
        factory.create();
        FAIL() << "import should have been rejected";
    } catch (const RemoteError& e) {
        EXPECT_EQ(e.code(), ErrorCode::AUTH_INVALID);
    }
    EXPECT_EQ(cloud.close_count(), 1);

    // No key was stored, so the next connection runs the handshake again
    cloud.fail_import     = false;
    cloud.fail_disconnect = false;
    auto conn = factory.create();
    ASSERT_NE(conn, nullptr);
    EXPECT_EQ(cloud.exports, 2);
    EXPECT_EQ(cloud.imports, 2);
    conn->disconnect();
}

TEST(DownloadJob, RecoversFromRateLimits) {
    FakeCloud cloud;
    auto data = pattern_bytes(6000);
    u64 id = cloud.put_object(data);
    cloud.rate_limits_left = 2;
    cloud.rate_limit_wait  = 35;
    CancelToken token;
    DownloadJob job(connected_session(cloud), FileLocation{1, id, data.size()}, small_opts(1), token);
    EXPECT_EQ(drain(job), data);
}

TEST(DownloadJob, RetryExhaustionAbortsAndClosesEverything) {
    FakeCloud cloud;
    u64 id = cloud.put_object(pattern_bytes(6000));
    cloud.rate_limit_forever = true;
    CancelToken token;
    DownloadJob job(connected_session(cloud), FileLocation{1, id, 6000}, small_opts(3), token);
    EXPECT_THROW(job.next_chunk(), RetryExhaustedError);
    EXPECT_TRUE(job.finished());
    EXPECT_EQ(job.open_workers(), 0u);
    EXPECT_EQ(cloud.close_count(), cloud.open_count());
    EXPECT_TRUE(job.next_chunk().empty());
}

TEST(DownloadJob, FatalErrorMidStreamCleansUp) {
    FakeCloud cloud;
    u64 id = cloud.put_object(pattern_bytes(9000));
    cloud.fail_get_offset = 4000;
    CancelToken token;
    DownloadJob job(connected_session(cloud), FileLocation{1, id, 9000}, small_opts(3), token);
    EXPECT_THROW(drain(job), RemoteError);
    EXPECT_EQ(cloud.open_count(), 3);
    EXPECT_EQ(cloud.close_count(), 3);
}

TEST(DownloadJob, FailedFanOutRollsBack) {
    FakeCloud cloud;
    u64 id = cloud.put_object(pattern_bytes(9000));
    cloud.fail_open_after = 2;
    CancelToken token;
    DownloadJob job(connected_session(cloud), FileLocation{1, id, 9000}, small_opts(4), token);
    EXPECT_THROW(job.next_chunk(), std::runtime_error);
    EXPECT_EQ(cloud.open_count(), 2);
    EXPECT_EQ(cloud.close_count(), 2);
}

TEST(DownloadJob, EndsEarlyWhenEndpointHasNoData) {
    FakeCloud cloud;
    u64 id = cloud.put_object(pattern_bytes(2500));
    CancelToken token;
    DownloadJob job(connected_session(cloud), FileLocation{1, id, 6000}, small_opts(2), token);
    EXPECT_EQ(drain(job).size(), 2500u);
    EXPECT_EQ(cloud.close_count(), 2);
}

TEST(DownloadJob, EmptyObjectOpensNothing) {
    FakeCloud cloud;
    u64 id = cloud.put_object({});
    CancelToken token;
    DownloadJob job(connected_session(cloud), FileLocation{1, id, 0}, small_opts(4), token);
    EXPECT_TRUE(job.next_chunk().empty());
    EXPECT_EQ(cloud.open_count(), 0);
}

TEST(DownloadJob, CancelledBeforeStart) {
    FakeCloud cloud;
    u64 id = cloud.put_object(pattern_bytes(3000));
    CancelToken token;
    token.cancel();
    DownloadJob job(connected_session(cloud), FileLocation{1, id, 3000}, small_opts(2), token);
    EXPECT_THROW(job.next_chunk(), TransferCancelled);
    EXPECT_EQ(cloud.open_count(), 0);
}

TEST(DownloadJob, DestroyedMidStreamClosesConnections) {
    FakeCloud cloud;
    u64 id = cloud.put_object(pattern_bytes(9000));
    CancelToken token;
    {
        DownloadJob job(connected_session(cloud), FileLocation{1, id, 9000}, small_opts(3), token);
        job.next_chunk();
    }
    EXPECT_EQ(cloud.open_count(), 3);
    EXPECT_EQ(cloud.close_count(), 3);
}

// ---------------------------------------------------------------
// Upload
// ---------------------------------------------------------------

TEST(UploadJob, SmallFileCarriesChecksum) {
    FakeCloud cloud;
    auto session = connected_session(cloud);
    auto data = pattern_bytes(10500);
    CancelToken token;

    UploadJob job(session, data.size(), "a.bin", small_opts(3), token);
    EXPECT_FALSE(job.is_large());
    // Odd-sized writes exercise part buffering
    for (size_t off = 0; off < data.size(); off += 333) {
        size_t n = std::min<size_t>(333, data.size() - off);
        job.write(data.data() + off, n);
    }
    UploadedFile f = job.finish();
    EXPECT_EQ(f.part_count, 11u);
    EXPECT_FALSE(f.big);
    ASSERT_TRUE(f.checksum.has_value());
    EXPECT_EQ(*f.checksum, hash::xxh3_128(data.data(), data.size()));
    EXPECT_EQ(cloud.close_count(), 3);

    FileLocation loc = session->commit_file(f);
    EXPECT_EQ(cloud.object(loc.location_id), data);
    EXPECT_EQ(loc.size, data.size());
}

TEST(UploadJob, PartsAreOrderedPerConnection) {
    FakeCloud cloud;
    cloud.op_delay = milliseconds(2);
    auto data = pattern_bytes(20000);
    CancelToken token;

    UploadJob job(connected_session(cloud), data.size(), "b.bin", small_opts(4), token);
    job.write(data.data(), data.size());
    job.finish();

    ASSERT_EQ(cloud.part_order.size(), 4u);
    size_t total = 0;
    for (const auto& kv : cloud.part_order) {
        const auto& idx = kv.second;
        total += idx.size();
        for (size_t i = 1; i < idx.size(); ++i) {
            EXPECT_EQ(idx[i], idx[i - 1] + 4) << "connection " << kv.first;
        }
    }
    EXPECT_EQ(total, 20u);
}

TEST(UploadJob, LargeFileUsesBigPartsWithoutChecksum) {
    FakeCloud cloud;
    auto session = connected_session(cloud);
    auto data = pattern_bytes(12000);
    JobOptions opts = small_opts(2);
    opts.large_threshold = 5000;
    CancelToken token;

    UploadJob job(session, data.size(), "big.bin", opts, token);
    EXPECT_TRUE(job.is_large());
    job.write(data.data(), data.size());
    UploadedFile f = job.finish();
    EXPECT_TRUE(f.big);
    EXPECT_FALSE(f.checksum.has_value());
    {
        std::lock_guard<std::mutex> lk(cloud.mu);
        const auto& up = cloud.uploads.at(f.file_id);
        EXPECT_TRUE(up.big);
        EXPECT_EQ(up.total, 12u);
    }
    FileLocation loc = session->commit_file(f);
    EXPECT_EQ(cloud.object(loc.location_id), data);
}

TEST(UploadJob, RecoversFromRateLimits) {
    FakeCloud cloud;
    auto session = connected_session(cloud);
    auto data = pattern_bytes(5000);
    cloud.rate_limits_left = 2;
    CancelToken token;

    UploadJob job(session, data.size(), "c.bin", small_opts(1), token);
    job.write(data.data(), data.size());
    FileLocation loc = session->commit_file(job.finish());
    EXPECT_EQ(cloud.object(loc.location_id), data);
}

TEST(UploadJob, WritingPastDeclaredSizeFails) {
    FakeCloud cloud;
    auto data = pattern_bytes(3000);
    CancelToken token;
    UploadJob job(connected_session(cloud), 2000, "d.bin", small_opts(2), token);
    EXPECT_THROW(job.write(data.data(), data.size()), std::invalid_argument);
}

TEST(UploadJob, ShortInputFailsAndCloses) {
    FakeCloud cloud;
    auto data = pattern_bytes(1500);
    CancelToken token;
    UploadJob job(connected_session(cloud), 3000, "e.bin", small_opts(2), token);
    job.write(data.data(), data.size());
    EXPECT_THROW(job.finish(), std::runtime_error);
    EXPECT_EQ(job.open_workers(), 0u);
    EXPECT_EQ(cloud.close_count(), 2);
}

TEST(UploadJob, FailedFanOutRollsBack) {
    FakeCloud cloud;
    cloud.fail_open_after = 1;
    CancelToken token;
    EXPECT_THROW(UploadJob(connected_session(cloud), 5000, "f.bin", small_opts(3), token),
                 std::runtime_error);
    EXPECT_EQ(cloud.open_count(), 1);
    EXPECT_EQ(cloud.close_count(), 1);
}

TEST(UploadJob, EmptyFile) {
    FakeCloud cloud;
    auto session = connected_session(cloud);
    CancelToken token;
    UploadJob job(session, 0, "empty", small_opts(4), token);
    EXPECT_EQ(job.open_workers(), 0u);
    UploadedFile f = job.finish();
    EXPECT_EQ(f.part_count, 0u);
    FileLocation loc = session->commit_file(f);
    EXPECT_EQ(loc.size, 0u);
    EXPECT_EQ(cloud.open_count(), 0);
}

// ---------------------------------------------------------------
// File helpers
// ---------------------------------------------------------------

TEST(FileTransfer, UploadThenDownloadIsIdentical) {
    FakeCloud cloud;
    auto session = connected_session(cloud);
    TempDir dir;
    auto data = pattern_bytes(25 * 1000 + 17, 99);
    write_file(dir.file("in.bin"), data);
    CancelToken token;

    u64 last_progress = 0;
    FileLocation loc = upload_from_file(session, dir.file("in.bin"), "in.bin", small_opts(4),
                                        token, [&](u64 done, u64) { last_progress = done; });
    EXPECT_EQ(last_progress, data.size());
    EXPECT_EQ(loc.size, data.size());

    u64 got = download_to_file(session, loc, dir.file("out/copy.bin"), small_opts(3), token);
    EXPECT_EQ(got, data.size());
    EXPECT_EQ(read_file(dir.file("out/copy.bin")), data);
}

TEST(FileTransfer, ShortDownloadLeavesNoFile) {
    FakeCloud cloud;
    TempDir dir;
    u64 id = cloud.put_object(pattern_bytes(1500));
    CancelToken token;
    EXPECT_THROW(download_to_file(connected_session(cloud), FileLocation{1, id, 4000},
                                  dir.file("short.bin"), small_opts(2), token),
                 std::runtime_error);
    EXPECT_FALSE(fs::exists(dir.file("short.bin")));
    EXPECT_FALSE(fs::exists(dir.file("short.bin.tmp")));
}
