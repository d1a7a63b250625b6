#include "../client/resource_monitor.hpp"
#include "../client/session_pool.hpp"
#include "fake_remote.hpp"
#include <gtest/gtest.h>

using std::chrono::minutes;

namespace {

// Probe reporting whatever the test last set
struct FixedProbe {
    double rss_mb{100};

    MemoryProbe fn() {
        return [this] {
            MemoryUsage u;
            u.rss_mb = rss_mb;
            return u;
        };
    }
};

MemoryThresholds thresholds() {
    MemoryThresholds t;
    t.high_mb     = 400;
    t.critical_mb = 480;
    t.spike_mb    = 50;
    return t;
}

} // namespace

TEST(ResourceMonitor, ClassifiesAgainstThresholds) {
    FixedProbe probe;
    ResourceMonitor mon(thresholds(), probe.fn());
    EXPECT_EQ(mon.classify(100), MemoryStatus::OK);
    EXPECT_EQ(mon.classify(299.9), MemoryStatus::OK);
    EXPECT_EQ(mon.classify(300), MemoryStatus::ELEVATED);
    EXPECT_EQ(mon.classify(400), MemoryStatus::HIGH);
    EXPECT_EQ(mon.classify(480), MemoryStatus::HIGH);
    EXPECT_EQ(mon.classify(481), MemoryStatus::CRITICAL);
}

TEST(ResourceMonitor, FlagsGrowthBetweenSnapshots) {
    FixedProbe probe;
    ResourceMonitor mon(thresholds(), probe.fn());

    probe.rss_mb = 350;
    EXPECT_FALSE(mon.snapshot("first").spike);
    probe.rss_mb = 380;
    EXPECT_FALSE(mon.snapshot("small step").spike);
    probe.rss_mb = 450;
    ResourceSnapshot jump = mon.snapshot("big step", "owner 3");
    EXPECT_TRUE(jump.spike);
    EXPECT_EQ(jump.status, MemoryStatus::HIGH);
    EXPECT_EQ(jump.context, "owner 3");
    probe.rss_mb = 440;
    EXPECT_FALSE(mon.snapshot("shrink").spike);
}

TEST(ResourceMonitor, KeepsBoundedHistory) {
    FixedProbe probe;
    ResourceMonitor mon(thresholds(), probe.fn());
    for (int i = 0; i < 25; ++i) {
        probe.rss_mb = 100 + i;
        mon.snapshot("op" + std::to_string(i));
    }
    std::vector<ResourceSnapshot> recent = mon.recent();
    ASSERT_EQ(recent.size(), ResourceMonitor::kHistory);
    EXPECT_EQ(recent.front().operation, "op5");
    EXPECT_EQ(recent.back().operation, "op24");
    EXPECT_DOUBLE_EQ(recent.back().rss_mb, 124);
    mon.log_recent();
}

TEST(ResourceMonitor, CountsSessionsThroughThePool) {
    FakeCloud cloud;
    auto factory = std::make_shared<FakeSessionFactory>(cloud);
    FixedProbe probe;
    ResourceMonitor mon(thresholds(), probe.fn());
    SessionPool pool(factory, 2, minutes(30));
    pool.set_observer(&mon);

    const Credentials creds{1, "hash"};
    ASSERT_TRUE(pool.get_or_create(1, creds, "s1").ok());
    ASSERT_TRUE(pool.get_or_create(2, creds, "s2").ok());
    ASSERT_TRUE(pool.get_or_create(1, creds, "s1").ok());
    EXPECT_EQ(mon.counters().sessions_created, 2u);

    // At capacity the least recently used owner is evicted
    ASSERT_TRUE(pool.get_or_create(3, creds, "s3").ok());
    EXPECT_EQ(mon.counters().sessions_created, 3u);
    EXPECT_EQ(mon.counters().sessions_dropped, 1u);

    pool.remove(1);
    EXPECT_EQ(mon.counters().live_sessions(), 1u);
    pool.disconnect_all();
    EXPECT_EQ(mon.counters().sessions_dropped, 3u);
    EXPECT_EQ(mon.counters().live_sessions(), 0u);
    pool.set_observer(nullptr);
}

TEST(ResourceMonitor, TracksTransfersAndStatusLine) {
    FixedProbe probe;
    ResourceMonitor mon(thresholds(), probe.fn());
    probe.rss_mb = 120;
    double start = mon.transfer_started(9, "download 1/100 -> out");
    EXPECT_DOUBLE_EQ(start, 120);
    EXPECT_EQ(mon.counters().running_transfers(), 1u);
    EXPECT_NE(mon.status_line().find("Transfers: 1 running (1 started)"), std::string::npos);

    probe.rss_mb = 150;
    mon.transfer_finished(9, "download 1/100 -> out", start);
    ResourceCounters c = mon.counters();
    EXPECT_EQ(c.transfers_started, 1u);
    EXPECT_EQ(c.transfers_finished, 1u);
    ASSERT_FALSE(mon.recent().empty());
    EXPECT_EQ(mon.recent().back().operation, "transfer end");
    EXPECT_EQ(mon.status_line(),
              "Memory: 150.0 MB (ok), Sessions: 0 live (0 created), Transfers: 0 running (1 started)");
}

TEST(ResourceMonitor, PeriodicCheckRecordsASnapshot) {
    FixedProbe probe;
    ResourceMonitor mon(thresholds(), probe.fn());
    probe.rss_mb = 490;
    mon.periodic_check();
    ASSERT_EQ(mon.recent().size(), 1u);
    EXPECT_EQ(mon.recent()[0].operation, "periodic");
    EXPECT_EQ(mon.recent()[0].status, MemoryStatus::CRITICAL);
}

#ifdef __linux__
TEST(ResourceMonitor, ReadsThisProcessesMemory) {
    MemoryUsage u = read_process_memory();
    EXPECT_GT(u.rss_mb, 0.0);
    EXPECT_GE(u.vms_mb, u.rss_mb);
}
#endif
