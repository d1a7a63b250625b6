#include "../client/transfer_job.hpp"
#include <gtest/gtest.h>
#include <numeric>

namespace {

constexpr u64 KiB = 1024;
constexpr u64 MiB = 1024 * KiB;

u64 sum(const std::vector<u32>& v) {
    return std::accumulate(v.begin(), v.end(), (u64)0);
}

} // namespace

TEST(PartPlan, TenMiBOverFourConnectionsIsEven) {
    PartPlan p = plan_parts(10 * MiB, 512 * KiB, 4);
    EXPECT_EQ(p.part_count, 20u);
    EXPECT_EQ(p.connections, 4);
    ASSERT_EQ(p.budgets.size(), 4u);
    for (u32 b : p.budgets) EXPECT_EQ(b, 5u);
}

TEST(PartPlan, RemainderGoesToLeadingWorkers) {
    PartPlan p = plan_parts(10 * 1000 + 1, 1000, 4);   // 11 parts
    EXPECT_EQ(p.part_count, 11u);
    EXPECT_EQ(p.budgets, (std::vector<u32>{3, 3, 3, 2}));
    EXPECT_EQ(sum(p.budgets), p.part_count);
}

TEST(PartPlan, BudgetsCoverEveryPartForManySizes) {
    for (u64 size : {1ull, 999ull, 1000ull, 1001ull, 7777ull, 64000ull, 123457ull}) {
        for (int conns = 1; conns <= 9; ++conns) {
            PartPlan p = plan_parts(size, 1000, conns);
            EXPECT_EQ(p.part_count, (size + 999) / 1000);
            EXPECT_EQ(sum(p.budgets), p.part_count) << size << "/" << conns;
            u32 extra = p.part_count % (u32)p.connections;
            for (size_t i = 0; i < p.budgets.size(); ++i) {
                EXPECT_EQ(p.budgets[i], p.part_count / (u32)p.connections + (i < extra ? 1u : 0u));
            }
        }
    }
}

TEST(PartPlan, ConnectionsCappedAtPartCount) {
    PartPlan p = plan_parts(3 * 512 * KiB, 512 * KiB, 8);
    EXPECT_EQ(p.part_count, 3u);
    EXPECT_EQ(p.connections, 3);
    EXPECT_EQ(p.budgets, (std::vector<u32>{1, 1, 1}));
}

TEST(PartPlan, EmptyFileHasNoWork) {
    PartPlan p = plan_parts(0, 512 * KiB, 8);
    EXPECT_EQ(p.part_count, 0u);
    EXPECT_EQ(p.connections, 0);
    EXPECT_TRUE(p.budgets.empty());
}

TEST(PartPlan, RejectsZeroPartSize) {
    EXPECT_THROW(plan_parts(10, 0, 1), std::invalid_argument);
}

TEST(ConnectionPolicy, AdaptiveScalesWithSize) {
    auto policy = adaptive_connection_policy(8);
    EXPECT_EQ(policy(1 * KiB), 2);
    EXPECT_EQ(policy(10 * KiB), 4);
    EXPECT_EQ(policy(5 * MiB), 4);
    EXPECT_EQ(policy(8 * MiB), 8);
    EXPECT_EQ(policy(2048 * MiB), 8);

    auto small = adaptive_connection_policy(3);
    EXPECT_EQ(small(20 * KiB), 3);
    EXPECT_EQ(small(1 * KiB), 2);
}

TEST(ConnectionPolicy, FixedIgnoresSize) {
    auto policy = fixed_connection_policy(6);
    EXPECT_EQ(policy(1), 6);
    EXPECT_EQ(policy(100 * MiB), 6);
}

TEST(ConnectionPolicy, ChosenFromConfig) {
    ServiceConfig cfg;
    cfg.connections_per_transfer = 5;
    cfg.connection_policy = ConnectionPolicyKind::FIXED;
    EXPECT_EQ(make_connection_policy(cfg)(1), 5);

    cfg.connection_policy = ConnectionPolicyKind::ADAPTIVE;
    EXPECT_EQ(make_connection_policy(cfg)(1), 2);
    EXPECT_EQ(make_connection_policy(cfg)(9 * MiB), 5);
}

TEST(JobOptions, ExplicitCountOverridesPolicy) {
    JobOptions opts;
    opts.policy = fixed_connection_policy(8);
    EXPECT_EQ(opts.connection_count(100), 8);
    opts.connections = 3;
    EXPECT_EQ(opts.connection_count(100), 3);
    opts.connections = 0;
    EXPECT_EQ(opts.connection_count(100), 1);
}
