#include "bench_stats.hpp"

#include <cstdint>
#include <vector>

#include <gtest/gtest.h>

namespace sortkv::bench {

// ── compute_stats ────────────────────────────────────────────────────────────

TEST(BenchStatsTest, EmptySampleSetReportsOnlyOps) {
    std::vector<int64_t> latencies;
    auto r = compute_stats(latencies, 0);
    EXPECT_EQ(r.total_ops, 0u);
    EXPECT_EQ(r.ops_per_sec, 0.0);
}

TEST(BenchStatsTest, ThroughputUsesGivenOpCount) {
    // Three batches of 1000, 1000 and 500 entries, each timed at 1 ms.
    std::vector<int64_t> latencies{1'000'000, 1'000'000, 1'000'000};
    auto r = compute_stats(latencies, 2'500);

    EXPECT_EQ(r.total_ops, 2'500u);
    EXPECT_DOUBLE_EQ(r.elapsed_sec, 0.003);
    EXPECT_NEAR(r.ops_per_sec, 2'500 / 0.003, 1e-6);
    EXPECT_DOUBLE_EQ(r.avg_us, 1'000.0);
}

TEST(BenchStatsTest, PercentilesFromSortedSamples) {
    std::vector<int64_t> latencies;
    for (int64_t i = 100; i >= 1; --i) {
        latencies.push_back(i * 1'000);  // 1..100 µs, unsorted
    }
    auto r = compute_stats(latencies, latencies.size());

    EXPECT_EQ(r.total_ops, 100u);
    EXPECT_DOUBLE_EQ(r.p50_us, 50.0);
    EXPECT_DOUBLE_EQ(r.p90_us, 90.0);
    EXPECT_DOUBLE_EQ(r.p99_us, 99.0);
    EXPECT_DOUBLE_EQ(r.p999_us, 99.0);
}

} // namespace sortkv::bench
