#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <numeric>
#include <vector>

namespace sortkv::bench {

// ── Benchmark statistics ─────────────────────────────────────────────────────

struct BenchResult {
    std::size_t total_ops{};
    double elapsed_sec{};
    double ops_per_sec{};
    double p50_us{};
    double p90_us{};
    double p99_us{};
    double p999_us{};
    double avg_us{};
};

// `total_ops` exceeds the sample count when one timed sample covers several
// logical ops (a put_many batch, a full scan).
inline BenchResult compute_stats(std::vector<int64_t>& latencies_ns,
                                 std::size_t total_ops) {
    BenchResult r;
    r.total_ops = total_ops;

    if (latencies_ns.empty()) return r;

    std::sort(latencies_ns.begin(), latencies_ns.end());

    auto total_ns = std::accumulate(latencies_ns.begin(), latencies_ns.end(), int64_t{0});
    r.elapsed_sec = static_cast<double>(total_ns) / 1e9;
    r.ops_per_sec = r.elapsed_sec > 0
                        ? static_cast<double>(r.total_ops) / r.elapsed_sec
                        : 0.0;
    r.avg_us      = static_cast<double>(total_ns) / static_cast<double>(latencies_ns.size()) / 1000.0;

    auto percentile = [&](double p) -> double {
        auto idx = static_cast<std::size_t>(p * static_cast<double>(latencies_ns.size() - 1));
        return static_cast<double>(latencies_ns[idx]) / 1000.0; // ns → µs
    };

    r.p50_us  = percentile(0.50);
    r.p90_us  = percentile(0.90);
    r.p99_us  = percentile(0.99);
    r.p999_us = percentile(0.999);

    return r;
}

} // namespace sortkv::bench
