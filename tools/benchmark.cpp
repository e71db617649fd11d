// Throughput benchmark: compares the storage backends side by side.
//
// For every backend (file, sqlite, rocksdb) the benchmark opens a fresh store
// in a temporary directory and measures:
//   (1) N single put() calls
//   (2) the same N entries written with put_many() in batches
//   (3) N get() calls on keys that exist
//   (4) repeated full items() scans
//
// Prints: total ops, elapsed time, ops/sec, and latency percentiles (p50,
// p90, p99, p999) for each phase.

#include "bench_stats.hpp"
#include "common/error.hpp"
#include "storage/store_factory.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

#include <unistd.h>

namespace {

namespace fs = std::filesystem;

using sortkv::bench::BenchResult;
using sortkv::bench::compute_stats;

using clock = std::chrono::high_resolution_clock;
using ns    = std::chrono::nanoseconds;

constexpr std::size_t kBatchSize = 1'000;
constexpr std::size_t kScanRuns  = 10;

constexpr std::array kBackends = {
    sortkv::Backend::File,
    sortkv::Backend::Sqlite,
    sortkv::Backend::RocksDB,
};

// ── Output ───────────────────────────────────────────────────────────────────

void print_result(const std::string& label, const BenchResult& r) {
    fprintf(stdout,
        "\n── %s ──\n"
        "  Total ops:    %zu\n"
        "  Elapsed:      %.3f s\n"
        "  Throughput:   %.0f ops/sec\n"
        "  Avg sample:   %.1f µs\n"
        "  p50:          %.1f µs\n"
        "  p90:          %.1f µs\n"
        "  p99:          %.1f µs\n"
        "  p99.9:        %.1f µs\n",
        label.c_str(), r.total_ops, r.elapsed_sec, r.ops_per_sec,
        r.avg_us, r.p50_us, r.p90_us, r.p99_us, r.p999_us);
}

template <typename Fn>
int64_t time_ns(Fn&& fn) {
    auto t0 = clock::now();
    fn();
    auto t1 = clock::now();
    return std::chrono::duration_cast<ns>(t1 - t0).count();
}

// Zero-padded so that byte order matches numeric order.
std::string make_key(const char* prefix, std::size_t i) {
    return fmt::format("{}{:010}", prefix, i);
}

// ── Benchmark runners ────────────────────────────────────────────────────────

BenchResult bench_put(sortkv::Store& store, std::size_t n) {
    std::vector<int64_t> latencies;
    latencies.reserve(n);

    for (std::size_t i = 0; i < n; ++i) {
        auto key = make_key("put", i);
        auto val = "val" + std::to_string(i);
        latencies.push_back(time_ns([&] { store.put(key, val); }));
    }
    return compute_stats(latencies, n);
}

BenchResult bench_put_many(sortkv::Store& store, std::size_t n) {
    std::vector<int64_t> latencies;
    latencies.reserve(n / kBatchSize + 1);

    std::vector<sortkv::Entry> batch;
    batch.reserve(kBatchSize);
    for (std::size_t i = 0; i < n; i += kBatchSize) {
        batch.clear();
        for (std::size_t j = i; j < std::min(n, i + kBatchSize); ++j) {
            batch.emplace_back(make_key("many", j), "val" + std::to_string(j));
        }
        latencies.push_back(time_ns([&] { store.put_many(batch); }));
    }
    return compute_stats(latencies, n);
}

BenchResult bench_get(const sortkv::Store& store, std::size_t n) {
    std::vector<int64_t> latencies;
    latencies.reserve(n);

    std::size_t misses = 0;
    for (std::size_t i = 0; i < n; ++i) {
        auto key = make_key("put", i);
        latencies.push_back(time_ns([&] {
            if (!store.get(key)) ++misses;
        }));
    }
    if (misses != 0) {
        spdlog::warn("sortkv-bench: {} unexpected misses", misses);
    }
    return compute_stats(latencies, n);
}

BenchResult bench_scan(const sortkv::Store& store, std::size_t expected) {
    std::vector<int64_t> latencies;
    latencies.reserve(kScanRuns);

    for (std::size_t run = 0; run < kScanRuns; ++run) {
        std::size_t count = 0;
        latencies.push_back(time_ns([&] {
            for (const auto& entry : store.items()) {
                (void)entry;
                ++count;
            }
        }));
        if (count != expected) {
            spdlog::warn("sortkv-bench: scan saw {} entries, expected {}",
                         count, expected);
        }
    }
    return compute_stats(latencies, kScanRuns * expected);
}

void bench_backend(sortkv::Backend backend, const fs::path& root,
                   std::size_t n) {
    const auto name = std::string(sortkv::to_string(backend));
    auto store = sortkv::open_store(backend, root / name / "bench.db");

    auto put_result      = bench_put(*store, n);
    auto put_many_result = bench_put_many(*store, n);
    auto get_result      = bench_get(*store, n);
    auto scan_result     = bench_scan(*store, 2 * n);
    store->close();

    print_result(name + " put", put_result);
    print_result(name + " put_many", put_many_result);
    print_result(name + " get", get_result);
    print_result(name + " scan (items/sec)", scan_result);

    if (put_result.ops_per_sec > 0 && put_many_result.ops_per_sec > 0) {
        fprintf(stdout,
            "\n── %s comparison ──\n"
            "  put_many / put throughput ratio: %.2fx\n",
            name.c_str(), put_many_result.ops_per_sec / put_result.ops_per_sec);
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    // Suppress store logs during benchmark.
    spdlog::set_level(spdlog::level::warn);

    std::size_t num_ops = 10'000;
    if (argc > 1) {
        num_ops = static_cast<std::size_t>(std::atol(argv[1]));
        if (num_ops == 0) num_ops = 10'000;
    }

    const auto root = fs::temp_directory_path() /
                      ("sortkv_bench_" + std::to_string(::getpid()));

    fprintf(stdout,
        "sortkv Backend Benchmark\n"
        "========================\n"
        "Ops:      %zu per phase (put_many batch = %zu)\n"
        "Data dir: %s\n",
        num_ops, kBatchSize, root.string().c_str());

    int rc = 0;
    for (auto backend : kBackends) {
        try {
            bench_backend(backend, root, num_ops);
        } catch (const sortkv::StoreError& e) {
            fprintf(stderr, "%s: %s\n",
                    std::string(sortkv::to_string(backend)).c_str(), e.what());
            rc = 1;
        }
    }

    fprintf(stdout, "\n");

    std::error_code ec;
    fs::remove_all(root, ec);
    return rc;
}
