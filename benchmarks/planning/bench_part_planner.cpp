/**
 * @file bench_part_planner.cpp
 * @brief Benchmarks for multipart planning and digest computation
 */

#include <benchmark/benchmark.h>

#include <kcenon/object_transfer/core/checksum.h>
#include <kcenon/object_transfer/core/part_planner.h>

#include "utils/benchmark_helpers.h"

namespace kcenon::object_transfer::benchmark {

/**
 * @brief Plan parts for objects up to the 10,000 part limit
 */
static void BM_PartPlanner_Plan(::benchmark::State& state) {
    const auto total = static_cast<uint64_t>(state.range(0));

    for (auto _ : state) {
        auto part_size = part_planner::fit_part_size(total, sizes::default_part);
        auto parts = part_planner::plan(total, part_size);
        if (!parts) {
            state.SkipWithError("planning failed");
            return;
        }
        ::benchmark::DoNotOptimize(parts.value().data());
    }

    state.SetItemsProcessed(
        static_cast<int64_t>(part_planner::part_count(
            total, part_planner::fit_part_size(total, sizes::default_part))) *
        static_cast<int64_t>(state.iterations()));
}

static void BM_Checksum_MD5(::benchmark::State& state) {
    const auto size = static_cast<std::size_t>(state.range(0));
    auto data = generate_random_data(size, 42);

    for (auto _ : state) {
        auto hex = checksum::md5(data);
        ::benchmark::DoNotOptimize(hex);
    }

    state.SetBytesProcessed(static_cast<int64_t>(size) *
                            static_cast<int64_t>(state.iterations()));
}

static void BM_Checksum_SHA256(::benchmark::State& state) {
    const auto size = static_cast<std::size_t>(state.range(0));
    auto data = generate_random_data(size, 42);

    for (auto _ : state) {
        auto hex = checksum::sha256(data);
        ::benchmark::DoNotOptimize(hex);
    }

    state.SetBytesProcessed(static_cast<int64_t>(size) *
                            static_cast<int64_t>(state.iterations()));
}

static void BM_Checksum_SHA256_File(::benchmark::State& state) {
    const auto size = static_cast<std::size_t>(state.range(0));
    temp_file_manager temp_files;
    auto path = temp_files.create_random_file("digest.bin", size, 42);

    for (auto _ : state) {
        auto hex = checksum::file_digest(path, checksum_algorithm::sha256);
        if (!hex) {
            state.SkipWithError("file digest failed");
            return;
        }
        ::benchmark::DoNotOptimize(hex.value());
    }

    state.SetBytesProcessed(static_cast<int64_t>(size) *
                            static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_PartPlanner_Plan)
    ->Arg(static_cast<int64_t>(100 * sizes::MB))
    ->Arg(static_cast<int64_t>(5 * sizes::GB))
    ->Arg(static_cast<int64_t>(5000ULL * sizes::GB))
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK(BM_Checksum_MD5)
    ->Arg(static_cast<int64_t>(64 * sizes::KB))
    ->Arg(static_cast<int64_t>(1 * sizes::MB))
    ->Arg(static_cast<int64_t>(sizes::default_part))
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK(BM_Checksum_SHA256)
    ->Arg(static_cast<int64_t>(64 * sizes::KB))
    ->Arg(static_cast<int64_t>(1 * sizes::MB))
    ->Arg(static_cast<int64_t>(sizes::default_part))
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK(BM_Checksum_SHA256_File)
    ->Arg(static_cast<int64_t>(sizes::small_object))
    ->Arg(static_cast<int64_t>(sizes::medium_object))
    ->Unit(::benchmark::kMillisecond);

}  // namespace kcenon::object_transfer::benchmark
