/**
 * @file bench_concurrency_limiter.cpp
 * @brief Benchmarks for the FIFO concurrency limiter
 */

#include <benchmark/benchmark.h>

#include <kcenon/object_transfer/core/concurrency_limiter.h>

#include <memory>

namespace kcenon::object_transfer::benchmark {

/**
 * @brief Acquire and release without contention
 */
static void BM_ConcurrencyLimiter_Uncontended(::benchmark::State& state) {
    concurrency_limiter limiter(4);

    for (auto _ : state) {
        scoped_permit permit(limiter);
        ::benchmark::ClobberMemory();
    }

    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

static void BM_ConcurrencyLimiter_TryAcquire(::benchmark::State& state) {
    concurrency_limiter limiter(1);

    for (auto _ : state) {
        if (limiter.try_acquire()) {
            limiter.release();
        }
    }

    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Several threads competing for fewer permits
 */
static void BM_ConcurrencyLimiter_Contended(::benchmark::State& state) {
    static std::unique_ptr<concurrency_limiter> limiter;
    if (state.thread_index() == 0) {
        limiter = std::make_unique<concurrency_limiter>(
            static_cast<std::size_t>(state.range(0)));
    }

    for (auto _ : state) {
        auto value = limiter->run([] { return 1; });
        ::benchmark::DoNotOptimize(value);
    }

    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_ConcurrencyLimiter_Uncontended);
BENCHMARK(BM_ConcurrencyLimiter_TryAcquire);

BENCHMARK(BM_ConcurrencyLimiter_Contended)
    ->Arg(1)
    ->Arg(3)
    ->Threads(2)
    ->Threads(8)
    ->UseRealTime();

}  // namespace kcenon::object_transfer::benchmark
