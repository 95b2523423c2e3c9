/**
 * @file bench_transfer_throughput.cpp
 * @brief End-to-end upload and download throughput against the in-memory store
 */

#include <benchmark/benchmark.h>

#include <kcenon/object_transfer/engine/transfer_manager.h>
#include <kcenon/object_transfer/storage/memory_object_store.h>

#include "utils/benchmark_helpers.h"

#include <memory>
#include <string>

namespace kcenon::object_transfer::benchmark {

namespace {

auto make_manager(const std::shared_ptr<memory_object_store>& store,
                  std::size_t concurrency) -> result<transfer_manager> {
    return transfer_manager::builder()
        .with_store(store)
        .with_max_concurrent_transfers(concurrency)
        .with_part_size(sizes::min_part)
        .with_multipart_threshold(sizes::min_part)
        .with_retry_policy(retry_policy::no_retry())
        .build();
}

}  // namespace

/**
 * @brief Upload one file; arg0 is the size, arg1 the concurrency
 */
static void BM_Upload_Throughput(::benchmark::State& state) {
    const auto size = static_cast<std::size_t>(state.range(0));
    const auto concurrency = static_cast<std::size_t>(state.range(1));

    temp_file_manager temp_files;
    auto source = temp_files.create_random_file("upload.bin", size, 42);

    auto store = std::make_shared<memory_object_store>();
    auto manager = make_manager(store, concurrency);
    if (!manager) {
        state.SkipWithError("failed to build manager");
        return;
    }

    for (auto _ : state) {
        auto id = manager.value().start_upload(
            transfer_task::make_upload("bench/upload.bin", source));
        if (!id) {
            state.SkipWithError("failed to start upload");
            return;
        }
        auto finished = manager.value().wait(id.value());
        if (!finished || finished.value().status != transfer_status::completed) {
            state.SkipWithError("upload did not complete");
            return;
        }
        manager.value().clear_finished();
    }

    state.SetBytesProcessed(static_cast<int64_t>(size) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Stream one object to disk; arg0 is the size
 */
static void BM_Download_Throughput(::benchmark::State& state) {
    const auto size = static_cast<std::size_t>(state.range(0));

    temp_file_manager temp_files;
    auto destination = temp_files.reserve_path("download.bin");

    auto store = std::make_shared<memory_object_store>();
    store->seed_object("bench/download.bin", generate_random_data(size, 42));

    auto manager = make_manager(store, 1);
    if (!manager) {
        state.SkipWithError("failed to build manager");
        return;
    }

    download_options options;
    options.resumable = false;
    options.overwrite = true;

    for (auto _ : state) {
        auto id = manager.value().start_download(
            transfer_task::make_download("bench/download.bin", destination), options);
        if (!id) {
            state.SkipWithError("failed to start download");
            return;
        }
        auto finished = manager.value().wait(id.value());
        if (!finished || finished.value().status != transfer_status::completed) {
            state.SkipWithError("download did not complete");
            return;
        }
        manager.value().clear_finished();
    }

    state.SetBytesProcessed(static_cast<int64_t>(size) *
                            static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_Upload_Throughput)
    ->Args({static_cast<int64_t>(sizes::small_object), 1})
    ->Args({static_cast<int64_t>(sizes::medium_object), 1})
    ->Args({static_cast<int64_t>(sizes::medium_object), 3})
    ->Args({static_cast<int64_t>(sizes::large_object), 3})
    ->Unit(::benchmark::kMillisecond)
    ->UseRealTime();

BENCHMARK(BM_Download_Throughput)
    ->Arg(static_cast<int64_t>(sizes::small_object))
    ->Arg(static_cast<int64_t>(sizes::medium_object))
    ->Unit(::benchmark::kMillisecond)
    ->UseRealTime();

}  // namespace kcenon::object_transfer::benchmark
