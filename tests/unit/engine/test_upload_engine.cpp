/**
 * @file test_upload_engine.cpp
 * @brief Unit tests for upload_engine
 */

#include <gtest/gtest.h>

#include <kcenon/object_transfer/core/checksum.h>
#include <kcenon/object_transfer/engine/upload_engine.h>

#include "engine_test_base.h"

#include <algorithm>

namespace kcenon::object_transfer::test {

using namespace std::chrono_literals;

class UploadEngineTest : public EngineTestBase {
protected:
    auto make_engine() -> std::unique_ptr<upload_engine> {
        return std::make_unique<upload_engine>(engine_resources{store_}, config_,
                                               events_.callbacks());
    }

    auto finish(upload_engine& engine, const transfer_id& id) -> transfer_task {
        auto done = engine.wait(id);
        EXPECT_TRUE(done.has_value());
        return done.has_value() ? done.value() : transfer_task{};
    }
};

// =============================================================================
// Strategy selection
// =============================================================================

TEST_F(UploadEngineTest, SmallFile_UsesSinglePut) {
    auto content = patterned_bytes(4 * 1024 - 1);
    auto path = write_file("small.bin", content);
    auto engine = make_engine();

    auto id = engine->start(transfer_task::make_upload("docs/small.bin", path));
    ASSERT_TRUE(id.has_value());

    auto task = finish(*engine, id.value());
    EXPECT_EQ(task.status, transfer_status::completed);
    EXPECT_EQ(task.transferred_bytes, content.size());
    ASSERT_TRUE(task.etag.has_value());
    EXPECT_EQ(*task.etag, checksum::md5(content));

    EXPECT_EQ(store_->count(store_operation::put_object), 1u);
    EXPECT_EQ(store_->count(store_operation::create_multipart_upload), 0u);
    EXPECT_TRUE(store_->inner().object_data("docs/small.bin") == content);
}

TEST_F(UploadEngineTest, LargeFile_UploadsAscendingParts) {
    config_.part_size_bytes = 10 * 1024 * 1024;
    config_.multipart_threshold_bytes = 5 * 1024 * 1024;
    auto content = patterned_bytes(25 * 1024 * 1024);
    auto path = write_file("large.bin", content);
    auto engine = make_engine();

    auto id = engine->start(transfer_task::make_upload("media/large.bin", path));
    ASSERT_TRUE(id.has_value());
    auto task = finish(*engine, id.value());

    ASSERT_EQ(task.status, transfer_status::completed);
    EXPECT_EQ(store_->count(store_operation::put_object), 0u);

    auto numbers = store_->uploaded_part_numbers();
    std::sort(numbers.begin(), numbers.end());
    EXPECT_EQ(numbers, (std::vector<uint32_t>{1, 2, 3}));

    auto completed = store_->last_completed_parts();
    ASSERT_EQ(completed.size(), 3u);
    for (std::size_t i = 0; i < completed.size(); ++i) {
        EXPECT_EQ(completed[i].part_number, i + 1);
        EXPECT_FALSE(completed[i].etag.empty());
    }

    ASSERT_TRUE(task.etag.has_value());
    EXPECT_NE(task.etag->find("-3"), std::string::npos);
    EXPECT_FALSE(task.upload_id.has_value());
    EXPECT_TRUE(store_->inner().object_data("media/large.bin") == content);
}

TEST_F(UploadEngineTest, ExactlyThreshold_StaysSinglePut) {
    auto content = patterned_bytes(config_.multipart_threshold_bytes);
    auto path = write_file("edge.bin", content);
    auto engine = make_engine();

    auto id = engine->start(transfer_task::make_upload("edge.bin", path));
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(finish(*engine, id.value()).status, transfer_status::completed);
    EXPECT_EQ(store_->count(store_operation::put_object), 1u);
}

TEST_F(UploadEngineTest, ForceMultipart_SmallFile) {
    auto content = patterned_bytes(9 * 1024);
    auto path = write_file("forced.bin", content);
    auto engine = make_engine();

    upload_options options;
    options.force_multipart = true;
    auto id = engine->start(transfer_task::make_upload("forced.bin", path), options);
    ASSERT_TRUE(id.has_value());

    EXPECT_EQ(finish(*engine, id.value()).status, transfer_status::completed);
    EXPECT_EQ(store_->count(store_operation::upload_part), 3u);

    auto parts = engine->get_parts(id.value());
    ASSERT_TRUE(parts.has_value());
    ASSERT_EQ(parts.value().size(), 3u);
    EXPECT_EQ(parts.value().back().size, 1024u);
    for (const auto& part : parts.value()) {
        EXPECT_TRUE(part.is_done());
    }
}

TEST_F(UploadEngineTest, EmptyFile_CompletesWithSinglePut) {
    auto path = write_file("empty.bin", {});
    auto engine = make_engine();

    upload_options options;
    options.force_multipart = true;
    auto id = engine->start(transfer_task::make_upload("empty.bin", path), options);
    ASSERT_TRUE(id.has_value());

    EXPECT_EQ(finish(*engine, id.value()).status, transfer_status::completed);
    EXPECT_EQ(store_->count(store_operation::put_object), 1u);
    EXPECT_TRUE(store_->inner().contains("empty.bin"));
}

// =============================================================================
// Validation
// =============================================================================

TEST_F(UploadEngineTest, Start_RejectsMissingSource) {
    auto engine = make_engine();
    auto id = engine->start(transfer_task::make_upload("k", test_dir_ / "absent.bin"));
    ASSERT_FALSE(id.has_value());
    EXPECT_EQ(id.error().code, error_code::file_not_found);
    EXPECT_TRUE(engine->list_tasks().empty());
}

TEST_F(UploadEngineTest, Start_RejectsDirectoryAndEmptyKey) {
    auto engine = make_engine();

    auto dir = engine->start(transfer_task::make_upload("k", test_dir_));
    ASSERT_FALSE(dir.has_value());
    EXPECT_EQ(dir.error().code, error_code::invalid_path);

    auto path = write_file("a.bin", bytes_of("a"));
    auto no_key = engine->start(transfer_task::make_upload("", path));
    ASSERT_FALSE(no_key.has_value());
    EXPECT_EQ(no_key.error().code, error_code::invalid_argument);

    auto wrong = engine->start(transfer_task::make_download("k", path));
    ASSERT_FALSE(wrong.has_value());
    EXPECT_EQ(wrong.error().code, error_code::invalid_argument);
}

TEST_F(UploadEngineTest, ResumeUpload_RejectsEmptyUploadId) {
    auto path = write_file("a.bin", bytes_of("a"));
    auto engine = make_engine();
    auto id = engine->resume_upload(transfer_task::make_upload("k", path), "");
    ASSERT_FALSE(id.has_value());
    EXPECT_EQ(id.error().code, error_code::invalid_argument);
}

// =============================================================================
// Retry and failure
// =============================================================================

TEST_F(UploadEngineTest, TransientPartFailure_IsRetried) {
    auto content = patterned_bytes(20 * 1024);
    auto path = write_file("flaky.bin", content);
    store_->fail_part(2, 2, error{error_code::request_timeout, "timed out"});
    auto engine = make_engine();

    auto id = engine->start(transfer_task::make_upload("flaky.bin", path));
    ASSERT_TRUE(id.has_value());

    EXPECT_EQ(finish(*engine, id.value()).status, transfer_status::completed);
    auto numbers = store_->uploaded_part_numbers();
    EXPECT_EQ(std::count(numbers.begin(), numbers.end(), 2u), 3);
    EXPECT_TRUE(store_->inner().object_data("flaky.bin") == content);
}

TEST_F(UploadEngineTest, PartExhaustsRetries_AbortsUpload) {
    auto content = patterned_bytes(20 * 1024);
    auto path = write_file("doomed.bin", content);
    store_->fail_part(3, 10, error{error_code::connection_lost, "reset"});
    auto engine = make_engine();

    auto id = engine->start(transfer_task::make_upload("doomed.bin", path));
    ASSERT_TRUE(id.has_value());
    auto task = finish(*engine, id.value());

    EXPECT_EQ(task.status, transfer_status::failed);
    ASSERT_TRUE(task.last_error.has_value());
    EXPECT_EQ(task.last_error->code, error_code::connection_lost);
    EXPECT_TRUE(task.last_error->retryable);
    EXPECT_FALSE(task.upload_id.has_value());

    EXPECT_EQ(store_->count(store_operation::abort_multipart_upload), 1u);
    EXPECT_EQ(store_->count(store_operation::complete_multipart_upload), 0u);
    EXPECT_EQ(store_->inner().open_upload_count(), 0u);
    EXPECT_FALSE(store_->inner().contains("doomed.bin"));
    EXPECT_EQ(events_.error_count(), 1u);
}

TEST_F(UploadEngineTest, NonRetryableError_FailsAfterOneCall) {
    auto path = write_file("denied.bin", bytes_of("secret"));
    store_->fail_next(store_operation::put_object, 1,
                      error{error_code::access_denied, "Access Denied", 403});
    auto engine = make_engine();

    auto id = engine->start(transfer_task::make_upload("denied.bin", path));
    ASSERT_TRUE(id.has_value());
    auto task = finish(*engine, id.value());

    EXPECT_EQ(task.status, transfer_status::failed);
    EXPECT_EQ(store_->count(store_operation::put_object), 1u);
    ASSERT_TRUE(task.last_error.has_value());
    EXPECT_EQ(task.last_error->category, error_category::storage_service);
    EXPECT_FALSE(task.last_error->retryable);
}

TEST_F(UploadEngineTest, Retry_CreatesNewTaskThatSucceeds) {
    auto content = bytes_of("second time lucky");
    auto path = write_file("again.bin", content);
    store_->fail_next(store_operation::put_object, 3,
                      error{error_code::request_timeout, "timed out"});
    auto engine = make_engine();

    auto first = engine->start(transfer_task::make_upload("again.bin", path));
    ASSERT_TRUE(first.has_value());
    ASSERT_EQ(finish(*engine, first.value()).status, transfer_status::failed);

    auto second = engine->retry(first.value());
    ASSERT_TRUE(second.has_value());
    EXPECT_NE(second.value().value, first.value().value);

    auto task = finish(*engine, second.value());
    EXPECT_EQ(task.status, transfer_status::completed);
    EXPECT_EQ(task.retry_count, 1u);
    EXPECT_TRUE(store_->inner().object_data("again.bin") == content);

    auto not_failed = engine->retry(second.value());
    ASSERT_FALSE(not_failed.has_value());
    EXPECT_EQ(not_failed.error().code, error_code::invalid_state_transition);
}

TEST_F(UploadEngineTest, Retry_BudgetExhausted) {
    auto path = write_file("never.bin", bytes_of("x"));
    store_->fail_next(store_operation::put_object, 100,
                      error{error_code::access_denied, "Access Denied", 403});
    auto engine = make_engine();

    auto task = transfer_task::make_upload("never.bin", path);
    task.max_retries = 1;
    auto first = engine->start(std::move(task));
    ASSERT_TRUE(first.has_value());
    ASSERT_EQ(finish(*engine, first.value()).status, transfer_status::failed);

    auto second = engine->retry(first.value());
    ASSERT_TRUE(second.has_value());
    ASSERT_EQ(finish(*engine, second.value()).status, transfer_status::failed);

    auto third = engine->retry(second.value());
    ASSERT_FALSE(third.has_value());
    EXPECT_EQ(third.error().code, error_code::retry_budget_exhausted);
}

// =============================================================================
// Resume
// =============================================================================

TEST_F(UploadEngineTest, ResumeUpload_SkipsPartsTheStoreHas) {
    auto content = patterned_bytes(18 * 1024);
    auto path = write_file("resume.bin", content);

    auto created = store_->inner().create_multipart_upload("resume.bin", {});
    ASSERT_TRUE(created.has_value());
    auto upload_id = created.value();
    for (uint32_t n = 1; n <= 2; ++n) {
        std::span<const std::byte> slice(content.data() + (n - 1) * 4096, 4096);
        ASSERT_TRUE(store_->inner().upload_part("resume.bin", upload_id, n, slice, {})
                        .has_value());
    }

    auto engine = make_engine();
    auto id = engine->resume_upload(transfer_task::make_upload("resume.bin", path),
                                    upload_id);
    ASSERT_TRUE(id.has_value());
    auto task = finish(*engine, id.value());

    ASSERT_EQ(task.status, transfer_status::completed);
    EXPECT_EQ(store_->count(store_operation::list_parts), 1u);
    EXPECT_EQ(store_->count(store_operation::create_multipart_upload), 0u);

    auto numbers = store_->uploaded_part_numbers();
    std::sort(numbers.begin(), numbers.end());
    EXPECT_EQ(numbers, (std::vector<uint32_t>{3, 4, 5}));
    EXPECT_TRUE(store_->inner().object_data("resume.bin") == content);

    // Progress starts from the bytes the store already had
    auto progress = events_.progress_for(id.value());
    ASSERT_FALSE(progress.empty());
    EXPECT_EQ(progress.front(), 8u * 1024);
}

TEST_F(UploadEngineTest, ResumeUpload_UnknownUploadFails) {
    auto path = write_file("lost.bin", patterned_bytes(18 * 1024));
    auto engine = make_engine();

    auto id = engine->resume_upload(transfer_task::make_upload("lost.bin", path),
                                    "no-such-upload");
    ASSERT_TRUE(id.has_value());
    auto task = finish(*engine, id.value());

    EXPECT_EQ(task.status, transfer_status::failed);
    ASSERT_TRUE(task.last_error.has_value());
    EXPECT_EQ(task.last_error->code, error_code::upload_not_found);
    EXPECT_FALSE(task.upload_id.has_value());
}

// =============================================================================
// Pause, resume, cancel
// =============================================================================

TEST_F(UploadEngineTest, PauseThenResume_Completes) {
    config_.max_concurrent_transfers = 1;
    store_->set_part_delay(20ms);
    auto content = patterned_bytes(40 * 1024);
    auto path = write_file("pausable.bin", content);
    auto engine = make_engine();

    auto id = engine->start(transfer_task::make_upload("pausable.bin", path));
    ASSERT_TRUE(id.has_value());
    ASSERT_TRUE(wait_until([&] { return !events_.progress_for(id.value()).empty(); }));

    ASSERT_TRUE(engine->pause(id.value()).has_value());
    auto paused = finish(*engine, id.value());
    ASSERT_EQ(paused.status, transfer_status::paused);
    EXPECT_TRUE(paused.upload_id.has_value());
    EXPECT_LT(paused.transferred_bytes, paused.total_bytes);

    store_->set_part_delay(0ms);
    ASSERT_TRUE(engine->resume(id.value()).has_value());
    auto resumed = finish(*engine, id.value());

    EXPECT_EQ(resumed.status, transfer_status::completed);
    EXPECT_EQ(store_->count(store_operation::create_multipart_upload), 1u);
    EXPECT_TRUE(store_->inner().object_data("pausable.bin") == content);

    auto progress = events_.progress_for(id.value());
    EXPECT_TRUE(std::is_sorted(progress.begin(), progress.end()));
    EXPECT_EQ(progress.back(), content.size());
}

TEST_F(UploadEngineTest, Resume_RejectsNonPausedTask) {
    auto path = write_file("done.bin", bytes_of("done"));
    auto engine = make_engine();
    auto id = engine->start(transfer_task::make_upload("done.bin", path));
    ASSERT_TRUE(id.has_value());
    ASSERT_EQ(finish(*engine, id.value()).status, transfer_status::completed);

    auto res = engine->resume(id.value());
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, error_code::invalid_state_transition);

    auto pause = engine->pause(id.value());
    ASSERT_FALSE(pause.has_value());
    EXPECT_EQ(pause.error().code, error_code::invalid_state_transition);
}

TEST_F(UploadEngineTest, CancelWhileRunning_AbortsUpload) {
    config_.max_concurrent_transfers = 1;
    store_->set_part_delay(20ms);
    auto path = write_file("cancel.bin", patterned_bytes(40 * 1024));
    auto engine = make_engine();

    auto id = engine->start(transfer_task::make_upload("cancel.bin", path));
    ASSERT_TRUE(id.has_value());
    ASSERT_TRUE(wait_until([&] { return !events_.progress_for(id.value()).empty(); }));

    ASSERT_TRUE(engine->cancel(id.value()).has_value());
    auto task = finish(*engine, id.value());

    EXPECT_EQ(task.status, transfer_status::cancelled);
    EXPECT_FALSE(task.upload_id.has_value());
    EXPECT_EQ(store_->inner().open_upload_count(), 0u);
    EXPECT_FALSE(store_->inner().contains("cancel.bin"));
}

TEST_F(UploadEngineTest, CancelWhilePaused_AbortsUpload) {
    config_.max_concurrent_transfers = 1;
    store_->set_part_delay(20ms);
    auto path = write_file("idle.bin", patterned_bytes(40 * 1024));
    auto engine = make_engine();

    auto id = engine->start(transfer_task::make_upload("idle.bin", path));
    ASSERT_TRUE(id.has_value());
    ASSERT_TRUE(wait_until([&] { return !events_.progress_for(id.value()).empty(); }));
    ASSERT_TRUE(engine->pause(id.value()).has_value());
    ASSERT_EQ(finish(*engine, id.value()).status, transfer_status::paused);

    ASSERT_TRUE(engine->cancel(id.value()).has_value());
    auto task = engine->get_task(id.value());
    ASSERT_TRUE(task.has_value());
    EXPECT_EQ(task.value().status, transfer_status::cancelled);
    EXPECT_EQ(store_->inner().open_upload_count(), 0u);

    auto again = engine->cancel(id.value());
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, error_code::invalid_state_transition);
}

// =============================================================================
// Concurrency and progress
// =============================================================================

TEST_F(UploadEngineTest, PartConcurrency_NeverExceedsLimit) {
    config_.max_concurrent_transfers = 2;
    store_->set_part_delay(10ms);
    auto path = write_file("wide.bin", patterned_bytes(40 * 1024));
    auto engine = make_engine();

    auto id = engine->start(transfer_task::make_upload("wide.bin", path));
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(finish(*engine, id.value()).status, transfer_status::completed);

    EXPECT_GE(store_->max_concurrent_parts(), 1u);
    EXPECT_LE(store_->max_concurrent_parts(), 2u);
}

TEST_F(UploadEngineTest, SharedLimiter_BoundsSeveralTransfers) {
    config_.max_concurrent_transfers = 2;
    store_->set_part_delay(5ms);
    auto engine = make_engine();

    std::vector<transfer_id> ids;
    for (int i = 0; i < 4; ++i) {
        auto name = "multi_" + std::to_string(i) + ".bin";
        auto path = write_file(name, patterned_bytes(20 * 1024, static_cast<uint32_t>(i)));
        auto id = engine->start(transfer_task::make_upload(name, path));
        ASSERT_TRUE(id.has_value());
        ids.push_back(id.value());
    }
    for (const auto& id : ids) {
        EXPECT_EQ(finish(*engine, id).status, transfer_status::completed);
    }

    EXPECT_LE(store_->max_concurrent_parts(), 2u);
    EXPECT_EQ(events_.completion_count(), 4u);
}

TEST_F(UploadEngineTest, PauseWhileWaitingForPermit_DoesNotWaitForOtherHolder) {
    auto limiter = std::make_shared<concurrency_limiter>(1);
    limiter->acquire();  // held by some other transfer

    auto content = patterned_bytes(2 * 1024);
    auto path = write_file("queued.bin", content);
    auto engine = std::make_unique<upload_engine>(engine_resources{store_, limiter},
                                                  config_, events_.callbacks());

    auto id = engine->start(transfer_task::make_upload("queued.bin", path));
    ASSERT_TRUE(id.has_value());
    ASSERT_TRUE(wait_until([&] { return limiter->waiting_count() == 1; }));

    ASSERT_TRUE(engine->pause(id.value()).has_value());
    auto idle = engine->wait_for(id.value(), 2s);
    ASSERT_TRUE(idle.has_value());
    EXPECT_TRUE(idle.value());
    EXPECT_EQ(finish(*engine, id.value()).status, transfer_status::paused);
    EXPECT_EQ(limiter->waiting_count(), 0u);
    EXPECT_EQ(store_->count(store_operation::put_object), 0u);

    limiter->release();
    ASSERT_TRUE(engine->resume(id.value()).has_value());
    EXPECT_EQ(finish(*engine, id.value()).status, transfer_status::completed);
    EXPECT_TRUE(store_->inner().object_data("queued.bin") == content);
    EXPECT_EQ(limiter->available_permits(), 1u);
}

TEST_F(UploadEngineTest, CancelWhileWaitingForPartPermit_AbortsUpload) {
    auto limiter = std::make_shared<concurrency_limiter>(1);
    limiter->acquire();

    auto path = write_file("queued_parts.bin", patterned_bytes(9 * 1024));
    auto engine = std::make_unique<upload_engine>(engine_resources{store_, limiter},
                                                  config_, events_.callbacks());

    upload_options options;
    options.force_multipart = true;
    auto id = engine->start(transfer_task::make_upload("queued_parts.bin", path), options);
    ASSERT_TRUE(id.has_value());
    ASSERT_TRUE(wait_until([&] { return limiter->waiting_count() == 1; }));

    ASSERT_TRUE(engine->cancel(id.value()).has_value());
    auto idle = engine->wait_for(id.value(), 2s);
    ASSERT_TRUE(idle.has_value());
    EXPECT_TRUE(idle.value());

    EXPECT_EQ(finish(*engine, id.value()).status, transfer_status::cancelled);
    EXPECT_EQ(store_->count(store_operation::upload_part), 0u);
    EXPECT_EQ(store_->count(store_operation::abort_multipart_upload), 1u);
    EXPECT_EQ(store_->inner().open_upload_count(), 0u);

    limiter->release();
    EXPECT_EQ(limiter->available_permits(), 1u);
}

TEST_F(UploadEngineTest, Progress_IsMonotonicAndReachesTotal) {
    auto content = patterned_bytes(33 * 1024);
    auto path = write_file("progress.bin", content);
    auto engine = make_engine();

    auto id = engine->start(transfer_task::make_upload("progress.bin", path));
    ASSERT_TRUE(id.has_value());
    ASSERT_EQ(finish(*engine, id.value()).status, transfer_status::completed);

    auto progress = events_.progress_for(id.value());
    ASSERT_FALSE(progress.empty());
    EXPECT_TRUE(std::is_sorted(progress.begin(), progress.end()));
    EXPECT_EQ(progress.back(), content.size());
}

TEST_F(UploadEngineTest, Remove_OnlyAfterTerminal) {
    auto path = write_file("rm.bin", bytes_of("bytes"));
    auto engine = make_engine();
    auto id = engine->start(transfer_task::make_upload("rm.bin", path));
    ASSERT_TRUE(id.has_value());
    ASSERT_EQ(finish(*engine, id.value()).status, transfer_status::completed);

    EXPECT_TRUE(engine->remove(id.value()).has_value());
    EXPECT_FALSE(engine->contains(id.value()));

    auto missing = engine->get_task(id.value());
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, error_code::transfer_not_found);
}

}  // namespace kcenon::object_transfer::test
