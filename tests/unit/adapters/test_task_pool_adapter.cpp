/**
 * @file test_task_pool_adapter.cpp
 * @brief Unit tests for the task pool abstraction
 */

#include <gtest/gtest.h>

#include <kcenon/object_transfer/adapters/task_pool_adapter.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

namespace kcenon::object_transfer::adapters::test {

using namespace std::chrono_literals;

class TaskPoolAdapterTest : public ::testing::Test {
protected:
    void SetUp() override { pool_ = task_pool_factory::create(2, "test_pool"); }

    std::shared_ptr<task_pool_interface> pool_;
};

TEST_F(TaskPoolAdapterTest, Factory_CreatesRunningPool) {
    ASSERT_NE(pool_, nullptr);
    EXPECT_TRUE(pool_->is_running());
    EXPECT_GT(pool_->worker_count(), 0u);
}

TEST_F(TaskPoolAdapterTest, Submit_RunsEveryTask) {
    std::atomic<int> counter{0};
    std::vector<std::future<void>> futures;
    for (int i = 0; i < 20; ++i) {
        futures.push_back(pool_->submit([&counter] { counter.fetch_add(1); }));
    }
    for (auto& f : futures) {
        f.get();
    }
    EXPECT_EQ(counter.load(), 20);
}

TEST_F(TaskPoolAdapterTest, SubmitDelayed_WaitsBeforeRunning) {
    auto started = std::chrono::steady_clock::now();
    std::chrono::steady_clock::time_point ran;

    pool_->submit_delayed([&ran] { ran = std::chrono::steady_clock::now(); }, 30ms)
        .get();

    EXPECT_GE(ran - started, 30ms);
}

TEST_F(TaskPoolAdapterTest, SubmitToStage_CountsUntilFinished) {
    std::promise<void> gate;
    auto opened = gate.get_future().share();

    auto future = pool_->submit_to_stage([opened] { opened.wait(); }, upload_part_stage);

    auto deadline = std::chrono::steady_clock::now() + 5s;
    while (pool_->pending_tasks(upload_part_stage) == 0 &&
           std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(1ms);
    }
    EXPECT_EQ(pool_->pending_tasks(upload_part_stage), 1u);
    EXPECT_EQ(pool_->pending_tasks(transfer_task_stage), 0u);

    gate.set_value();
    future.get();

    deadline = std::chrono::steady_clock::now() + 5s;
    while (pool_->pending_tasks(upload_part_stage) != 0 &&
           std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(1ms);
    }
    EXPECT_EQ(pool_->pending_tasks(upload_part_stage), 0u);
}

TEST_F(TaskPoolAdapterTest, Submit_PropagatesException) {
    auto future = pool_->submit([] { throw std::runtime_error("worker failed"); });
    EXPECT_THROW(future.get(), std::runtime_error);
}

TEST(AsyncTaskPoolTest, FallbackPoolWorks) {
    async_task_pool pool;
    std::atomic<bool> ran{false};
    pool.submit([&ran] { ran = true; }).get();
    EXPECT_TRUE(ran.load());
    EXPECT_TRUE(pool.is_running());
}

}  // namespace kcenon::object_transfer::adapters::test
