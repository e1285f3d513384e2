/**
 * @file test_thread_pool_adapter.cpp
 * @brief Unit tests for the worker pool adapters
 */

#include <gtest/gtest.h>

#include <kcenon/p2p_convert/adapters/thread_pool_adapter.h>

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <vector>

namespace kcenon::p2p_convert::adapters::test {

using namespace std::chrono_literals;

class TaskPoolTest : public ::testing::Test {
protected:
    void SetUp() override { pool_ = task_pool_factory::create(2, "p2p_convert_test"); }

    std::shared_ptr<task_pool_interface> pool_;
};

TEST_F(TaskPoolTest, FactoryCreatesRunningPool) {
    ASSERT_NE(pool_, nullptr);
    EXPECT_TRUE(pool_->is_running());
    EXPECT_EQ(pool_->worker_count(), 2u);
}

TEST_F(TaskPoolTest, RunsSubmittedTasks) {
    std::atomic<int> ran{0};
    std::vector<std::future<void>> futures;
    for (int i = 0; i < 10; ++i) {
        futures.push_back(pool_->submit([&ran] { ++ran; }, stage::send));
    }
    for (auto& f : futures) {
        ASSERT_EQ(f.wait_for(5s), std::future_status::ready);
        f.get();
    }
    EXPECT_EQ(ran.load(), 10);
    EXPECT_EQ(pool_->pending_tasks(), 0u);
}

TEST_F(TaskPoolTest, ExceptionPropagatesThroughFuture) {
    auto f = pool_->submit([] { throw std::runtime_error("task failed"); }, stage::serve);
    ASSERT_EQ(f.wait_for(5s), std::future_status::ready);
    EXPECT_THROW(f.get(), std::runtime_error);
    EXPECT_EQ(pool_->pending_tasks(stage::serve), 0u);
}

TEST_F(TaskPoolTest, PendingCountsPerStage) {
    std::promise<void> release;
    auto gate = release.get_future().share();

    auto blocked = pool_->submit([gate] { gate.wait(); }, stage::serve);
    EXPECT_EQ(pool_->pending_tasks(stage::serve), 1u);
    EXPECT_EQ(pool_->pending_tasks(stage::send), 0u);
    EXPECT_EQ(pool_->pending_tasks(), 1u);

    release.set_value();
    ASSERT_EQ(blocked.wait_for(5s), std::future_status::ready);
    blocked.get();
    EXPECT_EQ(pool_->pending_tasks(stage::serve), 0u);
}

TEST(AsyncTaskPoolTest, ZeroWorkersUsesHardwareConcurrency) {
    async_task_pool pool(0);
    EXPECT_GT(pool.worker_count(), 0u);
    EXPECT_TRUE(pool.is_running());
}

}  // namespace kcenon::p2p_convert::adapters::test
