#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "wccforest/storage/background_processor.h"

using namespace wccforest::storage;
using namespace wccforest::core;

class BackgroundProcessorTest : public ::testing::Test {
protected:
    void SetUp() override {
        BackgroundProcessorConfig config;
        config.num_workers = 2;
        config.max_queue_size = 100;
        config.shutdown_timeout = std::chrono::milliseconds(2000);
        config.worker_wait_timeout = std::chrono::milliseconds(20);
        
        processor_ = std::make_unique<BackgroundProcessor>(config);
        auto result = processor_->initialize();
        ASSERT_TRUE(result.ok()) << "Failed to initialize background processor: " << result.error();
    }
    
    void TearDown() override {
        if (processor_) {
            processor_->shutdown();
        }
    }
    
    std::function<Result<void>()> createSimpleTask(bool should_succeed = true) {
        return [this, should_succeed]() -> Result<void> {
            if (should_succeed) {
                completed_tasks_.fetch_add(1);
                return Result<void>();
            }
            failed_tasks_.fetch_add(1);
            return Result<void>::error("Task failed", Error::Code::INTERNAL);
        };
    }
    
    template<typename Predicate>
    bool waitForCondition(Predicate pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
        auto start = std::chrono::steady_clock::now();
        while (!pred()) {
            if (std::chrono::steady_clock::now() - start > timeout) {
                return false;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return true;
    }
    
    std::unique_ptr<BackgroundProcessor> processor_;
    std::atomic<int> completed_tasks_{0};
    std::atomic<int> failed_tasks_{0};
};

TEST_F(BackgroundProcessorTest, InvalidInitialization) {
    BackgroundProcessorConfig config;
    config.num_workers = 0;
    BackgroundProcessor processor(config);
    auto result = processor.initialize();
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.error_code(), Error::Code::INVALID_ARGUMENT);
    
    BackgroundProcessorConfig no_queue;
    no_queue.max_queue_size = 0;
    BackgroundProcessor other(no_queue);
    EXPECT_FALSE(other.initialize().ok());
}

TEST_F(BackgroundProcessorTest, DoubleInitialization) {
    auto result = processor_->initialize();
    EXPECT_FALSE(result.ok()) << "Should not allow double initialization";
    EXPECT_EQ(result.error_code(), Error::Code::ALREADY_EXISTS);
}

TEST_F(BackgroundProcessorTest, MultipleTaskExecution) {
    const int num_tasks = 20;
    for (int i = 0; i < num_tasks; ++i) {
        auto result = processor_->submitTask(BackgroundTask("task-" + std::to_string(i), createSimpleTask()));
        EXPECT_TRUE(result.ok());
    }
    
    ASSERT_TRUE(processor_->waitForCompletion().ok());
    EXPECT_EQ(completed_tasks_.load(), num_tasks);
    
    auto stats = processor_->getStats();
    EXPECT_EQ(stats.tasks_submitted, static_cast<uint64_t>(num_tasks));
    EXPECT_EQ(stats.tasks_processed, static_cast<uint64_t>(num_tasks));
    EXPECT_EQ(stats.tasks_failed, 0u);
}

TEST_F(BackgroundProcessorTest, CompletionCallbackSeesOutcome) {
    std::mutex mutex;
    std::vector<Error::Code> codes;
    
    for (bool succeed : {true, false}) {
        BackgroundTask task(succeed ? "ok" : "fail", createSimpleTask(succeed));
        task.on_complete = [&](const Result<void>& result) {
            std::lock_guard<std::mutex> lock(mutex);
            codes.push_back(result.ok() ? Error::Code::UNKNOWN : result.error_code());
        };
        ASSERT_TRUE(processor_->submitTask(std::move(task)).ok());
    }
    
    ASSERT_TRUE(processor_->waitForCompletion().ok());
    std::lock_guard<std::mutex> lock(mutex);
    ASSERT_EQ(codes.size(), 2u);
    EXPECT_EQ(std::count(codes.begin(), codes.end(), Error::Code::INTERNAL), 1);
    EXPECT_EQ(processor_->getStats().tasks_failed, 1u);
}

TEST_F(BackgroundProcessorTest, ExceptionBecomesInternalError) {
    std::atomic<bool> called{false};
    std::atomic<int> code{-1};
    BackgroundTask task("throws", []() -> Result<void> {
        throw std::runtime_error("Test exception");
    });
    task.on_complete = [&](const Result<void>& result) {
        code.store(static_cast<int>(result.error_code()));
        called.store(true);
    };
    ASSERT_TRUE(processor_->submitTask(std::move(task)).ok());
    
    ASSERT_TRUE(waitForCondition([&] { return called.load(); }));
    EXPECT_EQ(code.load(), static_cast<int>(Error::Code::INTERNAL));
}

TEST_F(BackgroundProcessorTest, QueueFullIsResourceExhausted) {
    BackgroundProcessorConfig config;
    config.num_workers = 1;
    config.max_queue_size = 1;
    config.worker_wait_timeout = std::chrono::milliseconds(10);
    BackgroundProcessor processor(config);
    ASSERT_TRUE(processor.initialize().ok());
    
    std::mutex gate_mutex;
    std::condition_variable gate;
    bool open = false;
    std::atomic<bool> running{false};
    auto blocking = [&]() -> Result<void> {
        running.store(true);
        std::unique_lock<std::mutex> lock(gate_mutex);
        gate.wait(lock, [&] { return open; });
        return Result<void>();
    };
    
    ASSERT_TRUE(processor.submitTask(BackgroundTask("blocker", blocking)).ok());
    ASSERT_TRUE(waitForCondition([&] { return running.load(); }));
    ASSERT_TRUE(processor.submitTask(BackgroundTask("queued", createSimpleTask())).ok());
    
    auto rejected = processor.submitTask(BackgroundTask("rejected", createSimpleTask()));
    EXPECT_FALSE(rejected.ok());
    EXPECT_EQ(rejected.error_code(), Error::Code::RESOURCE_EXHAUSTED);
    EXPECT_EQ(processor.getStats().tasks_rejected, 1u);
    
    {
        std::lock_guard<std::mutex> lock(gate_mutex);
        open = true;
    }
    gate.notify_all();
    EXPECT_TRUE(processor.waitForCompletion().ok());
    EXPECT_TRUE(processor.shutdown().ok());
    EXPECT_EQ(completed_tasks_.load(), 1);
}

TEST_F(BackgroundProcessorTest, SubmitAfterShutdownIsCancelled) {
    ASSERT_TRUE(processor_->shutdown().ok());
    
    auto result = processor_->submitTask(BackgroundTask("late", createSimpleTask()));
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.error_code(), Error::Code::CANCELLED);
}

TEST_F(BackgroundProcessorTest, WaitForCompletionTimesOut) {
    std::atomic<bool> release{false};
    ASSERT_TRUE(processor_->submitTask(BackgroundTask("slow", [&]() -> Result<void> {
        while (!release.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return Result<void>();
    })).ok());
    
    auto result = processor_->waitForCompletion(std::chrono::milliseconds(20));
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.error_code(), Error::Code::TIMEOUT);
    
    release.store(true);
    EXPECT_TRUE(processor_->waitForCompletion().ok());
}
