#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

#include "wccforest/core/result.h"

namespace wccforest {
namespace storage {

/**
 * @brief Background task structure
 */
struct BackgroundTask {
    std::string name;
    std::function<core::Result<void>()> task_func;
    // Invoked exactly once with the task's outcome, including rejection at shutdown
    std::function<void(const core::Result<void>&)> on_complete;
    std::chrono::steady_clock::time_point created_time;
    uint32_t priority;  // Lower number = higher priority
    uint64_t task_id;   // Unique task identifier
    
    BackgroundTask(std::string n, std::function<core::Result<void>()> func, uint32_t p = 5)
        : name(std::move(n)), task_func(std::move(func)), created_time(std::chrono::steady_clock::now()),
          priority(p), task_id(0) {}
};

/**
 * @brief Background processor configuration
 */
struct BackgroundProcessorConfig {
    uint32_t num_workers = 4;
    uint32_t max_queue_size = 10000;
    std::chrono::milliseconds shutdown_timeout{5000};
    std::chrono::milliseconds worker_wait_timeout{100};  // Worker polling interval
    
    BackgroundProcessorConfig() = default;
};

/**
 * @brief Background processor statistics
 */
struct BackgroundProcessorStats {
    std::atomic<uint64_t> tasks_processed{0};
    std::atomic<uint64_t> tasks_failed{0};
    std::atomic<uint64_t> tasks_submitted{0};
    std::atomic<uint64_t> tasks_rejected{0};
    std::atomic<uint64_t> tasks_abandoned{0};
    std::atomic<uint64_t> queue_size{0};
    
    void reset() {
        tasks_processed.store(0);
        tasks_failed.store(0);
        tasks_submitted.store(0);
        tasks_rejected.store(0);
        tasks_abandoned.store(0);
        queue_size.store(0);
    }
};

struct BackgroundProcessorStatsSnapshot {
    uint64_t tasks_processed = 0;
    uint64_t tasks_failed = 0;
    uint64_t tasks_submitted = 0;
    uint64_t tasks_rejected = 0;
    uint64_t tasks_abandoned = 0;
    uint64_t queue_size = 0;
};

/**
 * @brief Bounded worker pool
 * 
 * Runs submitted tasks on a fixed number of worker threads, highest priority
 * first and FIFO within a priority. Used by the batch coordinator to run
 * merge groups concurrently.
 */
class BackgroundProcessor {
public:
    explicit BackgroundProcessor(const BackgroundProcessorConfig& config = BackgroundProcessorConfig{});
    ~BackgroundProcessor();
    
    BackgroundProcessor(const BackgroundProcessor&) = delete;
    BackgroundProcessor& operator=(const BackgroundProcessor&) = delete;
    BackgroundProcessor(BackgroundProcessor&&) = delete;
    BackgroundProcessor& operator=(BackgroundProcessor&&) = delete;
    
    /**
     * @brief Start the worker threads
     */
    core::Result<void> initialize();
    
    /**
     * @brief Drain the queue and join the workers
     * 
     * Tasks still queued when shutdown_timeout expires are completed with
     * Error::Code::CANCELLED.
     */
    core::Result<void> shutdown();
    
    /**
     * @brief Submit a task
     * @return RESOURCE_EXHAUSTED when the queue is full
     */
    core::Result<void> submitTask(BackgroundTask task);
    
    /**
     * @brief Wait until every submitted task has completed
     */
    core::Result<void> waitForCompletion(std::chrono::milliseconds timeout = std::chrono::milliseconds{5000});
    
    BackgroundProcessorStatsSnapshot getStats() const;
    
    uint32_t getQueueSize() const;
    
    const BackgroundProcessorConfig& getConfig() const { return config_; }
    
private:
    void workerThread();
    void processTask(BackgroundTask& task);
    std::unique_ptr<BackgroundTask> getNextTask();
    void startWorkers();
    void stopWorkers();
    void abandonQueuedTasks();
    
    static bool taskComparator(const std::unique_ptr<BackgroundTask>& a, const std::unique_ptr<BackgroundTask>& b) {
        // Lower priority number = higher priority
        if (a->priority != b->priority) {
            return a->priority > b->priority;
        }
        // If same priority, older task (lower task_id) has higher priority
        return a->task_id > b->task_id;
    }
    
    BackgroundProcessorConfig config_;
    BackgroundProcessorStats stats_;
    
    std::atomic<bool> initialized_{false};
    std::atomic<bool> shutdown_requested_{false};
    std::atomic<uint64_t> next_task_id_{1};
    std::atomic<uint32_t> active_tasks_{0};
    
    mutable std::mutex queue_mutex_;
    std::condition_variable queue_condition_;
    std::condition_variable tasks_finished_cond_;
    std::priority_queue<std::unique_ptr<BackgroundTask>, 
                       std::vector<std::unique_ptr<BackgroundTask>>,
                       std::function<bool(const std::unique_ptr<BackgroundTask>&, 
                                        const std::unique_ptr<BackgroundTask>&)>> task_queue_;
    
    std::vector<std::thread> workers_;
    std::atomic<uint32_t> active_workers_{0};
};

} // namespace storage
} // namespace wccforest
