#include "wccforest/storage/background_processor.h"
#include "wccforest/common/logger.h"
#include "wccforest/core/error.h"
#include <chrono>
#include <thread>

namespace wccforest {
namespace storage {

BackgroundProcessor::BackgroundProcessor(const BackgroundProcessorConfig& config)
    : config_(config), task_queue_(taskComparator) {
}

BackgroundProcessor::~BackgroundProcessor() {
    if (initialized_.load()) {
        shutdown();
    }
}

core::Result<void> BackgroundProcessor::initialize() {
    if (initialized_.load()) {
        return core::Result<void>::error("BackgroundProcessor already initialized", core::Error::Code::ALREADY_EXISTS);
    }
    
    if (config_.num_workers == 0) {
        return core::Result<void>::error("Invalid number of workers: 0", core::Error::Code::INVALID_ARGUMENT);
    }
    
    if (config_.max_queue_size == 0) {
        return core::Result<void>::error("Invalid max queue size: 0", core::Error::Code::INVALID_ARGUMENT);
    }
    
    stats_.reset();
    shutdown_requested_.store(false);
    startWorkers();
    
    initialized_.store(true);
    return core::Result<void>();
}

core::Result<void> BackgroundProcessor::shutdown() {
    if (!initialized_.load() || shutdown_requested_.load()) {
        return core::Result<void>();
    }
    
    // Let queued work drain before stopping the workers
    auto drained = waitForCompletion(config_.shutdown_timeout);
    if (!drained.ok()) {
        WCCFOREST_WARN("BackgroundProcessor: shutdown timeout, {} tasks still queued", getQueueSize());
    }
    
    shutdown_requested_.store(true);
    queue_condition_.notify_all();
    stopWorkers();
    abandonQueuedTasks();
    
    initialized_.store(false);
    return core::Result<void>();
}

core::Result<void> BackgroundProcessor::submitTask(BackgroundTask task) {
    if (shutdown_requested_.load()) {
        return core::Result<void>::error("BackgroundProcessor is shutting down", core::Error::Code::CANCELLED);
    }
    
    if (!initialized_.load()) {
        return core::Result<void>::error("BackgroundProcessor not initialized", core::Error::Code::INTERNAL);
    }
    
    std::lock_guard<std::mutex> lock(queue_mutex_);
    
    if (task_queue_.size() >= config_.max_queue_size) {
        stats_.tasks_rejected.fetch_add(1);
        return core::Result<void>::error("Queue is full", core::Error::Code::RESOURCE_EXHAUSTED);
    }
    
    task.task_id = next_task_id_.fetch_add(1);
    task_queue_.push(std::make_unique<BackgroundTask>(std::move(task)));
    
    stats_.tasks_submitted.fetch_add(1);
    stats_.queue_size.store(task_queue_.size());
    
    queue_condition_.notify_one();
    return core::Result<void>();
}

core::Result<void> BackgroundProcessor::waitForCompletion(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    bool done = tasks_finished_cond_.wait_for(lock, timeout, [this] {
        return task_queue_.empty() && active_tasks_.load() == 0 &&
               stats_.tasks_processed.load() + stats_.tasks_abandoned.load() >= stats_.tasks_submitted.load();
    });
    if (!done) {
        return core::Result<void>::error("Wait for completion timed out", core::Error::Code::TIMEOUT);
    }
    return core::Result<void>();
}

BackgroundProcessorStatsSnapshot BackgroundProcessor::getStats() const {
    std::lock_guard<std::mutex> queue_lock(queue_mutex_);
    BackgroundProcessorStatsSnapshot snap;
    snap.tasks_processed = stats_.tasks_processed.load();
    snap.tasks_failed = stats_.tasks_failed.load();
    snap.tasks_submitted = stats_.tasks_submitted.load();
    snap.tasks_rejected = stats_.tasks_rejected.load();
    snap.tasks_abandoned = stats_.tasks_abandoned.load();
    snap.queue_size = task_queue_.size();
    return snap;
}

void BackgroundProcessor::workerThread() {
    active_workers_.fetch_add(1);
    
    while (!shutdown_requested_.load()) {
        auto task = getNextTask();
        if (!task) {
            continue;
        }
        processTask(*task);
    }
    
    active_workers_.fetch_sub(1);
}

void BackgroundProcessor::processTask(BackgroundTask& task) {
    core::Result<void> result;
    try {
        result = task.task_func();
    } catch (const std::exception& e) {
        WCCFOREST_ERROR("BackgroundProcessor: task '{}' threw: {}", task.name, e.what());
        result = core::Result<void>::error(std::string("Task threw: ") + e.what(), core::Error::Code::INTERNAL);
    }
    
    if (!result.ok()) {
        stats_.tasks_failed.fetch_add(1);
    }
    
    if (task.on_complete) {
        try {
            task.on_complete(result);
        } catch (const std::exception& e) {
            WCCFOREST_ERROR("BackgroundProcessor: completion of '{}' threw: {}", task.name, e.what());
        }
    }
    
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stats_.tasks_processed.fetch_add(1);
        active_tasks_.fetch_sub(1);
    }
    tasks_finished_cond_.notify_all();
}

std::unique_ptr<BackgroundTask> BackgroundProcessor::getNextTask() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    
    queue_condition_.wait_for(lock, config_.worker_wait_timeout, [this] {
        return !task_queue_.empty() || shutdown_requested_.load();
    });
    
    if (shutdown_requested_.load() || task_queue_.empty()) {
        return nullptr;
    }
    
    auto task = std::move(const_cast<std::unique_ptr<BackgroundTask>&>(task_queue_.top()));
    task_queue_.pop();
    stats_.queue_size.store(task_queue_.size());
    // Counted while the lock is held so waitForCompletion never sees a gap
    active_tasks_.fetch_add(1);
    
    return task;
}

void BackgroundProcessor::startWorkers() {
    workers_.clear();
    workers_.reserve(config_.num_workers);
    
    for (uint32_t i = 0; i < config_.num_workers; ++i) {
        workers_.emplace_back(&BackgroundProcessor::workerThread, this);
    }
}

void BackgroundProcessor::stopWorkers() {
    queue_condition_.notify_all();
    
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    
    workers_.clear();
    active_workers_.store(0);
}

void BackgroundProcessor::abandonQueuedTasks() {
    std::vector<std::unique_ptr<BackgroundTask>> abandoned;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        while (!task_queue_.empty()) {
            abandoned.push_back(std::move(const_cast<std::unique_ptr<BackgroundTask>&>(task_queue_.top())));
            task_queue_.pop();
        }
        stats_.queue_size.store(0);
    }
    
    auto cancelled = core::Result<void>::error("Task abandoned at shutdown", core::Error::Code::CANCELLED);
    for (auto& task : abandoned) {
        if (task->on_complete) {
            task->on_complete(cancelled);
        }
        stats_.tasks_abandoned.fetch_add(1);
    }
    tasks_finished_cond_.notify_all();
}

uint32_t BackgroundProcessor::getQueueSize() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return static_cast<uint32_t>(task_queue_.size());
}

} // namespace storage
} // namespace wccforest
