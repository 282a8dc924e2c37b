#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <optional>
#include <thread>

#include "wccforest/core/types.h"
#include "wccforest/core/result.h"

namespace wccforest {
namespace core {

/**
 * @brief Configuration for the sequential chain builder
 */
struct ChainBuilderConfig {
    size_t entities_per_batch;   // Entities re-linked per committed write batch
    
    // Default constructor
    ChainBuilderConfig() : entities_per_batch(0) {}
    
    static ChainBuilderConfig Default() {
        ChainBuilderConfig config;
        config.entities_per_batch = 256;
        return config;
    }
};

/**
 * @brief Configuration for the batch coordinator and its worker pool
 */
struct BatchConfig {
    uint32_t num_workers;                   // Merge groups processed concurrently
    uint32_t max_queue_size;                // Pending groups before submission backs off
    uint32_t max_group_retries;             // Retries of a group after transient failures
    Duration retry_backoff_ms;              // Base of the exponential backoff
    Duration max_backoff_ms;                // Backoff cap
    std::optional<uint64_t> shuffle_seed;   // Fixed seed for reproducible group order
    bool fallback_to_direct_traversal;      // Plan with BFS when the WCC oracle fails
    std::chrono::milliseconds wait_timeout; // Upper bound on one run()
    
    // Default constructor
    BatchConfig() : num_workers(0), max_queue_size(0), max_group_retries(0),
                    retry_backoff_ms(0), max_backoff_ms(0),
                    fallback_to_direct_traversal(false), wait_timeout(0) {}
    
    static BatchConfig Default() {
        BatchConfig config;
        config.num_workers = std::max(1u, std::thread::hardware_concurrency());
        config.max_queue_size = 100000;
        config.max_group_retries = 5;
        config.retry_backoff_ms = 5;
        config.max_backoff_ms = 500;
        config.shuffle_seed = std::nullopt;
        config.fallback_to_direct_traversal = true;
        config.wait_timeout = std::chrono::minutes(10);
        return config;
    }
};

/**
 * @brief Configuration for component metrics computation
 */
struct MetricsConfig {
    size_t batch_size;   // Events computed and persisted per write batch
    bool parallel;       // Compute a batch with tbb::parallel_for
    
    // Default constructor
    MetricsConfig() : batch_size(0), parallel(false) {}
    
    static MetricsConfig Default() {
        MetricsConfig config;
        config.batch_size = 512;
        config.parallel = true;
        return config;
    }
};

/**
 * @brief Configuration for feature extraction
 */
struct FeatureConfig {
    bool compute_missing_metrics;    // Compute absent head metrics on the fly instead of failing
    uint32_t training_max_retries;   // Per-event retries in the training path
    uint32_t realtime_max_retries;   // Retries before reporting features unavailable
    Duration retry_backoff_ms;
    
    // Default constructor
    FeatureConfig() : compute_missing_metrics(false), training_max_retries(0),
                      realtime_max_retries(0), retry_backoff_ms(0) {}
    
    static FeatureConfig Default() {
        FeatureConfig config;
        config.compute_missing_metrics = true;
        config.training_max_retries = 3;
        config.realtime_max_retries = 0;   // Scoring fails fast
        config.retry_backoff_ms = 2;
        return config;
    }
};

/**
 * @brief Top-level configuration
 */
struct ForestConfig {
    ChainBuilderConfig chain;
    BatchConfig batch;
    MetricsConfig metrics;
    FeatureConfig features;
    
    ForestConfig() : chain(ChainBuilderConfig::Default()),
                     batch(BatchConfig::Default()),
                     metrics(MetricsConfig::Default()),
                     features(FeatureConfig::Default()) {}
    
    static ForestConfig Default() {
        return ForestConfig();
    }
    
    Result<void> validate() const {
        if (chain.entities_per_batch == 0) {
            return Result<void>::error("chain.entities_per_batch must be positive", Error::Code::INVALID_ARGUMENT);
        }
        if (batch.num_workers == 0) {
            return Result<void>::error("batch.num_workers must be positive", Error::Code::INVALID_ARGUMENT);
        }
        if (batch.max_queue_size == 0) {
            return Result<void>::error("batch.max_queue_size must be positive", Error::Code::INVALID_ARGUMENT);
        }
        if (metrics.batch_size == 0) {
            return Result<void>::error("metrics.batch_size must be positive", Error::Code::INVALID_ARGUMENT);
        }
        return Result<void>();
    }
};

} // namespace core
} // namespace wccforest
