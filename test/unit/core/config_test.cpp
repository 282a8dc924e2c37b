#include <gtest/gtest.h>
#include "wccforest/core/config.h"

namespace wccforest {
namespace core {
namespace {

TEST(ConfigTest, DefaultConstructorsAreZeroed) {
    BatchConfig batch;
    EXPECT_EQ(batch.num_workers, 0u);
    EXPECT_EQ(batch.max_queue_size, 0u);
    EXPECT_FALSE(batch.shuffle_seed.has_value());
    
    MetricsConfig metrics;
    EXPECT_EQ(metrics.batch_size, 0u);
    EXPECT_FALSE(metrics.parallel);
}

TEST(ConfigTest, Defaults) {
    auto batch = BatchConfig::Default();
    EXPECT_GE(batch.num_workers, 1u);
    EXPECT_EQ(batch.max_queue_size, 100000u);
    EXPECT_EQ(batch.max_group_retries, 5u);
    EXPECT_EQ(batch.retry_backoff_ms, 5);
    EXPECT_EQ(batch.max_backoff_ms, 500);
    EXPECT_TRUE(batch.fallback_to_direct_traversal);
    
    EXPECT_EQ(ChainBuilderConfig::Default().entities_per_batch, 256u);
    EXPECT_EQ(MetricsConfig::Default().batch_size, 512u);
    
    auto features = FeatureConfig::Default();
    EXPECT_TRUE(features.compute_missing_metrics);
    EXPECT_EQ(features.realtime_max_retries, 0u);
}

TEST(ConfigTest, DefaultForestConfigIsValid) {
    auto config = ForestConfig::Default();
    EXPECT_TRUE(config.validate().ok());
}

TEST(ConfigTest, RejectsZeroSizes) {
    auto config = ForestConfig::Default();
    config.batch.num_workers = 0;
    auto result = config.validate();
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error_code(), Error::Code::INVALID_ARGUMENT);
    
    config = ForestConfig::Default();
    config.metrics.batch_size = 0;
    EXPECT_FALSE(config.validate().ok());
    
    config = ForestConfig::Default();
    config.chain.entities_per_batch = 0;
    EXPECT_FALSE(config.validate().ok());
    
    config = ForestConfig::Default();
    config.batch.max_queue_size = 0;
    EXPECT_FALSE(config.validate().ok());
}

} // namespace
} // namespace core
} // namespace wccforest
