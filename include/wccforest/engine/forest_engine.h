#ifndef WCCFOREST_ENGINE_FOREST_ENGINE_H_
#define WCCFOREST_ENGINE_FOREST_ENGINE_H_

#include <memory>
#include <mutex>
#include <shared_mutex>
#include <vector>

#include <absl/container/flat_hash_set.h>

#include "wccforest/core/config.h"
#include "wccforest/core/result.h"
#include "wccforest/core/types.h"
#include "wccforest/features/feature_extractor.h"
#include "wccforest/forest/batch_coordinator.h"
#include "wccforest/forest/chain_builder.h"
#include "wccforest/forest/forest_validator.h"
#include "wccforest/metrics/metrics_engine.h"
#include "wccforest/oracle/shortest_path_oracle.h"
#include "wccforest/oracle/wcc_oracle.h"
#include "wccforest/storage/graph_store.h"

namespace wccforest {
namespace engine {

/**
 * @brief Outcome of one process() or rebuild() pass
 */
struct ProcessReport {
    forest::ChainBuildStats chains;
    forest::BatchReport batch;
    metrics::MetricsReport metrics;
};

/**
 * @brief Entry point tying the store, the oracles and the pipeline stages together
 * 
 * Usage:
 * ```
 * engine::ForestEngine engine(std::make_shared<storage::MemoryGraphStore>());
 * engine.init(core::ForestConfig::Default());
 * engine.ingest(event, {{core::EntityType::EMAIL, "a@example.com"}});
 * engine.process();
 * auto features = engine.score(new_event, new_entities);
 * ```
 */
class ForestEngine {
public:
    /**
     * @param wcc_oracle Planning oracle; union-find when null
     * @param path_oracle Diameter oracle; BFS when null
     */
    explicit ForestEngine(std::shared_ptr<storage::GraphStore> store,
                          std::shared_ptr<oracle::WccOracle> wcc_oracle = nullptr,
                          std::shared_ptr<oracle::ShortestPathOracle> path_oracle = nullptr);
    
    /**
     * @brief Validate the configuration and build the pipeline
     */
    core::Result<void> init(const core::ForestConfig& config);
    
    /**
     * @brief Store an event with its entities; the entities are re-linked on the next process()
     * 
     * Concurrent ingests proceed in parallel; linking and merging wait for them.
     */
    core::Result<void> ingest(const core::Event& event, const std::vector<core::Entity>& entities);
    
    /**
     * @brief Link dirty entities, merge unprocessed events and compute their metrics
     * 
     * Fails with STRUCTURAL_VIOLATION when the batch was aborted.
     */
    core::Result<ProcessReport> process();
    
    /**
     * @brief Delete all derived state; events and touch edges remain
     * 
     * The next process() relinks every entity and recomputes every metric.
     */
    core::Result<void> reset();
    
    /**
     * @brief reset() followed by a full link, merge and metrics pass
     */
    core::Result<ProcessReport> rebuild();
    
    /**
     * @brief Real-time features for an event that is not yet merged
     */
    core::Result<core::FeatureRecord> score(const core::Event& event,
                                            const std::vector<core::Entity>& entities) const;
    
    core::Result<core::FeatureRecord> training_features(core::EventId id, core::Timestamp cutoff) const;
    core::Result<std::vector<core::FeatureRecord>> training_set(core::Timestamp cutoff) const;
    
    /**
     * @brief Check chains and forest structure
     */
    core::Result<void> validate() const;
    
    storage::GraphStoreStats stats() const { return store_->stats(); }
    
    bool initialized() const { return initialized_; }
    const core::ForestConfig& config() const { return config_; }
    std::shared_ptr<storage::GraphStore> store() const { return store_; }
    forest::BatchCoordinator* coordinator() const { return coordinator_.get(); }
    metrics::MetricsEngine* metrics_engine() const { return metrics_.get(); }

private:
    core::Result<void> check_initialized() const;
    core::Result<ProcessReport> run_pipeline(std::unique_lock<std::shared_mutex>& ingest_lock,
                                             const std::vector<core::Entity>& entities, bool all_entities);
    
    std::shared_ptr<storage::GraphStore> store_;
    std::shared_ptr<oracle::WccOracle> wcc_oracle_;
    std::shared_ptr<oracle::ShortestPathOracle> path_oracle_;
    core::ForestConfig config_;
    bool initialized_ = false;
    
    std::unique_ptr<forest::ChainBuilder> chain_builder_;
    std::unique_ptr<forest::BatchCoordinator> coordinator_;
    std::shared_ptr<metrics::MetricsEngine> metrics_;
    std::unique_ptr<features::FeatureExtractor> features_;
    std::unique_ptr<forest::ForestValidator> validator_;
    
    std::mutex pipeline_mutex_;   // One process()/reset()/rebuild() at a time
    bool needs_full_rebuild_ = false;   // Guarded by pipeline_mutex_
    // Shared by ingest(); exclusive while chains are linked and events merged
    std::shared_mutex ingest_mutex_;
    std::mutex dirty_mutex_;
    absl::flat_hash_set<core::Entity> dirty_entities_;
};

} // namespace engine
} // namespace wccforest

#endif // WCCFOREST_ENGINE_FOREST_ENGINE_H_
