#ifndef WCCFOREST_FEATURES_FEATURE_EXTRACTOR_H_
#define WCCFOREST_FEATURES_FEATURE_EXTRACTOR_H_

#include <memory>
#include <optional>
#include <vector>

#include "wccforest/core/config.h"
#include "wccforest/core/result.h"
#include "wccforest/core/types.h"
#include "wccforest/metrics/metrics_engine.h"
#include "wccforest/storage/graph_store.h"

namespace wccforest {
namespace features {

/**
 * @brief Component features for training and scoring
 * 
 * Both paths aggregate the persisted snapshots of the component heads an
 * event connects to and emit the same FeatureRecord schema. Training walks
 * the forest backward from an already merged event; scoring walks it forward
 * from the processed events sharing an entity with a new one.
 */
class FeatureExtractor {
public:
    FeatureExtractor(std::shared_ptr<storage::GraphStore> store,
                     std::shared_ptr<metrics::MetricsEngine> metrics,
                     const core::FeatureConfig& config = core::FeatureConfig::Default());
    
    /**
     * @brief Backward extraction for a historical event
     * 
     * @return INVALID_ARGUMENT if the event is later than cutoff or not processed
     */
    core::Result<core::FeatureRecord> extract_training(core::EventId source, core::Timestamp cutoff) const;
    
    /**
     * @brief Backward extraction for every processed event up to cutoff
     * 
     * Each event is retried on its own after a transient failure.
     */
    core::Result<std::vector<core::FeatureRecord>> extract_training_set(core::Timestamp cutoff) const;
    
    /**
     * @brief Forward extraction for an event not yet merged into the forest
     * 
     * Read-only. A store failure yields UNAVAILABLE, never empty features.
     */
    core::Result<core::FeatureRecord> extract_realtime(const core::Event& event,
                                                       const std::vector<core::Entity>& entities) const;
    
    /**
     * @brief Forward extraction for an event already in the store
     */
    core::Result<core::FeatureRecord> extract_realtime(core::EventId id) const;
    
    /**
     * @brief Distinct current heads reachable from the processed events that
     *        share an entity with event and precede it
     */
    core::Result<std::vector<core::EventId>> heads_for(const core::Event& event,
                                                       const std::vector<core::Entity>& entities) const;
    
    const core::FeatureConfig& config() const { return config_; }

private:
    core::Result<core::FeatureRecord> aggregate(core::EventId id, const std::vector<core::EventId>& heads) const;
    core::Result<core::ComponentMetrics> metrics_of(core::EventId head) const;
    core::Result<core::FeatureRecord> realtime_once(const core::Event& event,
                                                    const std::vector<core::Entity>& entities) const;
    
    std::shared_ptr<storage::GraphStore> store_;
    std::shared_ptr<metrics::MetricsEngine> metrics_;
    core::FeatureConfig config_;
};

} // namespace features
} // namespace wccforest

#endif // WCCFOREST_FEATURES_FEATURE_EXTRACTOR_H_
