#include "wccforest/engine/forest_engine.h"
#include "wccforest/common/logger.h"

#include <algorithm>

namespace wccforest {
namespace engine {

ForestEngine::ForestEngine(std::shared_ptr<storage::GraphStore> store,
                           std::shared_ptr<oracle::WccOracle> wcc_oracle,
                           std::shared_ptr<oracle::ShortestPathOracle> path_oracle)
    : store_(std::move(store)),
      wcc_oracle_(wcc_oracle ? std::move(wcc_oracle) : std::make_shared<oracle::UnionFindWccOracle>()),
      path_oracle_(path_oracle ? std::move(path_oracle) : std::make_shared<oracle::BfsShortestPathOracle>()) {}

core::Result<void> ForestEngine::init(const core::ForestConfig& config) {
    if (initialized_) {
        return core::Result<void>::error("ForestEngine already initialized", core::Error::Code::ALREADY_EXISTS);
    }
    if (!store_) {
        return core::Result<void>::error("ForestEngine requires a graph store", core::Error::Code::INVALID_ARGUMENT);
    }
    auto valid = config.validate();
    if (!valid.ok()) {
        WCCFOREST_ERROR("Invalid configuration: {}", valid.error());
        return valid;
    }
    
    config_ = config;
    chain_builder_ = std::make_unique<forest::ChainBuilder>(store_, config_.chain);
    coordinator_ = std::make_unique<forest::BatchCoordinator>(store_, wcc_oracle_, config_.batch);
    metrics_ = std::make_shared<metrics::MetricsEngine>(store_, path_oracle_, config_.metrics);
    features_ = std::make_unique<features::FeatureExtractor>(store_, metrics_, config_.features);
    validator_ = std::make_unique<forest::ForestValidator>(store_);
    initialized_ = true;
    
    WCCFOREST_INFO("ForestEngine initialized ({} workers, oracles: {} / {})",
                   config_.batch.num_workers, wcc_oracle_->name(), path_oracle_->name());
    return core::Result<void>();
}

core::Result<void> ForestEngine::check_initialized() const {
    if (!initialized_) {
        return core::Result<void>::error("ForestEngine not initialized", core::Error::Code::INTERNAL);
    }
    return core::Result<void>();
}

core::Result<void> ForestEngine::ingest(const core::Event& event, const std::vector<core::Entity>& entities) {
    auto ready = check_initialized();
    if (!ready.ok()) {
        return ready;
    }
    // An event must not be merged before its touch edges exist
    std::shared_lock<std::shared_mutex> ingest_lock(ingest_mutex_);
    auto stored = store_->put_event(event);
    if (!stored.ok()) {
        return stored;
    }
    for (const auto& entity : entities) {
        auto linked = store_->link_entity(event.id, entity);
        if (!linked.ok()) {
            return linked;
        }
    }
    
    std::lock_guard<std::mutex> lock(dirty_mutex_);
    dirty_entities_.insert(entities.begin(), entities.end());
    return core::Result<void>();
}

core::Result<ProcessReport> ForestEngine::run_pipeline(std::unique_lock<std::shared_mutex>& ingest_lock,
                                                       const std::vector<core::Entity>& entities, bool all_entities) {
    ProcessReport report;
    
    auto chains = all_entities ? chain_builder_->link_all() : chain_builder_->link_entities(entities);
    if (!chains.ok()) {
        return core::Result<ProcessReport>::error_from(chains);
    }
    report.chains = chains.value();
    
    auto batch = coordinator_->run();
    if (!batch.ok()) {
        return core::Result<ProcessReport>::error_from(batch);
    }
    report.batch = batch.take_value();
    if (report.batch.aborted) {
        return core::Result<ProcessReport>::error(
            "Forest merge aborted: " + report.batch.fatal_error.value_or("structural violation"),
            core::Error::Code::STRUCTURAL_VIOLATION);
    }
    
    ingest_lock.unlock();
    
    auto computed = all_entities ? metrics_->compute_pending()
                                 : metrics_->compute_batch(report.batch.processed_event_ids);
    if (!computed.ok()) {
        return core::Result<ProcessReport>::error_from(computed);
    }
    report.metrics = computed.take_value();
    return core::Result<ProcessReport>(std::move(report));
}

core::Result<ProcessReport> ForestEngine::process() {
    auto ready = check_initialized();
    if (!ready.ok()) {
        return core::Result<ProcessReport>::error_from(ready);
    }
    std::lock_guard<std::mutex> pipeline_lock(pipeline_mutex_);
    std::unique_lock<std::shared_mutex> ingest_lock(ingest_mutex_);
    
    std::vector<core::Entity> dirty;
    {
        std::lock_guard<std::mutex> lock(dirty_mutex_);
        dirty.assign(dirty_entities_.begin(), dirty_entities_.end());
        dirty_entities_.clear();
    }
    std::sort(dirty.begin(), dirty.end());
    
    const bool full = needs_full_rebuild_;
    if (full) {
        WCCFOREST_INFO("Derived state was reset, relinking every entity");
    }
    auto report = run_pipeline(ingest_lock, dirty, full);
    if (!report.ok()) {
        // Keep the entities for the next attempt
        std::lock_guard<std::mutex> lock(dirty_mutex_);
        dirty_entities_.insert(dirty.begin(), dirty.end());
        return report;
    }
    needs_full_rebuild_ = false;
    return report;
}

core::Result<void> ForestEngine::reset() {
    auto ready = check_initialized();
    if (!ready.ok()) {
        return ready;
    }
    std::lock_guard<std::mutex> pipeline_lock(pipeline_mutex_);
    
    WCCFOREST_INFO("Resetting derived forest state");
    auto cleared = store_->reset_derived_state();
    if (!cleared.ok()) {
        return cleared;
    }
    needs_full_rebuild_ = true;
    return core::Result<void>();
}

core::Result<ProcessReport> ForestEngine::rebuild() {
    auto ready = check_initialized();
    if (!ready.ok()) {
        return core::Result<ProcessReport>::error_from(ready);
    }
    std::lock_guard<std::mutex> pipeline_lock(pipeline_mutex_);
    std::unique_lock<std::shared_mutex> ingest_lock(ingest_mutex_);
    
    WCCFOREST_INFO("Rebuilding forest from touch edges");
    auto cleared = store_->reset_derived_state();
    if (!cleared.ok()) {
        return core::Result<ProcessReport>::error_from(cleared);
    }
    needs_full_rebuild_ = true;
    {
        std::lock_guard<std::mutex> lock(dirty_mutex_);
        dirty_entities_.clear();
    }
    
    auto report = run_pipeline(ingest_lock, {}, true);
    if (report.ok()) {
        needs_full_rebuild_ = false;
        WCCFOREST_INFO("Rebuild complete: {}", store_->stats().to_string());
    }
    return report;
}

core::Result<core::FeatureRecord> ForestEngine::score(const core::Event& event,
                                                      const std::vector<core::Entity>& entities) const {
    auto ready = check_initialized();
    if (!ready.ok()) {
        return core::Result<core::FeatureRecord>::error_from(ready);
    }
    return features_->extract_realtime(event, entities);
}

core::Result<core::FeatureRecord> ForestEngine::training_features(core::EventId id, core::Timestamp cutoff) const {
    auto ready = check_initialized();
    if (!ready.ok()) {
        return core::Result<core::FeatureRecord>::error_from(ready);
    }
    return features_->extract_training(id, cutoff);
}

core::Result<std::vector<core::FeatureRecord>> ForestEngine::training_set(core::Timestamp cutoff) const {
    auto ready = check_initialized();
    if (!ready.ok()) {
        return core::Result<std::vector<core::FeatureRecord>>::error_from(ready);
    }
    return features_->extract_training_set(cutoff);
}

core::Result<void> ForestEngine::validate() const {
    auto ready = check_initialized();
    if (!ready.ok()) {
        return ready;
    }
    auto chains = validator_->validate_all_chains();
    if (!chains.ok()) {
        return core::Result<void>::error_from(chains);
    }
    auto forest = validator_->validate_forest();
    if (!forest.ok()) {
        return core::Result<void>::error_from(forest);
    }
    auto components = validator_->validate_components();
    if (!components.ok()) {
        return core::Result<void>::error_from(components);
    }
    return core::Result<void>();
}

} // namespace engine
} // namespace wccforest
