#include "wccforest/forest/chain_builder.h"
#include "wccforest/common/logger.h"
#include <algorithm>
#include <set>

namespace wccforest {
namespace forest {

ChainBuilder::ChainBuilder(std::shared_ptr<storage::GraphStore> store, const core::ChainBuilderConfig& config)
    : store_(std::move(store)), config_(config) {
    if (config_.entities_per_batch == 0) {
        config_.entities_per_batch = 1;
    }
}

core::Result<std::vector<storage::PrecedenceEdge>> ChainBuilder::desired_chain(const core::Entity& entity) const {
    auto ids = store_->events_touching(entity);
    if (!ids.ok()) {
        return core::Result<std::vector<storage::PrecedenceEdge>>::error_from(ids);
    }
    
    std::vector<core::EventId> unique_ids = ids.value();
    std::sort(unique_ids.begin(), unique_ids.end());
    unique_ids.erase(std::unique(unique_ids.begin(), unique_ids.end()), unique_ids.end());
    
    auto events_result = store_->get_events(unique_ids);
    if (!events_result.ok()) {
        return core::Result<std::vector<storage::PrecedenceEdge>>::error_from(events_result);
    }
    auto events = events_result.take_value();
    std::sort(events.begin(), events.end(),
              [](const core::Event& a, const core::Event& b) { return core::chronologically_before(a, b); });
    
    std::vector<storage::PrecedenceEdge> chain;
    if (events.size() < 2) {
        return core::Result<std::vector<storage::PrecedenceEdge>>(std::move(chain));
    }
    chain.reserve(events.size() - 1);
    for (size_t i = 0; i + 1 < events.size(); ++i) {
        chain.push_back(storage::PrecedenceEdge{events[i].id, events[i + 1].id, entity});
    }
    return core::Result<std::vector<storage::PrecedenceEdge>>(std::move(chain));
}

core::Result<void> ChainBuilder::stage_entity(const core::Entity& entity, storage::WriteBatch& batch,
                                              ChainBuildStats& stats) {
    auto desired = desired_chain(entity);
    if (!desired.ok()) {
        return core::Result<void>::error_from(desired);
    }
    auto existing = store_->precedence_edges_of(entity);
    if (!existing.ok()) {
        return core::Result<void>::error_from(existing);
    }
    
    std::set<std::pair<core::EventId, core::EventId>> want;
    for (const auto& edge : desired.value()) {
        want.emplace(edge.from, edge.to);
    }
    std::set<std::pair<core::EventId, core::EventId>> have;
    for (const auto& edge : existing.value()) {
        have.emplace(edge.from, edge.to);
    }
    
    uint64_t removed = 0;
    for (const auto& edge : existing.value()) {
        if (!want.count({edge.from, edge.to})) {
            batch.precedence_removals.push_back(edge);
            ++removed;
        }
    }
    stats.edges_removed += removed;
    for (const auto& edge : desired.value()) {
        if (!have.count({edge.from, edge.to})) {
            batch.precedence_additions.push_back(edge);
            ++stats.edges_added;
        }
    }
    if (removed > 0) {
        WCCFOREST_WARN("ChainBuilder: late arrival re-chained entity {}", entity.to_string());
    }
    ++stats.entities_scanned;
    return core::Result<void>();
}

core::Result<void> ChainBuilder::flush(storage::WriteBatch& batch) {
    if (batch.empty()) {
        return core::Result<void>();
    }
    auto committed = store_->commit(batch);
    batch = storage::WriteBatch{};
    return committed;
}

core::Result<ChainBuildStats> ChainBuilder::link_entities(const std::vector<core::Entity>& entities) {
    ChainBuildStats stats;
    storage::WriteBatch batch;
    size_t staged = 0;
    
    for (const auto& entity : entities) {
        auto staged_entity = stage_entity(entity, batch, stats);
        if (!staged_entity.ok()) {
            WCCFOREST_ERROR("ChainBuilder: failed to link entity {}: {}", entity.to_string(), staged_entity.error());
            return core::Result<ChainBuildStats>::error_from(staged_entity);
        }
        if (++staged >= config_.entities_per_batch) {
            auto flushed = flush(batch);
            if (!flushed.ok()) {
                return core::Result<ChainBuildStats>::error_from(flushed);
            }
            staged = 0;
        }
    }
    auto flushed = flush(batch);
    if (!flushed.ok()) {
        return core::Result<ChainBuildStats>::error_from(flushed);
    }
    
    WCCFOREST_DEBUG("ChainBuilder: scanned {} entities, +{} / -{} precedence edges",
                    stats.entities_scanned, stats.edges_added, stats.edges_removed);
    return core::Result<ChainBuildStats>(stats);
}

core::Result<ChainBuildStats> ChainBuilder::link_all() {
    auto entities = store_->list_entities();
    if (!entities.ok()) {
        return core::Result<ChainBuildStats>::error_from(entities);
    }
    return link_entities(entities.value());
}

} // namespace forest
} // namespace wccforest
