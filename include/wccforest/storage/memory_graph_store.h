#ifndef WCCFOREST_STORAGE_MEMORY_GRAPH_STORE_H_
#define WCCFOREST_STORAGE_MEMORY_GRAPH_STORE_H_

#include <set>
#include <shared_mutex>
#include <utility>
#include <vector>

#include <absl/container/flat_hash_map.h>
#include <absl/container/flat_hash_set.h>

#include "wccforest/storage/graph_store.h"
#include "wccforest/storage/entity_index.h"

namespace wccforest {
namespace storage {

/**
 * @brief In-memory GraphStore
 * 
 * A single shared mutex guards the derived structure so that commit() and
 * reset_derived_state() are all-or-nothing with respect to readers. Touch
 * edges live in the EntityIndex, which has its own lock.
 */
class MemoryGraphStore : public GraphStore {
public:
    MemoryGraphStore();
    ~MemoryGraphStore() override;
    
    MemoryGraphStore(const MemoryGraphStore&) = delete;
    MemoryGraphStore& operator=(const MemoryGraphStore&) = delete;
    
    core::Result<void> put_event(const core::Event& event) override;
    core::Result<void> link_entity(core::EventId event_id, const core::Entity& entity) override;
    
    core::Result<core::Event> get_event(core::EventId id) const override;
    core::Result<std::vector<core::Event>> get_events(const std::vector<core::EventId>& ids) const override;
    core::Result<std::vector<core::EventId>> list_events() const override;
    core::Result<std::vector<core::Entity>> list_entities() const override;
    core::Result<std::vector<core::Event>> events_in_range(
        core::Timestamp start, core::Timestamp end) const override;
    
    core::Result<std::vector<core::Entity>> entities_of(core::EventId id) const override;
    core::Result<std::vector<core::EventId>> events_touching(const core::Entity& entity) const override;
    
    core::Result<std::vector<PrecedenceEdge>> precedence_edges_of(const core::Entity& entity) const override;
    core::Result<std::vector<core::EventId>> precedence_predecessors(core::EventId id) const override;
    core::Result<std::vector<core::EventId>> precedence_successors(core::EventId id) const override;
    
    core::Result<std::vector<core::EventId>> forest_successors(core::EventId id) const override;
    core::Result<std::vector<core::EventId>> forest_predecessors(core::EventId id) const override;
    
    core::Result<bool> is_processed(core::EventId id) const override;
    core::Result<std::vector<core::EventId>> unprocessed_events() const override;
    core::Result<std::optional<core::ComponentMetrics>> get_metrics(core::EventId id) const override;
    
    core::Result<void> commit(const WriteBatch& batch) override;
    core::Result<void> reset_derived_state() override;
    
    GraphStoreStats stats() const override;
    
    const EntityIndex& index() const { return index_; }

private:
    using Adjacency = std::vector<std::pair<core::EventId, core::Entity>>;
    
    // Called with mutex_ held exclusively
    core::Result<void> validate_batch(const WriteBatch& batch) const;
    void remove_precedence_edge(const PrecedenceEdge& edge);
    void add_precedence_edge(const PrecedenceEdge& edge);
    void add_forest_edge(const ForestEdge& edge);
    
    static std::vector<core::EventId> distinct_ids(const Adjacency& adjacency);
    
    absl::flat_hash_map<core::EventId, core::Event> events_;
    std::set<std::pair<core::Timestamp, core::EventId>> timeline_;
    
    EntityIndex index_;
    
    // Per-entity chains plus reverse adjacency for O(degree) predecessor lookups
    absl::flat_hash_map<core::Entity, std::set<std::pair<core::EventId, core::EventId>>> precedence_;
    absl::flat_hash_map<core::EventId, Adjacency> precedence_in_;
    absl::flat_hash_map<core::EventId, Adjacency> precedence_out_;
    uint64_t precedence_edge_count_ = 0;
    
    absl::flat_hash_map<core::EventId, std::vector<core::EventId>> forest_out_;
    absl::flat_hash_map<core::EventId, std::vector<core::EventId>> forest_in_;
    uint64_t forest_edge_count_ = 0;
    
    absl::flat_hash_set<core::EventId> processed_;
    absl::flat_hash_map<core::EventId, core::ComponentMetrics> metrics_;
    
    mutable std::shared_mutex mutex_;
};

} // namespace storage
} // namespace wccforest

#endif // WCCFOREST_STORAGE_MEMORY_GRAPH_STORE_H_
