#ifndef WCCFOREST_STORAGE_GRAPH_STORE_H_
#define WCCFOREST_STORAGE_GRAPH_STORE_H_

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "wccforest/core/types.h"
#include "wccforest/core/error.h"
#include "wccforest/core/result.h"

namespace wccforest {
namespace storage {

/**
 * @brief Directed edge between consecutive events of one entity
 */
struct PrecedenceEdge {
    core::EventId from = 0;
    core::EventId to = 0;
    core::Entity via;
    
    bool operator==(const PrecedenceEdge& other) const {
        return from == other.from && to == other.to && via == other.via;
    }
};

/**
 * @brief Union-find edge: head was absorbed by event
 */
struct ForestEdge {
    core::EventId head = 0;
    core::EventId event = 0;
    
    bool operator==(const ForestEdge& other) const {
        return head == other.head && event == other.event;
    }
};

/**
 * @brief Set of writes committed atomically
 * 
 * Preconditions are checked against the committed state before any write is
 * applied. If one fails the whole batch is rejected with Error::Code::CONFLICT.
 */
struct WriteBatch {
    std::vector<PrecedenceEdge> precedence_removals;
    std::vector<PrecedenceEdge> precedence_additions;
    std::vector<ForestEdge> forest_edges;
    std::vector<core::EventId> processed;
    std::vector<std::pair<core::EventId, core::ComponentMetrics>> metrics;
    
    std::vector<core::EventId> expect_unprocessed;
    std::vector<core::EventId> expect_processed;
    std::vector<core::EventId> expect_terminal;   // No outgoing forest edge
    
    bool empty() const {
        return precedence_removals.empty() && precedence_additions.empty() &&
               forest_edges.empty() && processed.empty() && metrics.empty();
    }
    
    size_t mutation_count() const {
        return precedence_removals.size() + precedence_additions.size() +
               forest_edges.size() + processed.size() + metrics.size();
    }
};

/**
 * @brief Store statistics
 */
struct GraphStoreStats {
    uint64_t events = 0;
    uint64_t entities = 0;
    uint64_t touch_edges = 0;
    uint64_t precedence_edges = 0;
    uint64_t forest_edges = 0;
    uint64_t processed_events = 0;
    uint64_t events_with_metrics = 0;
    
    std::string to_string() const;
};

/**
 * @brief Graph store interface
 * 
 * Holds events, entities, touch edges and the derived precedence and forest
 * structure. Implementations must be safe for concurrent use.
 */
class GraphStore {
public:
    virtual ~GraphStore() = default;
    
    /**
     * @brief Insert an event; re-inserting an identical event is a no-op
     */
    virtual core::Result<void> put_event(const core::Event& event) = 0;
    
    /**
     * @brief Create a touch edge between an existing event and an entity
     */
    virtual core::Result<void> link_entity(core::EventId event_id, const core::Entity& entity) = 0;
    
    virtual core::Result<core::Event> get_event(core::EventId id) const = 0;
    virtual core::Result<std::vector<core::Event>> get_events(const std::vector<core::EventId>& ids) const = 0;
    virtual core::Result<std::vector<core::EventId>> list_events() const = 0;
    virtual core::Result<std::vector<core::Entity>> list_entities() const = 0;
    
    /**
     * @brief Events with start <= timestamp <= end, ordered by (timestamp, id)
     */
    virtual core::Result<std::vector<core::Event>> events_in_range(
        core::Timestamp start, core::Timestamp end) const = 0;
    
    virtual core::Result<std::vector<core::Entity>> entities_of(core::EventId id) const = 0;
    
    /**
     * @brief Events referencing an entity, ordered by (timestamp, id)
     */
    virtual core::Result<std::vector<core::EventId>> events_touching(const core::Entity& entity) const = 0;
    
    virtual core::Result<std::vector<PrecedenceEdge>> precedence_edges_of(const core::Entity& entity) const = 0;
    virtual core::Result<std::vector<core::EventId>> precedence_predecessors(core::EventId id) const = 0;
    virtual core::Result<std::vector<core::EventId>> precedence_successors(core::EventId id) const = 0;
    
    virtual core::Result<std::vector<core::EventId>> forest_successors(core::EventId id) const = 0;
    virtual core::Result<std::vector<core::EventId>> forest_predecessors(core::EventId id) const = 0;
    
    virtual core::Result<bool> is_processed(core::EventId id) const = 0;
    virtual core::Result<std::vector<core::EventId>> unprocessed_events() const = 0;
    virtual core::Result<std::optional<core::ComponentMetrics>> get_metrics(core::EventId id) const = 0;
    
    /**
     * @brief Apply a write batch atomically
     */
    virtual core::Result<void> commit(const WriteBatch& batch) = 0;
    
    /**
     * @brief Delete precedence edges, forest edges, processed flags and metrics atomically
     */
    virtual core::Result<void> reset_derived_state() = 0;
    
    virtual GraphStoreStats stats() const = 0;
};

} // namespace storage
} // namespace wccforest

#endif // WCCFOREST_STORAGE_GRAPH_STORE_H_
