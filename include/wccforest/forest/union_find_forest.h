#ifndef WCCFOREST_FOREST_UNION_FIND_FOREST_H_
#define WCCFOREST_FOREST_UNION_FIND_FOREST_H_

#include <memory>
#include <optional>
#include <vector>

#include <absl/container/flat_hash_map.h>
#include <absl/container/flat_hash_set.h>

#include "wccforest/core/result.h"
#include "wccforest/core/types.h"
#include "wccforest/storage/graph_store.h"

namespace wccforest {
namespace forest {

/**
 * @brief Result of merging one event into the forest
 */
struct MergeOutcome {
    core::EventId event = 0;
    std::vector<core::EventId> absorbed_heads;  // Ordered by (timestamp, id)
    bool skipped = false;                       // Event was already processed
};

/**
 * @brief Staged merges of one work group
 * 
 * Merges are applied to an overlay so that later events of the group see
 * the heads created by earlier ones. commit() writes everything as a single
 * WriteBatch. The batch asserts that every staged event is still unprocessed
 * and that every committed head it read is still processed and terminal, so a
 * concurrent writer on the same component turns the commit into a CONFLICT.
 * 
 * Not thread-safe; one transaction belongs to one worker.
 */
class MergeTransaction {
public:
    explicit MergeTransaction(std::shared_ptr<storage::GraphStore> store);
    
    /**
     * @brief Stage the merge of one event
     * 
     * Events must be staged in ascending (timestamp, id) order.
     */
    core::Result<MergeOutcome> merge(core::EventId event);
    
    /**
     * @brief Commit all staged merges atomically
     */
    core::Result<void> commit();
    
    const storage::WriteBatch& batch() const { return batch_; }
    size_t staged_events() const { return staged_processed_.size(); }
    bool committed() const { return committed_; }

private:
    core::Result<bool> processed(core::EventId id) const;
    core::Result<std::vector<core::EventId>> successors(core::EventId id) const;
    core::Result<core::EventId> head_of(core::EventId id);
    
    std::shared_ptr<storage::GraphStore> store_;
    storage::WriteBatch batch_;
    absl::flat_hash_set<core::EventId> staged_processed_;
    absl::flat_hash_map<core::EventId, core::EventId> staged_successor_;
    absl::flat_hash_set<core::EventId> expected_heads_;
    bool committed_ = false;
};

/**
 * @brief Forward-chained union-find over the graph store
 * 
 * Forest edges point from an absorbed head to the event that absorbed it.
 * There is no path compression: find_head walks outgoing forest edges until a
 * node without one.
 */
class TemporalForest {
public:
    /**
     * @brief Current head of the component containing x
     * 
     * @param exclude When set, the walk never steps onto this node and stops
     *                at the node pointing to it.
     * @return STRUCTURAL_VIOLATION on a cycle or on a node with more than one
     *         outgoing forest edge
     */
    static core::Result<core::EventId> find_head(const storage::GraphStore& store, core::EventId x,
                                                 std::optional<core::EventId> exclude = std::nullopt);
    
    /**
     * @brief Merge and commit a single event
     */
    static core::Result<MergeOutcome> merge_event(std::shared_ptr<storage::GraphStore> store,
                                                  core::EventId event);
    
    /**
     * @brief Merge a group of events in (timestamp, id) order and commit once
     */
    static core::Result<std::vector<MergeOutcome>> merge_group(std::shared_ptr<storage::GraphStore> store,
                                                               const std::vector<core::EventId>& events);
};

} // namespace forest
} // namespace wccforest

#endif // WCCFOREST_FOREST_UNION_FIND_FOREST_H_
