#ifndef WCCFOREST_FOREST_CHAIN_BUILDER_H_
#define WCCFOREST_FOREST_CHAIN_BUILDER_H_

#include <memory>
#include <vector>

#include "wccforest/core/config.h"
#include "wccforest/core/result.h"
#include "wccforest/core/types.h"
#include "wccforest/storage/graph_store.h"

namespace wccforest {
namespace forest {

struct ChainBuildStats {
    uint64_t entities_scanned = 0;
    uint64_t edges_added = 0;
    uint64_t edges_removed = 0;
};

/**
 * @brief Sequential chain builder
 * 
 * Turns each entity's events into a single precedence path ordered by
 * (timestamp, id): O(n) edges per entity instead of a clique. Re-running on a
 * linked entity writes nothing. An event that arrives between two linked
 * events replaces the edge it splits, in the same write batch.
 */
class ChainBuilder {
public:
    ChainBuilder(std::shared_ptr<storage::GraphStore> store,
                 const core::ChainBuilderConfig& config = core::ChainBuilderConfig::Default());
    
    /**
     * @brief Re-link the given entities
     */
    core::Result<ChainBuildStats> link_entities(const std::vector<core::Entity>& entities);
    
    /**
     * @brief Re-link every entity in the store
     */
    core::Result<ChainBuildStats> link_all();
    
    /**
     * @brief Desired chain for one entity: consecutive pairs of its sorted events
     */
    core::Result<std::vector<storage::PrecedenceEdge>> desired_chain(const core::Entity& entity) const;

private:
    // Adds the diff for one entity to batch
    core::Result<void> stage_entity(const core::Entity& entity, storage::WriteBatch& batch, ChainBuildStats& stats);
    core::Result<void> flush(storage::WriteBatch& batch);
    
    std::shared_ptr<storage::GraphStore> store_;
    core::ChainBuilderConfig config_;
};

} // namespace forest
} // namespace wccforest

#endif // WCCFOREST_FOREST_CHAIN_BUILDER_H_
