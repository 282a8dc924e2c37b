#ifndef WCCFOREST_FOREST_FOREST_VALIDATOR_H_
#define WCCFOREST_FOREST_FOREST_VALIDATOR_H_

#include <memory>
#include <vector>

#include "wccforest/core/result.h"
#include "wccforest/core/types.h"
#include "wccforest/storage/graph_store.h"

namespace wccforest {
namespace forest {

struct ForestValidationStats {
    uint64_t entities_checked = 0;
    uint64_t events_checked = 0;
    uint64_t forest_edges_checked = 0;
    uint64_t trees = 0;   // Current heads
    uint64_t precedence_edges_checked = 0;
};

/**
 * @brief Checks the structural invariants of the derived graph
 * 
 * Violations are reported with Error::Code::STRUCTURAL_VIOLATION and never
 * repaired.
 */
class ForestValidator {
public:
    explicit ForestValidator(std::shared_ptr<storage::GraphStore> store);
    
    /**
     * @brief Each entity's precedence edges form exactly the consecutive path over its events
     */
    core::Result<ForestValidationStats> validate_chains(const std::vector<core::Entity>& entities) const;
    core::Result<ForestValidationStats> validate_all_chains() const;
    
    /**
     * @brief At most one outgoing edge per node, processed endpoints only, no cycle
     */
    core::Result<ForestValidationStats> validate_forest() const;
    
    /**
     * @brief Every precedence edge between processed events stays inside one tree
     * 
     * Run after validate_forest(); head walks assume an acyclic forest.
     */
    core::Result<ForestValidationStats> validate_components() const;

private:
    std::shared_ptr<storage::GraphStore> store_;
};

} // namespace forest
} // namespace wccforest

#endif // WCCFOREST_FOREST_FOREST_VALIDATOR_H_
