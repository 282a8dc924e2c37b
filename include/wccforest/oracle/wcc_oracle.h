#ifndef WCCFOREST_ORACLE_WCC_ORACLE_H_
#define WCCFOREST_ORACLE_WCC_ORACLE_H_

#include <cstdint>
#include <string>
#include <vector>

#include "wccforest/core/result.h"
#include "wccforest/oracle/oracle_graph.h"

namespace wccforest {
namespace oracle {

/**
 * @brief Bulk weakly-connected-component oracle
 * 
 * Returns one label per node; two nodes share a label iff they are weakly
 * connected. Used only to plan batch grouping, never to decide forest
 * structure.
 */
class WccOracle {
public:
    virtual ~WccOracle() = default;
    
    virtual core::Result<std::vector<uint64_t>> label(const OracleGraph& graph) = 0;
    
    virtual std::string name() const = 0;
};

/**
 * @brief Union-find WCC with path compression and union by rank
 * 
 * Labels are the smallest node index of each component.
 */
class UnionFindWccOracle : public WccOracle {
public:
    core::Result<std::vector<uint64_t>> label(const OracleGraph& graph) override;
    
    std::string name() const override { return "union-find"; }
};

} // namespace oracle
} // namespace wccforest

#endif // WCCFOREST_ORACLE_WCC_ORACLE_H_
