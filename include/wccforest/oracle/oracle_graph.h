#ifndef WCCFOREST_ORACLE_ORACLE_GRAPH_H_
#define WCCFOREST_ORACLE_ORACLE_GRAPH_H_

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "wccforest/core/result.h"

namespace wccforest {
namespace oracle {

/**
 * @brief Dense undirected graph handed to the bulk oracles
 * 
 * Nodes are 0..num_nodes-1; callers keep their own mapping back to events
 * and entities.
 */
struct OracleGraph {
    size_t num_nodes = 0;
    std::vector<std::pair<size_t, size_t>> edges;
    
    size_t add_node() { return num_nodes++; }
    void add_edge(size_t a, size_t b) { edges.emplace_back(a, b); }
    
    core::Result<void> validate() const {
        for (const auto& [a, b] : edges) {
            if (a >= num_nodes || b >= num_nodes) {
                return core::Result<void>::error(
                    "Edge (" + std::to_string(a) + ", " + std::to_string(b) + ") outside graph of " +
                    std::to_string(num_nodes) + " nodes",
                    core::Error::Code::INVALID_ARGUMENT);
            }
        }
        return core::Result<void>();
    }
};

} // namespace oracle
} // namespace wccforest

#endif // WCCFOREST_ORACLE_ORACLE_GRAPH_H_
