#ifndef WCCFOREST_ORACLE_SHORTEST_PATH_ORACLE_H_
#define WCCFOREST_ORACLE_SHORTEST_PATH_ORACLE_H_

#include <cstdint>
#include <string>
#include <vector>

#include "wccforest/core/result.h"
#include "wccforest/oracle/oracle_graph.h"

namespace wccforest {
namespace oracle {

/**
 * @brief Bulk shortest-path oracle over a bounded, unweighted subgraph
 */
class ShortestPathOracle {
public:
    static constexpr int64_t kUnreachable = -1;
    
    virtual ~ShortestPathOracle() = default;
    
    /**
     * @brief Hop counts from source to every node, kUnreachable where no path exists
     */
    virtual core::Result<std::vector<int64_t>> distances(const OracleGraph& graph, size_t source) = 0;
    
    /**
     * @brief One distance row per source
     * 
     * The default runs distances() once per source; implementations may
     * share preprocessing across sources.
     */
    virtual core::Result<std::vector<std::vector<int64_t>>> distances_from(
        const OracleGraph& graph, const std::vector<size_t>& sources);
    
    virtual std::string name() const = 0;
};

/**
 * @brief Breadth-first search oracle
 */
class BfsShortestPathOracle : public ShortestPathOracle {
public:
    core::Result<std::vector<int64_t>> distances(const OracleGraph& graph, size_t source) override;
    
    core::Result<std::vector<std::vector<int64_t>>> distances_from(
        const OracleGraph& graph, const std::vector<size_t>& sources) override;
    
    std::string name() const override { return "bfs"; }

private:
    static std::vector<std::vector<size_t>> adjacency(const OracleGraph& graph);
    static std::vector<int64_t> bfs(const std::vector<std::vector<size_t>>& adjacency, size_t source);
};

} // namespace oracle
} // namespace wccforest

#endif // WCCFOREST_ORACLE_SHORTEST_PATH_ORACLE_H_
