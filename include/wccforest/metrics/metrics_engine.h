#ifndef WCCFOREST_METRICS_METRICS_ENGINE_H_
#define WCCFOREST_METRICS_METRICS_ENGINE_H_

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "wccforest/core/config.h"
#include "wccforest/core/result.h"
#include "wccforest/core/types.h"
#include "wccforest/oracle/oracle_graph.h"
#include "wccforest/oracle/shortest_path_oracle.h"
#include "wccforest/storage/graph_store.h"

namespace wccforest {
namespace metrics {

/**
 * @brief Bipartite micro-projection of one component
 * 
 * Node i < elements.size() is elements[i]; the remaining nodes are the
 * entities the elements touch.
 */
struct Projection {
    oracle::OracleGraph graph;
    std::vector<core::Event> elements;   // Ascending (timestamp, id)
    std::vector<core::Entity> entities;
    size_t touch_edges = 0;
    size_t precedence_edges = 0;
    
    size_t entity_node(size_t entity_index) const { return elements.size() + entity_index; }
};

struct MetricsReport {
    uint64_t computed = 0;
    uint64_t skipped = 0;   // Already carrying metrics, or not processed
    std::vector<std::pair<core::EventId, std::string>> failed;
    
    bool ok() const { return failed.empty(); }
};

/**
 * @brief Component snapshot computation
 * 
 * The component of a processed event s is s plus everything reachable by
 * walking incoming forest edges backward. Metrics are computed on the
 * projection of that component alone, never on the whole graph.
 */
class MetricsEngine {
public:
    MetricsEngine(std::shared_ptr<storage::GraphStore> store,
                  std::shared_ptr<oracle::ShortestPathOracle> oracle,
                  const core::MetricsConfig& config = core::MetricsConfig::Default());
    
    /**
     * @brief Elements of the component as of s, ascending (timestamp, id)
     */
    core::Result<std::vector<core::Event>> collect_component(core::EventId s) const;
    
    core::Result<Projection> build_projection(std::vector<core::Event> elements) const;
    
    /**
     * @brief Size, diameter and velocity of the component as of s
     * 
     * Diameter is the largest element-to-element distance halved and rounded
     * half away from zero, absent when the projection has no edges. Velocity is
     * (size - 1) per second between the first and last element, 0 when they
     * share a timestamp. Fails with UNAVAILABLE when the shortest-path oracle
     * fails.
     */
    core::Result<core::ComponentMetrics> compute(core::EventId s) const;
    
    core::Result<core::ComponentMetrics> compute_and_store(core::EventId s);
    
    /**
     * @brief Compute and persist metrics for many events
     * 
     * Events are handled in chunks of batch_size, each computed in parallel
     * and persisted with one write batch. Events already carrying metrics are
     * skipped unless overwrite is set.
     */
    core::Result<MetricsReport> compute_batch(const std::vector<core::EventId>& ids, bool overwrite = false);
    
    /**
     * @brief Metrics for every processed event that has none yet
     */
    core::Result<MetricsReport> compute_pending();
    
    const core::MetricsConfig& config() const { return config_; }

private:
    core::Result<core::ComponentMetrics> measure(const Projection& projection) const;
    
    std::shared_ptr<storage::GraphStore> store_;
    std::shared_ptr<oracle::ShortestPathOracle> oracle_;
    core::MetricsConfig config_;
};

} // namespace metrics
} // namespace wccforest

#endif // WCCFOREST_METRICS_METRICS_ENGINE_H_
