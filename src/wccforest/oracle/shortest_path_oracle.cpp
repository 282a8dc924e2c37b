#include "wccforest/oracle/shortest_path_oracle.h"
#include <deque>

namespace wccforest {
namespace oracle {

core::Result<std::vector<std::vector<int64_t>>> ShortestPathOracle::distances_from(
    const OracleGraph& graph, const std::vector<size_t>& sources) {
    std::vector<std::vector<int64_t>> rows;
    rows.reserve(sources.size());
    for (auto source : sources) {
        auto row = distances(graph, source);
        if (!row.ok()) {
            return core::Result<std::vector<std::vector<int64_t>>>::error_from(row);
        }
        rows.push_back(row.take_value());
    }
    return core::Result<std::vector<std::vector<int64_t>>>(std::move(rows));
}

std::vector<std::vector<size_t>> BfsShortestPathOracle::adjacency(const OracleGraph& graph) {
    std::vector<std::vector<size_t>> adjacency(graph.num_nodes);
    for (const auto& [a, b] : graph.edges) {
        adjacency[a].push_back(b);
        adjacency[b].push_back(a);
    }
    return adjacency;
}

std::vector<int64_t> BfsShortestPathOracle::bfs(const std::vector<std::vector<size_t>>& adjacency, size_t source) {
    std::vector<int64_t> dist(adjacency.size(), kUnreachable);
    std::deque<size_t> frontier;
    dist[source] = 0;
    frontier.push_back(source);
    while (!frontier.empty()) {
        size_t node = frontier.front();
        frontier.pop_front();
        for (auto next : adjacency[node]) {
            if (dist[next] == kUnreachable) {
                dist[next] = dist[node] + 1;
                frontier.push_back(next);
            }
        }
    }
    return dist;
}

core::Result<std::vector<int64_t>> BfsShortestPathOracle::distances(const OracleGraph& graph, size_t source) {
    auto valid = graph.validate();
    if (!valid.ok()) {
        return core::Result<std::vector<int64_t>>::error_from(valid);
    }
    if (source >= graph.num_nodes) {
        return core::Result<std::vector<int64_t>>::error(
            "Source " + std::to_string(source) + " outside graph", core::Error::Code::INVALID_ARGUMENT);
    }
    return core::Result<std::vector<int64_t>>(bfs(adjacency(graph), source));
}

core::Result<std::vector<std::vector<int64_t>>> BfsShortestPathOracle::distances_from(
    const OracleGraph& graph, const std::vector<size_t>& sources) {
    auto valid = graph.validate();
    if (!valid.ok()) {
        return core::Result<std::vector<std::vector<int64_t>>>::error_from(valid);
    }
    auto adj = adjacency(graph);
    std::vector<std::vector<int64_t>> rows;
    rows.reserve(sources.size());
    for (auto source : sources) {
        if (source >= graph.num_nodes) {
            return core::Result<std::vector<std::vector<int64_t>>>::error(
                "Source " + std::to_string(source) + " outside graph", core::Error::Code::INVALID_ARGUMENT);
        }
        rows.push_back(bfs(adj, source));
    }
    return core::Result<std::vector<std::vector<int64_t>>>(std::move(rows));
}

} // namespace oracle
} // namespace wccforest
