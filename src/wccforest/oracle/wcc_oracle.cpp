#include "wccforest/oracle/wcc_oracle.h"
#include <algorithm>
#include <numeric>

namespace wccforest {
namespace oracle {

namespace {

class DisjointSets {
public:
    explicit DisjointSets(size_t n) : parent_(n), rank_(n, 0) {
        std::iota(parent_.begin(), parent_.end(), 0);
    }
    
    // Two-pass: find the root, then point the whole path at it
    size_t find(size_t x) {
        size_t root = x;
        while (parent_[root] != root) {
            root = parent_[root];
        }
        while (parent_[x] != root) {
            size_t next = parent_[x];
            parent_[x] = root;
            x = next;
        }
        return root;
    }
    
    void unite(size_t a, size_t b) {
        a = find(a);
        b = find(b);
        if (a == b) return;
        if (rank_[a] < rank_[b]) {
            parent_[a] = b;
        } else if (rank_[a] > rank_[b]) {
            parent_[b] = a;
        } else {
            parent_[b] = a;
            rank_[a]++;
        }
    }

private:
    std::vector<size_t> parent_;
    std::vector<uint8_t> rank_;
};

} // namespace

core::Result<std::vector<uint64_t>> UnionFindWccOracle::label(const OracleGraph& graph) {
    auto valid = graph.validate();
    if (!valid.ok()) {
        return core::Result<std::vector<uint64_t>>::error_from(valid);
    }
    
    DisjointSets sets(graph.num_nodes);
    for (const auto& [a, b] : graph.edges) {
        sets.unite(a, b);
    }
    
    // Relabel each root with the smallest member so labels do not depend on union order
    std::vector<uint64_t> smallest(graph.num_nodes, graph.num_nodes);
    for (size_t node = 0; node < graph.num_nodes; ++node) {
        size_t root = sets.find(node);
        smallest[root] = std::min<uint64_t>(smallest[root], node);
    }
    std::vector<uint64_t> labels(graph.num_nodes);
    for (size_t node = 0; node < graph.num_nodes; ++node) {
        labels[node] = smallest[sets.find(node)];
    }
    return core::Result<std::vector<uint64_t>>(std::move(labels));
}

} // namespace oracle
} // namespace wccforest
