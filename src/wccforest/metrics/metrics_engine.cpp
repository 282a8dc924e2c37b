#include "wccforest/metrics/metrics_engine.h"
#include "wccforest/common/logger.h"

#include <tbb/parallel_for.h>
#include <tbb/blocked_range.h>

#include <absl/container/flat_hash_map.h>
#include <absl/container/flat_hash_set.h>

#include <algorithm>
#include <cmath>
#include <deque>
#include <optional>

namespace wccforest {
namespace metrics {

MetricsEngine::MetricsEngine(std::shared_ptr<storage::GraphStore> store,
                             std::shared_ptr<oracle::ShortestPathOracle> oracle,
                             const core::MetricsConfig& config)
    : store_(std::move(store)), oracle_(std::move(oracle)), config_(config) {
    if (config_.batch_size == 0) {
        config_.batch_size = 1;
    }
}

core::Result<std::vector<core::Event>> MetricsEngine::collect_component(core::EventId s) const {
    auto processed = store_->is_processed(s);
    if (!processed.ok()) {
        return core::Result<std::vector<core::Event>>::error_from(processed);
    }
    if (!processed.value()) {
        return core::Result<std::vector<core::Event>>::error(
            "Event " + std::to_string(s) + " is not processed", core::Error::Code::INVALID_ARGUMENT);
    }
    
    absl::flat_hash_set<core::EventId> seen{s};
    std::vector<core::EventId> ids{s};
    std::deque<core::EventId> frontier{s};
    while (!frontier.empty()) {
        core::EventId current = frontier.front();
        frontier.pop_front();
        auto absorbed = store_->forest_predecessors(current);
        if (!absorbed.ok()) {
            return core::Result<std::vector<core::Event>>::error_from(absorbed);
        }
        for (core::EventId pred : absorbed.value()) {
            if (seen.insert(pred).second) {
                ids.push_back(pred);
                frontier.push_back(pred);
            }
        }
    }
    
    auto events = store_->get_events(ids);
    if (!events.ok()) {
        return events;
    }
    auto elements = events.take_value();
    std::sort(elements.begin(), elements.end(),
              [](const core::Event& a, const core::Event& b) { return core::chronologically_before(a, b); });
    return core::Result<std::vector<core::Event>>(std::move(elements));
}

core::Result<Projection> MetricsEngine::build_projection(std::vector<core::Event> elements) const {
    Projection projection;
    projection.elements = std::move(elements);
    
    absl::flat_hash_map<core::EventId, size_t> element_node;
    for (const auto& event : projection.elements) {
        element_node[event.id] = projection.graph.add_node();
    }
    
    absl::flat_hash_map<core::Entity, size_t> entity_index;
    std::vector<std::pair<size_t, size_t>> touches;   // (element node, entity index)
    for (size_t i = 0; i < projection.elements.size(); ++i) {
        auto entities = store_->entities_of(projection.elements[i].id);
        if (!entities.ok()) {
            return core::Result<Projection>::error_from(entities);
        }
        for (const auto& entity : entities.value()) {
            auto it = entity_index.find(entity);
            if (it == entity_index.end()) {
                it = entity_index.emplace(entity, projection.entities.size()).first;
                projection.entities.push_back(entity);
            }
            touches.emplace_back(i, it->second);
        }
    }
    
    for (size_t e = 0; e < projection.entities.size(); ++e) {
        projection.graph.add_node();
    }
    for (const auto& [node, entity] : touches) {
        projection.graph.add_edge(node, projection.entity_node(entity));
    }
    projection.touch_edges = touches.size();
    
    // Precedence edges with both ends inside the component
    for (size_t i = 0; i < projection.elements.size(); ++i) {
        auto successors = store_->precedence_successors(projection.elements[i].id);
        if (!successors.ok()) {
            return core::Result<Projection>::error_from(successors);
        }
        for (core::EventId next : successors.value()) {
            auto it = element_node.find(next);
            if (it != element_node.end()) {
                projection.graph.add_edge(i, it->second);
                ++projection.precedence_edges;
            }
        }
    }
    return core::Result<Projection>(std::move(projection));
}

core::Result<core::ComponentMetrics> MetricsEngine::measure(const Projection& projection) const {
    core::ComponentMetrics metrics;
    const size_t n = projection.elements.size();
    metrics.size = n;
    
    if (!projection.graph.edges.empty()) {
        if (!oracle_) {
            return core::Result<core::ComponentMetrics>::error("No shortest-path oracle configured",
                                                               core::Error::Code::UNAVAILABLE);
        }
        std::vector<size_t> sources(n);
        for (size_t i = 0; i < n; ++i) {
            sources[i] = i;
        }
        auto distances = oracle_->distances_from(projection.graph, sources);
        if (!distances.ok()) {
            return core::Result<core::ComponentMetrics>::error(
                "Shortest-path oracle " + oracle_->name() + " failed: " + distances.error(),
                core::Error::Code::UNAVAILABLE);
        }
        int64_t longest = 0;
        for (const auto& row : distances.value()) {
            for (size_t target = 0; target < n && target < row.size(); ++target) {
                if (row[target] != oracle::ShortestPathOracle::kUnreachable) {
                    longest = std::max(longest, row[target]);
                }
            }
        }
        metrics.diameter = static_cast<int64_t>(std::lround(static_cast<double>(longest) / 2.0));
    }
    
    if (n > 1) {
        double span_seconds = static_cast<double>(projection.elements.back().timestamp -
                                                  projection.elements.front().timestamp) / 1000.0;
        metrics.velocity = span_seconds > 0.0 ? static_cast<double>(n - 1) / span_seconds : 0.0;
    } else {
        metrics.velocity = 0.0;
    }
    return core::Result<core::ComponentMetrics>(metrics);
}

core::Result<core::ComponentMetrics> MetricsEngine::compute(core::EventId s) const {
    auto elements = collect_component(s);
    if (!elements.ok()) {
        return core::Result<core::ComponentMetrics>::error_from(elements);
    }
    auto projection = build_projection(elements.take_value());
    if (!projection.ok()) {
        return core::Result<core::ComponentMetrics>::error_from(projection);
    }
    return measure(projection.value());
}

core::Result<core::ComponentMetrics> MetricsEngine::compute_and_store(core::EventId s) {
    auto metrics = compute(s);
    if (!metrics.ok()) {
        return metrics;
    }
    storage::WriteBatch batch;
    batch.metrics.emplace_back(s, metrics.value());
    batch.expect_processed.push_back(s);
    auto committed = store_->commit(batch);
    if (!committed.ok()) {
        return core::Result<core::ComponentMetrics>::error_from(committed);
    }
    return metrics;
}

core::Result<MetricsReport> MetricsEngine::compute_batch(const std::vector<core::EventId>& ids, bool overwrite) {
    MetricsReport report;
    
    std::vector<core::EventId> todo;
    todo.reserve(ids.size());
    for (core::EventId id : ids) {
        auto processed = store_->is_processed(id);
        if (!processed.ok()) {
            return core::Result<MetricsReport>::error_from(processed);
        }
        if (!processed.value()) {
            ++report.skipped;
            continue;
        }
        if (!overwrite) {
            auto existing = store_->get_metrics(id);
            if (!existing.ok()) {
                return core::Result<MetricsReport>::error_from(existing);
            }
            if (existing.value()) {
                ++report.skipped;
                continue;
            }
        }
        todo.push_back(id);
    }
    
    for (size_t offset = 0; offset < todo.size(); offset += config_.batch_size) {
        const size_t count = std::min(config_.batch_size, todo.size() - offset);
        std::vector<std::optional<core::ComponentMetrics>> results(count);
        std::vector<std::string> errors(count);
        
        auto compute_range = [&](size_t begin, size_t end) {
            for (size_t i = begin; i < end; ++i) {
                auto metrics = compute(todo[offset + i]);
                if (metrics.ok()) {
                    results[i] = metrics.value();
                } else {
                    errors[i] = metrics.error();
                }
            }
        };
        if (config_.parallel) {
            tbb::parallel_for(tbb::blocked_range<size_t>(0, count),
                [&](const tbb::blocked_range<size_t>& range) {
                    compute_range(range.begin(), range.end());
                });
        } else {
            compute_range(0, count);
        }
        
        storage::WriteBatch batch;
        for (size_t i = 0; i < count; ++i) {
            if (results[i]) {
                batch.metrics.emplace_back(todo[offset + i], *results[i]);
            } else {
                WCCFOREST_ERROR("Metrics for event {} failed: {}", todo[offset + i], errors[i]);
                report.failed.emplace_back(todo[offset + i], errors[i]);
            }
        }
        if (!batch.empty()) {
            auto committed = store_->commit(batch);
            if (!committed.ok()) {
                return core::Result<MetricsReport>::error_from(committed);
            }
            report.computed += batch.metrics.size();
        }
    }
    
    WCCFOREST_INFO("Metrics: {} computed, {} skipped, {} failed",
                   report.computed, report.skipped, report.failed.size());
    return core::Result<MetricsReport>(std::move(report));
}

core::Result<MetricsReport> MetricsEngine::compute_pending() {
    auto events = store_->list_events();
    if (!events.ok()) {
        return core::Result<MetricsReport>::error_from(events);
    }
    return compute_batch(events.value(), false);
}

} // namespace metrics
} // namespace wccforest
