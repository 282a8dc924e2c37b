#include "wccforest/storage/memory_graph_store.h"
#include "wccforest/common/logger.h"
#include <algorithm>
#include <mutex>

namespace wccforest {
namespace storage {

namespace {

std::string missing_event(core::EventId id) {
    return "Event " + std::to_string(id) + " not found";
}

} // namespace

MemoryGraphStore::MemoryGraphStore() = default;

MemoryGraphStore::~MemoryGraphStore() = default;

core::Result<void> MemoryGraphStore::put_event(const core::Event& event) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = events_.find(event.id);
    if (it != events_.end()) {
        if (it->second == event) {
            return core::Result<void>();
        }
        return core::Result<void>::error(
            "Event " + std::to_string(event.id) + " already exists with a different payload",
            core::Error::Code::ALREADY_EXISTS);
    }
    events_.emplace(event.id, event);
    timeline_.emplace(event.timestamp, event.id);
    return core::Result<void>();
}

core::Result<void> MemoryGraphStore::link_entity(core::EventId event_id, const core::Entity& entity) {
    core::Timestamp timestamp = 0;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = events_.find(event_id);
        if (it == events_.end()) {
            return core::Result<void>::error(missing_event(event_id), core::Error::Code::NOT_FOUND);
        }
        timestamp = it->second.timestamp;
    }
    auto added = index_.add_touch(event_id, timestamp, entity);
    if (!added.ok()) {
        return core::Result<void>::error_from(added);
    }
    return core::Result<void>();
}

core::Result<core::Event> MemoryGraphStore::get_event(core::EventId id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = events_.find(id);
    if (it == events_.end()) {
        return core::Result<core::Event>::error(missing_event(id), core::Error::Code::NOT_FOUND);
    }
    return core::Result<core::Event>(it->second);
}

core::Result<std::vector<core::Event>> MemoryGraphStore::get_events(const std::vector<core::EventId>& ids) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<core::Event> result;
    result.reserve(ids.size());
    for (auto id : ids) {
        auto it = events_.find(id);
        if (it == events_.end()) {
            return core::Result<std::vector<core::Event>>::error(missing_event(id), core::Error::Code::NOT_FOUND);
        }
        result.push_back(it->second);
    }
    return core::Result<std::vector<core::Event>>(std::move(result));
}

core::Result<std::vector<core::EventId>> MemoryGraphStore::list_events() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<core::EventId> result;
    result.reserve(timeline_.size());
    for (const auto& [ts, id] : timeline_) {
        result.push_back(id);
    }
    return core::Result<std::vector<core::EventId>>(std::move(result));
}

core::Result<std::vector<core::Entity>> MemoryGraphStore::list_entities() const {
    return core::Result<std::vector<core::Entity>>(index_.entities());
}

core::Result<std::vector<core::Event>> MemoryGraphStore::events_in_range(
    core::Timestamp start, core::Timestamp end) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<core::Event> result;
    if (start > end) {
        return core::Result<std::vector<core::Event>>(std::move(result));
    }
    auto first = timeline_.lower_bound({start, 0});
    for (auto it = first; it != timeline_.end() && it->first <= end; ++it) {
        result.push_back(events_.at(it->second));
    }
    return core::Result<std::vector<core::Event>>(std::move(result));
}

core::Result<std::vector<core::Entity>> MemoryGraphStore::entities_of(core::EventId id) const {
    return index_.entities_of(id);
}

core::Result<std::vector<core::EventId>> MemoryGraphStore::events_touching(const core::Entity& entity) const {
    return index_.events_touching(entity);
}

core::Result<std::vector<PrecedenceEdge>> MemoryGraphStore::precedence_edges_of(const core::Entity& entity) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<PrecedenceEdge> result;
    auto it = precedence_.find(entity);
    if (it != precedence_.end()) {
        result.reserve(it->second.size());
        for (const auto& [from, to] : it->second) {
            result.push_back(PrecedenceEdge{from, to, entity});
        }
    }
    return core::Result<std::vector<PrecedenceEdge>>(std::move(result));
}

std::vector<core::EventId> MemoryGraphStore::distinct_ids(const Adjacency& adjacency) {
    std::vector<core::EventId> ids;
    ids.reserve(adjacency.size());
    for (const auto& [id, entity] : adjacency) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    ids.erase(std::unique(ids.begin(), ids.end()), ids.end());
    return ids;
}

core::Result<std::vector<core::EventId>> MemoryGraphStore::precedence_predecessors(core::EventId id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = precedence_in_.find(id);
    if (it == precedence_in_.end()) {
        return core::Result<std::vector<core::EventId>>(std::vector<core::EventId>{});
    }
    return core::Result<std::vector<core::EventId>>(distinct_ids(it->second));
}

core::Result<std::vector<core::EventId>> MemoryGraphStore::precedence_successors(core::EventId id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = precedence_out_.find(id);
    if (it == precedence_out_.end()) {
        return core::Result<std::vector<core::EventId>>(std::vector<core::EventId>{});
    }
    return core::Result<std::vector<core::EventId>>(distinct_ids(it->second));
}

core::Result<std::vector<core::EventId>> MemoryGraphStore::forest_successors(core::EventId id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = forest_out_.find(id);
    if (it == forest_out_.end()) {
        return core::Result<std::vector<core::EventId>>(std::vector<core::EventId>{});
    }
    return core::Result<std::vector<core::EventId>>(it->second);
}

core::Result<std::vector<core::EventId>> MemoryGraphStore::forest_predecessors(core::EventId id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = forest_in_.find(id);
    if (it == forest_in_.end()) {
        return core::Result<std::vector<core::EventId>>(std::vector<core::EventId>{});
    }
    return core::Result<std::vector<core::EventId>>(it->second);
}

core::Result<bool> MemoryGraphStore::is_processed(core::EventId id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (events_.find(id) == events_.end()) {
        return core::Result<bool>::error(missing_event(id), core::Error::Code::NOT_FOUND);
    }
    return core::Result<bool>(processed_.contains(id));
}

core::Result<std::vector<core::EventId>> MemoryGraphStore::unprocessed_events() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<core::EventId> result;
    for (const auto& [ts, id] : timeline_) {
        if (!processed_.contains(id)) {
            result.push_back(id);
        }
    }
    return core::Result<std::vector<core::EventId>>(std::move(result));
}

core::Result<std::optional<core::ComponentMetrics>> MemoryGraphStore::get_metrics(core::EventId id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = metrics_.find(id);
    if (it == metrics_.end()) {
        return core::Result<std::optional<core::ComponentMetrics>>(std::nullopt);
    }
    return core::Result<std::optional<core::ComponentMetrics>>(it->second);
}

core::Result<void> MemoryGraphStore::validate_batch(const WriteBatch& batch) const {
    auto require_event = [this](core::EventId id) -> core::Result<void> {
        if (events_.find(id) == events_.end()) {
            return core::Result<void>::error(missing_event(id), core::Error::Code::NOT_FOUND);
        }
        return core::Result<void>();
    };
    
    for (const auto& edge : batch.precedence_additions) {
        auto from = require_event(edge.from);
        if (!from.ok()) return from;
        auto to = require_event(edge.to);
        if (!to.ok()) return to;
    }
    for (const auto& edge : batch.forest_edges) {
        auto head = require_event(edge.head);
        if (!head.ok()) return head;
        auto event = require_event(edge.event);
        if (!event.ok()) return event;
    }
    for (auto id : batch.processed) {
        auto present = require_event(id);
        if (!present.ok()) return present;
    }
    for (const auto& [id, metrics] : batch.metrics) {
        auto present = require_event(id);
        if (!present.ok()) return present;
    }
    
    for (auto id : batch.expect_unprocessed) {
        if (processed_.contains(id)) {
            return core::Result<void>::error(
                "Event " + std::to_string(id) + " was processed concurrently",
                core::Error::Code::CONFLICT);
        }
    }
    for (auto id : batch.expect_processed) {
        if (!processed_.contains(id)) {
            return core::Result<void>::error(
                "Event " + std::to_string(id) + " is no longer processed",
                core::Error::Code::CONFLICT);
        }
    }
    for (auto id : batch.expect_terminal) {
        auto it = forest_out_.find(id);
        if (it != forest_out_.end() && !it->second.empty()) {
            return core::Result<void>::error(
                "Head " + std::to_string(id) + " was absorbed concurrently",
                core::Error::Code::CONFLICT);
        }
    }
    return core::Result<void>();
}

void MemoryGraphStore::remove_precedence_edge(const PrecedenceEdge& edge) {
    auto chain = precedence_.find(edge.via);
    if (chain == precedence_.end() || chain->second.erase({edge.from, edge.to}) == 0) {
        return;
    }
    if (chain->second.empty()) {
        precedence_.erase(chain);
    }
    auto drop = [&edge](Adjacency& adjacency, core::EventId other) {
        adjacency.erase(std::remove_if(adjacency.begin(), adjacency.end(),
            [&](const std::pair<core::EventId, core::Entity>& entry) {
                return entry.first == other && entry.second == edge.via;
            }), adjacency.end());
    };
    drop(precedence_out_[edge.from], edge.to);
    drop(precedence_in_[edge.to], edge.from);
    --precedence_edge_count_;
}

void MemoryGraphStore::add_precedence_edge(const PrecedenceEdge& edge) {
    // Insert-if-absent
    if (!precedence_[edge.via].insert({edge.from, edge.to}).second) {
        return;
    }
    precedence_out_[edge.from].emplace_back(edge.to, edge.via);
    precedence_in_[edge.to].emplace_back(edge.from, edge.via);
    ++precedence_edge_count_;
}

void MemoryGraphStore::add_forest_edge(const ForestEdge& edge) {
    auto& out = forest_out_[edge.head];
    if (std::find(out.begin(), out.end(), edge.event) != out.end()) {
        return;
    }
    out.push_back(edge.event);
    forest_in_[edge.event].push_back(edge.head);
    ++forest_edge_count_;
}

core::Result<void> MemoryGraphStore::commit(const WriteBatch& batch) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    
    auto valid = validate_batch(batch);
    if (!valid.ok()) {
        WCCFOREST_DEBUG("MemoryGraphStore: rejected batch of {} writes: {}", batch.mutation_count(), valid.error());
        return valid;
    }
    
    // Removals first so a re-linked chain never shows a branch
    for (const auto& edge : batch.precedence_removals) {
        remove_precedence_edge(edge);
    }
    for (const auto& edge : batch.precedence_additions) {
        add_precedence_edge(edge);
    }
    for (const auto& edge : batch.forest_edges) {
        add_forest_edge(edge);
    }
    for (auto id : batch.processed) {
        processed_.insert(id);
    }
    for (const auto& [id, metrics] : batch.metrics) {
        metrics_[id] = metrics;
    }
    return core::Result<void>();
}

core::Result<void> MemoryGraphStore::reset_derived_state() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    precedence_.clear();
    precedence_in_.clear();
    precedence_out_.clear();
    precedence_edge_count_ = 0;
    forest_out_.clear();
    forest_in_.clear();
    forest_edge_count_ = 0;
    processed_.clear();
    metrics_.clear();
    WCCFOREST_INFO("MemoryGraphStore: derived state reset ({} events kept)", events_.size());
    return core::Result<void>();
}

GraphStoreStats MemoryGraphStore::stats() const {
    GraphStoreStats stats;
    stats.entities = index_.num_entities();
    stats.touch_edges = index_.num_touches();
    
    std::shared_lock<std::shared_mutex> lock(mutex_);
    stats.events = events_.size();
    stats.precedence_edges = precedence_edge_count_;
    stats.forest_edges = forest_edge_count_;
    stats.processed_events = processed_.size();
    stats.events_with_metrics = metrics_.size();
    return stats;
}

} // namespace storage
} // namespace wccforest
