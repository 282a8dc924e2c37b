#include "wccforest/forest/union_find_forest.h"
#include "wccforest/common/logger.h"
#include <algorithm>

namespace wccforest {
namespace forest {

namespace {

core::Result<core::EventId> structural(const std::string& message) {
    WCCFOREST_CRITICAL("Forest structure violated: {}", message);
    return core::Result<core::EventId>::error(message, core::Error::Code::STRUCTURAL_VIOLATION);
}

core::Result<std::vector<core::Event>> sorted_events(const storage::GraphStore& store,
                                                     const std::vector<core::EventId>& ids) {
    auto events = store.get_events(ids);
    if (!events.ok()) {
        return events;
    }
    auto sorted = events.take_value();
    std::sort(sorted.begin(), sorted.end(),
              [](const core::Event& a, const core::Event& b) { return core::chronologically_before(a, b); });
    return core::Result<std::vector<core::Event>>(std::move(sorted));
}

} // namespace

MergeTransaction::MergeTransaction(std::shared_ptr<storage::GraphStore> store)
    : store_(std::move(store)) {}

core::Result<bool> MergeTransaction::processed(core::EventId id) const {
    if (staged_processed_.count(id)) {
        return core::Result<bool>(true);
    }
    return store_->is_processed(id);
}

core::Result<std::vector<core::EventId>> MergeTransaction::successors(core::EventId id) const {
    auto committed = store_->forest_successors(id);
    if (!committed.ok()) {
        return committed;
    }
    auto result = committed.take_value();
    auto it = staged_successor_.find(id);
    if (it != staged_successor_.end()) {
        result.push_back(it->second);
    }
    return core::Result<std::vector<core::EventId>>(std::move(result));
}

core::Result<core::EventId> MergeTransaction::head_of(core::EventId id) {
    absl::flat_hash_set<core::EventId> visited;
    core::EventId current = id;
    
    while (true) {
        if (!visited.insert(current).second) {
            return structural("cycle through event " + std::to_string(current));
        }
        auto next = successors(current);
        if (!next.ok()) {
            return core::Result<core::EventId>::error_from(next);
        }
        const auto& out = next.value();
        if (out.size() > 1) {
            return structural("event " + std::to_string(current) + " has " +
                              std::to_string(out.size()) + " outgoing forest edges");
        }
        if (out.empty()) {
            break;
        }
        current = out.front();
    }
    
    // A committed head must still be processed and terminal at commit time
    if (!staged_processed_.count(current) && expected_heads_.insert(current).second) {
        batch_.expect_processed.push_back(current);
        batch_.expect_terminal.push_back(current);
    }
    return core::Result<core::EventId>(current);
}

core::Result<MergeOutcome> MergeTransaction::merge(core::EventId event) {
    if (committed_) {
        return core::Result<MergeOutcome>::error("Transaction already committed",
                                                 core::Error::Code::INVALID_ARGUMENT);
    }
    
    MergeOutcome outcome;
    outcome.event = event;
    
    auto already = processed(event);
    if (!already.ok()) {
        return core::Result<MergeOutcome>::error_from(already);
    }
    if (already.value()) {
        WCCFOREST_DEBUG("Event {} already processed, skipping", event);
        outcome.skipped = true;
        return core::Result<MergeOutcome>(std::move(outcome));
    }
    
    auto predecessors = store_->precedence_predecessors(event);
    if (!predecessors.ok()) {
        return core::Result<MergeOutcome>::error_from(predecessors);
    }
    // A late arrival can also have processed successors; their trees join too
    auto next_events = store_->precedence_successors(event);
    if (!next_events.ok()) {
        return core::Result<MergeOutcome>::error_from(next_events);
    }
    std::vector<core::EventId> neighbours = predecessors.take_value();
    neighbours.insert(neighbours.end(), next_events.value().begin(), next_events.value().end());
    
    std::vector<core::EventId> heads;
    for (core::EventId neighbour : neighbours) {
        auto neighbour_processed = processed(neighbour);
        if (!neighbour_processed.ok()) {
            return core::Result<MergeOutcome>::error_from(neighbour_processed);
        }
        if (!neighbour_processed.value()) {
            continue;
        }
        auto head = head_of(neighbour);
        if (!head.ok()) {
            return core::Result<MergeOutcome>::error_from(head);
        }
        heads.push_back(head.value());
    }
    std::sort(heads.begin(), heads.end());
    heads.erase(std::unique(heads.begin(), heads.end()), heads.end());
    
    if (heads.size() > 1) {
        auto ordered = sorted_events(*store_, heads);
        if (!ordered.ok()) {
            return core::Result<MergeOutcome>::error_from(ordered);
        }
        heads.clear();
        for (const auto& head_event : ordered.value()) {
            heads.push_back(head_event.id);
        }
    }
    
    staged_processed_.insert(event);
    batch_.processed.push_back(event);
    batch_.expect_unprocessed.push_back(event);
    for (core::EventId head : heads) {
        staged_successor_[head] = event;
        batch_.forest_edges.push_back(storage::ForestEdge{head, event});
    }
    
    WCCFOREST_DEBUG("Staged event {} absorbing {} heads", event, heads.size());
    outcome.absorbed_heads = std::move(heads);
    return core::Result<MergeOutcome>(std::move(outcome));
}

core::Result<void> MergeTransaction::commit() {
    if (committed_) {
        return core::Result<void>::error("Transaction already committed", core::Error::Code::INVALID_ARGUMENT);
    }
    committed_ = true;
    if (batch_.empty()) {
        return core::Result<void>();
    }
    return store_->commit(batch_);
}

core::Result<core::EventId> TemporalForest::find_head(const storage::GraphStore& store, core::EventId x,
                                                      std::optional<core::EventId> exclude) {
    absl::flat_hash_set<core::EventId> visited;
    core::EventId current = x;
    
    while (true) {
        if (!visited.insert(current).second) {
            return structural("cycle through event " + std::to_string(current));
        }
        auto next = store.forest_successors(current);
        if (!next.ok()) {
            return core::Result<core::EventId>::error_from(next);
        }
        const auto& out = next.value();
        if (out.size() > 1) {
            return structural("event " + std::to_string(current) + " has " +
                              std::to_string(out.size()) + " outgoing forest edges");
        }
        if (out.empty() || (exclude && out.front() == *exclude)) {
            return core::Result<core::EventId>(current);
        }
        current = out.front();
    }
}

core::Result<MergeOutcome> TemporalForest::merge_event(std::shared_ptr<storage::GraphStore> store,
                                                       core::EventId event) {
    MergeTransaction txn(std::move(store));
    auto outcome = txn.merge(event);
    if (!outcome.ok()) {
        return outcome;
    }
    auto committed = txn.commit();
    if (!committed.ok()) {
        return core::Result<MergeOutcome>::error_from(committed);
    }
    return outcome;
}

core::Result<std::vector<MergeOutcome>> TemporalForest::merge_group(std::shared_ptr<storage::GraphStore> store,
                                                                    const std::vector<core::EventId>& events) {
    auto ordered = sorted_events(*store, events);
    if (!ordered.ok()) {
        return core::Result<std::vector<MergeOutcome>>::error_from(ordered);
    }
    
    MergeTransaction txn(store);
    std::vector<MergeOutcome> outcomes;
    outcomes.reserve(ordered.value().size());
    for (const auto& event : ordered.value()) {
        auto outcome = txn.merge(event.id);
        if (!outcome.ok()) {
            return core::Result<std::vector<MergeOutcome>>::error_from(outcome);
        }
        outcomes.push_back(outcome.take_value());
    }
    
    auto committed = txn.commit();
    if (!committed.ok()) {
        return core::Result<std::vector<MergeOutcome>>::error_from(committed);
    }
    return core::Result<std::vector<MergeOutcome>>(std::move(outcomes));
}

} // namespace forest
} // namespace wccforest
