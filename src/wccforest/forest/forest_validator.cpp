#include "wccforest/forest/forest_validator.h"
#include "wccforest/forest/chain_builder.h"
#include "wccforest/forest/union_find_forest.h"
#include "wccforest/common/logger.h"

#include <absl/container/flat_hash_map.h>

#include <algorithm>
#include <iterator>
#include <optional>

namespace wccforest {
namespace forest {

namespace {

template<typename T>
core::Result<T> violation(const std::string& message) {
    WCCFOREST_CRITICAL("Validation failed: {}", message);
    return core::Result<T>::error(message, core::Error::Code::STRUCTURAL_VIOLATION);
}

} // namespace

ForestValidator::ForestValidator(std::shared_ptr<storage::GraphStore> store)
    : store_(std::move(store)) {}

core::Result<ForestValidationStats> ForestValidator::validate_chains(const std::vector<core::Entity>& entities) const {
    ForestValidationStats stats;
    ChainBuilder builder(store_);
    
    for (const auto& entity : entities) {
        auto desired = builder.desired_chain(entity);
        if (!desired.ok()) {
            return core::Result<ForestValidationStats>::error_from(desired);
        }
        auto existing = store_->precedence_edges_of(entity);
        if (!existing.ok()) {
            return core::Result<ForestValidationStats>::error_from(existing);
        }
        
        auto key = [](const storage::PrecedenceEdge& e) { return std::make_pair(e.from, e.to); };
        std::vector<std::pair<core::EventId, core::EventId>> want;
        std::vector<std::pair<core::EventId, core::EventId>> have;
        std::transform(desired.value().begin(), desired.value().end(), std::back_inserter(want), key);
        std::transform(existing.value().begin(), existing.value().end(), std::back_inserter(have), key);
        std::sort(want.begin(), want.end());
        std::sort(have.begin(), have.end());
        
        if (want != have) {
            return violation<ForestValidationStats>(
                "precedence edges of entity " + entity.to_string() + " are not a single chronological path (" +
                std::to_string(have.size()) + " edges, expected " + std::to_string(want.size()) + ")");
        }
        ++stats.entities_checked;
    }
    return core::Result<ForestValidationStats>(stats);
}

core::Result<ForestValidationStats> ForestValidator::validate_all_chains() const {
    auto entities = store_->list_entities();
    if (!entities.ok()) {
        return core::Result<ForestValidationStats>::error_from(entities);
    }
    return validate_chains(entities.value());
}

core::Result<ForestValidationStats> ForestValidator::validate_forest() const {
    ForestValidationStats stats;
    auto events = store_->list_events();
    if (!events.ok()) {
        return core::Result<ForestValidationStats>::error_from(events);
    }
    
    absl::flat_hash_map<core::EventId, core::EventId> successor;
    for (core::EventId id : events.value()) {
        auto out = store_->forest_successors(id);
        if (!out.ok()) {
            return core::Result<ForestValidationStats>::error_from(out);
        }
        auto in = store_->forest_predecessors(id);
        if (!in.ok()) {
            return core::Result<ForestValidationStats>::error_from(in);
        }
        ++stats.events_checked;
        if (out.value().empty() && in.value().empty()) {
            auto processed = store_->is_processed(id);
            if (!processed.ok()) {
                return core::Result<ForestValidationStats>::error_from(processed);
            }
            if (processed.value()) {
                ++stats.trees;   // Singleton
            }
            continue;
        }
        
        if (out.value().size() > 1) {
            return violation<ForestValidationStats>(
                "event " + std::to_string(id) + " has " + std::to_string(out.value().size()) +
                " outgoing forest edges");
        }
        auto processed = store_->is_processed(id);
        if (!processed.ok()) {
            return core::Result<ForestValidationStats>::error_from(processed);
        }
        if (!processed.value()) {
            return violation<ForestValidationStats>(
                "forest edge touches unprocessed event " + std::to_string(id));
        }
        if (out.value().empty()) {
            ++stats.trees;
        } else {
            successor[id] = out.value().front();
            ++stats.forest_edges_checked;
        }
    }
    
    // Every walk must end at a head: 0 = unvisited, 1 = on the current walk, 2 = reaches a head
    absl::flat_hash_map<core::EventId, int> state;
    for (const auto& [start, unused] : successor) {
        std::vector<core::EventId> path;
        core::EventId current = start;
        while (true) {
            int& mark = state[current];
            if (mark == 2) {
                break;
            }
            if (mark == 1) {
                return violation<ForestValidationStats>("forest cycle through event " + std::to_string(current));
            }
            mark = 1;
            path.push_back(current);
            auto it = successor.find(current);
            if (it == successor.end()) {
                break;
            }
            current = it->second;
        }
        for (core::EventId id : path) {
            state[id] = 2;
        }
    }
    
    WCCFOREST_DEBUG("Forest valid: {} events, {} edges, {} trees",
                    stats.events_checked, stats.forest_edges_checked, stats.trees);
    return core::Result<ForestValidationStats>(stats);
}

core::Result<ForestValidationStats> ForestValidator::validate_components() const {
    ForestValidationStats stats;
    auto entities = store_->list_entities();
    if (!entities.ok()) {
        return core::Result<ForestValidationStats>::error_from(entities);
    }
    
    // Empty for unprocessed events
    absl::flat_hash_map<core::EventId, std::optional<core::EventId>> root;
    auto root_of = [&](core::EventId id) -> core::Result<std::optional<core::EventId>> {
        auto it = root.find(id);
        if (it != root.end()) {
            return core::Result<std::optional<core::EventId>>(it->second);
        }
        auto processed = store_->is_processed(id);
        if (!processed.ok()) {
            return core::Result<std::optional<core::EventId>>::error_from(processed);
        }
        std::optional<core::EventId> found;
        if (processed.value()) {
            auto head = TemporalForest::find_head(*store_, id);
            if (!head.ok()) {
                return core::Result<std::optional<core::EventId>>::error_from(head);
            }
            found = head.value();
        }
        root[id] = found;
        return core::Result<std::optional<core::EventId>>(found);
    };
    
    for (const auto& entity : entities.value()) {
        auto edges = store_->precedence_edges_of(entity);
        if (!edges.ok()) {
            return core::Result<ForestValidationStats>::error_from(edges);
        }
        for (const auto& edge : edges.value()) {
            auto from = root_of(edge.from);
            if (!from.ok()) {
                return core::Result<ForestValidationStats>::error_from(from);
            }
            auto to = root_of(edge.to);
            if (!to.ok()) {
                return core::Result<ForestValidationStats>::error_from(to);
            }
            if (!from.value() || !to.value()) {
                continue;   // Pending merge
            }
            if (*from.value() != *to.value()) {
                return violation<ForestValidationStats>(
                    "precedence edge " + std::to_string(edge.from) + " -> " + std::to_string(edge.to) +
                    " via " + entity.to_string() + " joins trees headed by " +
                    std::to_string(*from.value()) + " and " + std::to_string(*to.value()));
            }
            ++stats.precedence_edges_checked;
        }
        ++stats.entities_checked;
    }
    
    WCCFOREST_DEBUG("Components valid: {} precedence edges inside their trees", stats.precedence_edges_checked);
    return core::Result<ForestValidationStats>(stats);
}

} // namespace forest
} // namespace wccforest
