#include "wccforest/features/feature_extractor.h"
#include "wccforest/forest/union_find_forest.h"
#include "wccforest/common/logger.h"

#include <algorithm>
#include <chrono>
#include <limits>
#include <thread>

namespace wccforest {
namespace features {

namespace {

void backoff(core::Duration base_ms, uint32_t attempt) {
    core::Duration delay = base_ms * (core::Duration{1} << std::min<uint32_t>(attempt, 16));
    std::this_thread::sleep_for(std::chrono::milliseconds(delay));
}

} // namespace

FeatureExtractor::FeatureExtractor(std::shared_ptr<storage::GraphStore> store,
                                   std::shared_ptr<metrics::MetricsEngine> metrics,
                                   const core::FeatureConfig& config)
    : store_(std::move(store)), metrics_(std::move(metrics)), config_(config) {}

core::Result<core::ComponentMetrics> FeatureExtractor::metrics_of(core::EventId head) const {
    auto stored = store_->get_metrics(head);
    if (!stored.ok()) {
        return core::Result<core::ComponentMetrics>::error_from(stored);
    }
    if (stored.value()) {
        return core::Result<core::ComponentMetrics>(*stored.value());
    }
    if (!config_.compute_missing_metrics || !metrics_) {
        return core::Result<core::ComponentMetrics>::error(
            "No metrics stored for component head " + std::to_string(head),
            core::Error::Code::UNAVAILABLE);
    }
    WCCFOREST_DEBUG("Computing missing metrics for head {}", head);
    return metrics_->compute(head);
}

core::Result<core::FeatureRecord> FeatureExtractor::aggregate(core::EventId id,
                                                              const std::vector<core::EventId>& heads) const {
    core::FeatureRecord record;
    record.event_id = id;
    record.distinct_component_count = heads.size();
    
    for (core::EventId head : heads) {
        auto metrics = metrics_of(head);
        if (!metrics.ok()) {
            return core::Result<core::FeatureRecord>::error_from(metrics);
        }
        const auto& m = metrics.value();
        record.max_component_size = std::max(record.max_component_size.value_or(0), m.size);
        if (m.diameter) {
            record.max_component_diameter = record.max_component_diameter
                ? std::max(*record.max_component_diameter, *m.diameter) : *m.diameter;
        }
        record.max_component_velocity = record.max_component_velocity
            ? std::max(*record.max_component_velocity, m.velocity) : m.velocity;
    }
    return core::Result<core::FeatureRecord>(record);
}

core::Result<core::FeatureRecord> FeatureExtractor::extract_training(core::EventId source,
                                                                     core::Timestamp cutoff) const {
    auto event = store_->get_event(source);
    if (!event.ok()) {
        return core::Result<core::FeatureRecord>::error_from(event);
    }
    if (event.value().timestamp > cutoff) {
        return core::Result<core::FeatureRecord>::error(
            "Event " + std::to_string(source) + " is later than the cutoff",
            core::Error::Code::INVALID_ARGUMENT);
    }
    auto processed = store_->is_processed(source);
    if (!processed.ok()) {
        return core::Result<core::FeatureRecord>::error_from(processed);
    }
    if (!processed.value()) {
        return core::Result<core::FeatureRecord>::error(
            "Event " + std::to_string(source) + " has not been merged into the forest",
            core::Error::Code::INVALID_ARGUMENT);
    }
    
    auto heads = store_->forest_predecessors(source);
    if (!heads.ok()) {
        return core::Result<core::FeatureRecord>::error_from(heads);
    }
    // A late arrival can absorb a head processed after it; its snapshot is still used
    auto head_events = store_->get_events(heads.value());
    if (!head_events.ok()) {
        return core::Result<core::FeatureRecord>::error_from(head_events);
    }
    for (const auto& head : head_events.value()) {
        if (head.timestamp > cutoff) {
            WCCFOREST_WARN("Training features for event {} read head {} at {}, later than cutoff {}",
                           source, head.id, head.timestamp, cutoff);
        }
    }
    return aggregate(source, heads.value());
}

core::Result<std::vector<core::FeatureRecord>> FeatureExtractor::extract_training_set(core::Timestamp cutoff) const {
    auto events = store_->events_in_range(std::numeric_limits<core::Timestamp>::min(), cutoff);
    if (!events.ok()) {
        return core::Result<std::vector<core::FeatureRecord>>::error_from(events);
    }
    
    std::vector<core::FeatureRecord> records;
    for (const auto& event : events.value()) {
        auto processed = store_->is_processed(event.id);
        if (!processed.ok()) {
            return core::Result<std::vector<core::FeatureRecord>>::error_from(processed);
        }
        if (!processed.value()) {
            continue;
        }
        for (uint32_t attempt = 0; ; ++attempt) {
            auto record = extract_training(event.id, cutoff);
            if (record.ok()) {
                records.push_back(record.value());
                break;
            }
            if (!core::is_transient(record.error_code()) || attempt >= config_.training_max_retries) {
                WCCFOREST_ERROR("Training features for event {} failed: {}", event.id, record.error());
                return core::Result<std::vector<core::FeatureRecord>>::error_from(record);
            }
            WCCFOREST_WARN("Training features for event {} failed (attempt {}), retrying: {}",
                           event.id, attempt + 1, record.error());
            backoff(config_.retry_backoff_ms, attempt);
        }
    }
    
    WCCFOREST_INFO("Extracted {} training records up to {}", records.size(), cutoff);
    return core::Result<std::vector<core::FeatureRecord>>(std::move(records));
}

core::Result<std::vector<core::EventId>> FeatureExtractor::heads_for(
    const core::Event& event, const std::vector<core::Entity>& entities) const {
    std::vector<core::EventId> heads;
    
    for (const auto& entity : entities) {
        auto touching = store_->events_touching(entity);
        if (!touching.ok()) {
            return core::Result<std::vector<core::EventId>>::error_from(touching);
        }
        std::vector<core::EventId> others;
        for (core::EventId id : touching.value()) {
            if (id != event.id) {
                others.push_back(id);
            }
        }
        auto candidates = store_->get_events(others);
        if (!candidates.ok()) {
            return core::Result<std::vector<core::EventId>>::error_from(candidates);
        }
        
        for (const auto& candidate : candidates.value()) {
            if (!core::chronologically_before(candidate, event)) {
                continue;
            }
            auto processed = store_->is_processed(candidate.id);
            if (!processed.ok()) {
                return core::Result<std::vector<core::EventId>>::error_from(processed);
            }
            if (!processed.value()) {
                continue;
            }
            auto head = forest::TemporalForest::find_head(*store_, candidate.id, event.id);
            if (!head.ok()) {
                return core::Result<std::vector<core::EventId>>::error_from(head);
            }
            heads.push_back(head.value());
        }
    }
    
    std::sort(heads.begin(), heads.end());
    heads.erase(std::unique(heads.begin(), heads.end()), heads.end());
    return core::Result<std::vector<core::EventId>>(std::move(heads));
}

core::Result<core::FeatureRecord> FeatureExtractor::realtime_once(const core::Event& event,
                                                                  const std::vector<core::Entity>& entities) const {
    auto heads = heads_for(event, entities);
    if (!heads.ok()) {
        return core::Result<core::FeatureRecord>::error_from(heads);
    }
    return aggregate(event.id, heads.value());
}

core::Result<core::FeatureRecord> FeatureExtractor::extract_realtime(const core::Event& event,
                                                                     const std::vector<core::Entity>& entities) const {
    for (uint32_t attempt = 0; ; ++attempt) {
        auto record = realtime_once(event, entities);
        if (record.ok()) {
            return record;
        }
        if (record.error_code() == core::Error::Code::STRUCTURAL_VIOLATION) {
            return record;
        }
        if (!core::is_transient(record.error_code()) || attempt >= config_.realtime_max_retries) {
            WCCFOREST_ERROR("Real-time features for event {} unavailable: {}", event.id, record.error());
            return core::Result<core::FeatureRecord>::error(
                "features unavailable: " + record.error(), core::Error::Code::UNAVAILABLE);
        }
        backoff(config_.retry_backoff_ms, attempt);
    }
}

core::Result<core::FeatureRecord> FeatureExtractor::extract_realtime(core::EventId id) const {
    auto event = store_->get_event(id);
    if (!event.ok()) {
        return core::Result<core::FeatureRecord>::error(
            "features unavailable: " + event.error(),
            event.error_code() == core::Error::Code::NOT_FOUND ? core::Error::Code::NOT_FOUND
                                                               : core::Error::Code::UNAVAILABLE);
    }
    auto entities = store_->entities_of(id);
    if (!entities.ok()) {
        return core::Result<core::FeatureRecord>::error(
            "features unavailable: " + entities.error(), core::Error::Code::UNAVAILABLE);
    }
    return extract_realtime(event.value(), entities.value());
}

} // namespace features
} // namespace wccforest
