#include "wccforest/storage/entity_index.h"
#include <algorithm>
#include <chrono>
#include <mutex>

namespace wccforest {
namespace storage {

EntityIndex::EntityIndex() {
    metrics_.reset();
}

EntityIndex::~EntityIndex() = default;

core::Result<bool> EntityIndex::add_touch(core::EventId id, core::Timestamp timestamp, const core::Entity& entity) {
    auto start = std::chrono::high_resolution_clock::now();
    
    std::unique_lock<std::shared_mutex> lock(mutex_);
    
    auto& posting_list = postings_[entity];
    
    // Binary search for the insertion point to keep (timestamp, id) order
    auto insert_pos = std::lower_bound(posting_list.begin(), posting_list.end(), timestamp,
        [id](const Posting& p, core::Timestamp ts) {
            return core::chronologically_before(p.timestamp, p.id, ts, id);
        });
    
    bool inserted = false;
    if (insert_pos == posting_list.end() || insert_pos->id != id || insert_pos->timestamp != timestamp) {
        posting_list.insert(insert_pos, Posting{timestamp, id});
        event_entities_[id].push_back(entity);
        ++touch_count_;
        inserted = true;
    }
    
    auto end = std::chrono::high_resolution_clock::now();
    auto duration_us = std::chrono::duration_cast<std::chrono::microseconds>(end - start).count();
    metrics_.add_count.fetch_add(1, std::memory_order_relaxed);
    metrics_.add_time_us.fetch_add(duration_us, std::memory_order_relaxed);
    
    return core::Result<bool>(inserted);
}

core::Result<std::vector<core::EventId>> EntityIndex::events_touching(const core::Entity& entity) const {
    auto start = std::chrono::high_resolution_clock::now();
    
    std::vector<core::EventId> result;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = postings_.find(entity);
        if (it != postings_.end()) {
            result.reserve(it->second.size());
            for (const auto& posting : it->second) {
                result.push_back(posting.id);
            }
        }
    }
    
    auto end = std::chrono::high_resolution_clock::now();
    auto duration_us = std::chrono::duration_cast<std::chrono::microseconds>(end - start).count();
    metrics_.lookup_count.fetch_add(1, std::memory_order_relaxed);
    metrics_.lookup_time_us.fetch_add(duration_us, std::memory_order_relaxed);
    
    return core::Result<std::vector<core::EventId>>(std::move(result));
}

core::Result<std::vector<core::Entity>> EntityIndex::entities_of(core::EventId id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    metrics_.lookup_count.fetch_add(1, std::memory_order_relaxed);
    auto it = event_entities_.find(id);
    if (it == event_entities_.end()) {
        return core::Result<std::vector<core::Entity>>(std::vector<core::Entity>{});
    }
    return core::Result<std::vector<core::Entity>>(it->second);
}

std::vector<core::Entity> EntityIndex::entities() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<core::Entity> result;
    result.reserve(postings_.size());
    for (const auto& [entity, postings] : postings_) {
        result.push_back(entity);
    }
    std::sort(result.begin(), result.end());
    return result;
}

size_t EntityIndex::num_entities() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return postings_.size();
}

size_t EntityIndex::num_touches() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return touch_count_;
}

} // namespace storage
} // namespace wccforest
