#ifndef WCCFOREST_STORAGE_ENTITY_INDEX_H_
#define WCCFOREST_STORAGE_ENTITY_INDEX_H_

#include <atomic>
#include <shared_mutex>
#include <vector>

#include <absl/container/flat_hash_map.h>

#include "wccforest/core/types.h"
#include "wccforest/core/result.h"

namespace wccforest {
namespace storage {

/**
 * @brief Lookup counters for the entity index
 */
struct EntityIndexMetrics {
    std::atomic<uint64_t> add_count{0};
    std::atomic<uint64_t> lookup_count{0};
    std::atomic<uint64_t> add_time_us{0};
    std::atomic<uint64_t> lookup_time_us{0};
    
    void reset() {
        add_count = 0;
        lookup_count = 0;
        add_time_us = 0;
        lookup_time_us = 0;
    }
};

/**
 * @brief Entity link index
 * 
 * Inverted index from each entity to the chronologically ordered list of
 * events that reference it, plus the forward index from an event to its
 * entities. Posting lists are kept sorted by (timestamp, id) on insert so a
 * lookup never sorts.
 */
class EntityIndex {
public:
    EntityIndex();
    ~EntityIndex();
    
    /**
     * @brief Record that an event touches an entity (idempotent)
     * @return true if a new touch edge was created
     */
    core::Result<bool> add_touch(core::EventId id, core::Timestamp timestamp, const core::Entity& entity);
    
    /**
     * @brief Events referencing an entity in (timestamp, id) order; empty for unknown entities
     */
    core::Result<std::vector<core::EventId>> events_touching(const core::Entity& entity) const;
    
    core::Result<std::vector<core::Entity>> entities_of(core::EventId id) const;
    
    std::vector<core::Entity> entities() const;
    
    size_t num_entities() const;
    size_t num_touches() const;
    
    EntityIndexMetrics& get_metrics() { return metrics_; }
    const EntityIndexMetrics& get_metrics() const { return metrics_; }

private:
    struct Posting {
        core::Timestamp timestamp;
        core::EventId id;
    };
    using PostingList = std::vector<Posting>;
    
    absl::flat_hash_map<core::Entity, PostingList> postings_;
    absl::flat_hash_map<core::EventId, std::vector<core::Entity>> event_entities_;
    size_t touch_count_ = 0;
    
    mutable std::shared_mutex mutex_;
    mutable EntityIndexMetrics metrics_;
};

} // namespace storage
} // namespace wccforest

#endif // WCCFOREST_STORAGE_ENTITY_INDEX_H_
