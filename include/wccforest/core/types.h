#ifndef WCCFOREST_CORE_TYPES_H_
#define WCCFOREST_CORE_TYPES_H_

#include <cstdint>
#include <string>
#include <vector>
#include <optional>
#include <utility>

namespace wccforest {
namespace core {

/**
 * @brief Represents a unique identifier for an event
 */
using EventId = uint64_t;

/**
 * @brief Represents a timestamp in milliseconds since Unix epoch
 */
using Timestamp = int64_t;

/**
 * @brief Represents a duration in milliseconds
 */
using Duration = int64_t;

/**
 * @brief Kinds of identifying entities an event can touch
 */
enum class EntityType : uint8_t {
    CREDIT_CARD,
    IP_ADDRESS,
    EMAIL,
    PHONE,
    DEVICE,
    SESSION,
    BANK_ACCOUNT,
    OTHER
};

const char* entity_type_name(EntityType type);
std::optional<EntityType> parse_entity_type(const std::string& name);

/**
 * @brief An identifying entity, keyed by its type and natural value
 */
struct Entity {
    EntityType type = EntityType::OTHER;
    std::string key;

    Entity() = default;
    Entity(EntityType t, std::string k) : type(t), key(std::move(k)) {}

    bool operator==(const Entity& other) const { return type == other.type && key == other.key; }
    bool operator!=(const Entity& other) const { return !(*this == other); }
    bool operator<(const Entity& other) const {
        if (type != other.type) return type < other.type;
        return key < other.key;
    }

    std::string to_string() const;

    template <typename H>
    friend H AbslHashValue(H h, const Entity& entity) {
        return H::combine(std::move(h), static_cast<uint8_t>(entity.type), entity.key);
    }
};

/**
 * @brief Immutable ingested event
 */
struct Event {
    EventId id = 0;
    Timestamp timestamp = 0;
    std::string interaction_type;
    std::optional<double> amount;

    Event() = default;
    Event(EventId i, Timestamp ts, std::string type = {}, std::optional<double> amt = std::nullopt)
        : id(i), timestamp(ts), interaction_type(std::move(type)), amount(amt) {}

    bool operator==(const Event& other) const {
        return id == other.id && timestamp == other.timestamp &&
               interaction_type == other.interaction_type && amount == other.amount;
    }
    bool operator!=(const Event& other) const { return !(*this == other); }
};

/**
 * @brief Chronological order with id as tie-breaker
 */
inline bool chronologically_before(Timestamp ts_a, EventId id_a, Timestamp ts_b, EventId id_b) {
    return ts_a != ts_b ? ts_a < ts_b : id_a < id_b;
}

inline bool chronologically_before(const Event& a, const Event& b) {
    return chronologically_before(a.timestamp, a.id, b.timestamp, b.id);
}

/**
 * @brief Snapshot of a component as it existed at one event
 */
struct ComponentMetrics {
    uint64_t size = 0;
    std::optional<int64_t> diameter;  // Absent when the projection has no edges
    double velocity = 0.0;            // Joined events per second

    bool operator==(const ComponentMetrics& other) const {
        return size == other.size && diameter == other.diameter && velocity == other.velocity;
    }
    bool operator!=(const ComponentMetrics& other) const { return !(*this == other); }
};

/**
 * @brief Flat feature record consumed downstream; same schema for training and scoring
 */
struct FeatureRecord {
    EventId event_id = 0;
    std::optional<uint64_t> max_component_size;
    std::optional<int64_t> max_component_diameter;
    std::optional<double> max_component_velocity;
    uint64_t distinct_component_count = 0;

    bool operator==(const FeatureRecord& other) const {
        return event_id == other.event_id &&
               max_component_size == other.max_component_size &&
               max_component_diameter == other.max_component_diameter &&
               max_component_velocity == other.max_component_velocity &&
               distinct_component_count == other.distinct_component_count;
    }
    bool operator!=(const FeatureRecord& other) const { return !(*this == other); }

    std::string to_string() const;
};

} // namespace core
} // namespace wccforest

#endif // WCCFOREST_CORE_TYPES_H_
