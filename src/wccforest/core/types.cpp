#include "wccforest/core/types.h"
#include <sstream>

namespace wccforest {
namespace core {

namespace {

struct EntityTypeName {
    EntityType type;
    const char* name;
};

constexpr EntityTypeName kEntityTypeNames[] = {
    {EntityType::CREDIT_CARD, "credit_card"},
    {EntityType::IP_ADDRESS, "ip"},
    {EntityType::EMAIL, "email"},
    {EntityType::PHONE, "phone"},
    {EntityType::DEVICE, "device"},
    {EntityType::SESSION, "session"},
    {EntityType::BANK_ACCOUNT, "bank_account"},
    {EntityType::OTHER, "other"},
};

} // namespace

const char* entity_type_name(EntityType type) {
    for (const auto& entry : kEntityTypeNames) {
        if (entry.type == type) {
            return entry.name;
        }
    }
    return "other";
}

std::optional<EntityType> parse_entity_type(const std::string& name) {
    for (const auto& entry : kEntityTypeNames) {
        if (name == entry.name) {
            return entry.type;
        }
    }
    return std::nullopt;
}

std::string Entity::to_string() const {
    return std::string(entity_type_name(type)) + ":" + key;
}

std::string FeatureRecord::to_string() const {
    std::ostringstream oss;
    oss << "{event_id=" << event_id << ", max_component_size=";
    if (max_component_size) oss << *max_component_size; else oss << "null";
    oss << ", max_component_diameter=";
    if (max_component_diameter) oss << *max_component_diameter; else oss << "null";
    oss << ", max_component_velocity=";
    if (max_component_velocity) oss << *max_component_velocity; else oss << "null";
    oss << ", distinct_component_count=" << distinct_component_count << "}";
    return oss.str();
}

} // namespace core
} // namespace wccforest
