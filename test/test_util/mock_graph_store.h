#pragma once

#include <gmock/gmock.h>

#include "wccforest/storage/graph_store.h"

namespace wccforest {
namespace testutil {

class MockGraphStore : public storage::GraphStore {
public:
    MOCK_METHOD(core::Result<void>, put_event, (const core::Event&), (override));
    MOCK_METHOD(core::Result<void>, link_entity, (core::EventId, const core::Entity&), (override));
    MOCK_METHOD(core::Result<core::Event>, get_event, (core::EventId), (const, override));
    MOCK_METHOD(core::Result<std::vector<core::Event>>, get_events, (const std::vector<core::EventId>&), (const, override));
    MOCK_METHOD(core::Result<std::vector<core::EventId>>, list_events, (), (const, override));
    MOCK_METHOD(core::Result<std::vector<core::Entity>>, list_entities, (), (const, override));
    MOCK_METHOD(core::Result<std::vector<core::Event>>, events_in_range, (core::Timestamp, core::Timestamp), (const, override));
    MOCK_METHOD(core::Result<std::vector<core::Entity>>, entities_of, (core::EventId), (const, override));
    MOCK_METHOD(core::Result<std::vector<core::EventId>>, events_touching, (const core::Entity&), (const, override));
    MOCK_METHOD(core::Result<std::vector<storage::PrecedenceEdge>>, precedence_edges_of, (const core::Entity&), (const, override));
    MOCK_METHOD(core::Result<std::vector<core::EventId>>, precedence_predecessors, (core::EventId), (const, override));
    MOCK_METHOD(core::Result<std::vector<core::EventId>>, precedence_successors, (core::EventId), (const, override));
    MOCK_METHOD(core::Result<std::vector<core::EventId>>, forest_successors, (core::EventId), (const, override));
    MOCK_METHOD(core::Result<std::vector<core::EventId>>, forest_predecessors, (core::EventId), (const, override));
    MOCK_METHOD(core::Result<bool>, is_processed, (core::EventId), (const, override));
    MOCK_METHOD(core::Result<std::vector<core::EventId>>, unprocessed_events, (), (const, override));
    MOCK_METHOD(core::Result<std::optional<core::ComponentMetrics>>, get_metrics, (core::EventId), (const, override));
    MOCK_METHOD(core::Result<void>, commit, (const storage::WriteBatch&), (override));
    MOCK_METHOD(core::Result<void>, reset_derived_state, (), (override));
    MOCK_METHOD(storage::GraphStoreStats, stats, (), (const, override));
};

} // namespace testutil
} // namespace wccforest
