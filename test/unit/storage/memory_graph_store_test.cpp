#include <gtest/gtest.h>
#include "wccforest/storage/memory_graph_store.h"

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

namespace wccforest {
namespace storage {
namespace {

class MemoryGraphStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_unique<MemoryGraphStore>();
        for (core::EventId id = 1; id <= 4; ++id) {
            ASSERT_TRUE(store_->put_event(core::Event(id, 1000 * static_cast<core::Timestamp>(id), "txn")).ok());
            ASSERT_TRUE(store_->link_entity(id, card_).ok());
        }
    }
    
    std::unique_ptr<MemoryGraphStore> store_;
    core::Entity card_{core::EntityType::CREDIT_CARD, "4111"};
};

TEST_F(MemoryGraphStoreTest, PutEventIsIdempotentForIdenticalPayload) {
    EXPECT_TRUE(store_->put_event(core::Event(1, 1000, "txn")).ok());
    
    auto conflicting = store_->put_event(core::Event(1, 1000, "refund"));
    EXPECT_FALSE(conflicting.ok());
    EXPECT_EQ(conflicting.error_code(), core::Error::Code::ALREADY_EXISTS);
    EXPECT_EQ(store_->stats().events, 4u);
}

TEST_F(MemoryGraphStoreTest, LinkEntityRequiresEvent) {
    auto result = store_->link_entity(99, card_);
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.error_code(), core::Error::Code::NOT_FOUND);
    
    EXPECT_TRUE(store_->link_entity(1, card_).ok());
    EXPECT_EQ(store_->stats().touch_edges, 4u);
}

TEST_F(MemoryGraphStoreTest, RangeScanIsInclusiveAndOrdered) {
    auto events = store_->events_in_range(2000, 3000);
    ASSERT_TRUE(events.ok());
    ASSERT_EQ(events.value().size(), 2u);
    EXPECT_EQ(events.value()[0].id, 2u);
    EXPECT_EQ(events.value()[1].id, 3u);
    
    auto empty = store_->events_in_range(3000, 2000);
    ASSERT_TRUE(empty.ok());
    EXPECT_TRUE(empty.value().empty());
}

TEST_F(MemoryGraphStoreTest, CommitAppliesAllWrites) {
    WriteBatch batch;
    batch.precedence_additions.push_back(PrecedenceEdge{1, 2, card_});
    batch.forest_edges.push_back(ForestEdge{1, 2});
    batch.processed = {1, 2};
    batch.metrics.emplace_back(2, core::ComponentMetrics{2, 1, 1.0});
    ASSERT_TRUE(store_->commit(batch).ok());
    
    EXPECT_EQ(store_->precedence_successors(1).value(), (std::vector<core::EventId>{2}));
    EXPECT_EQ(store_->precedence_predecessors(2).value(), (std::vector<core::EventId>{1}));
    EXPECT_EQ(store_->forest_successors(1).value(), (std::vector<core::EventId>{2}));
    EXPECT_EQ(store_->forest_predecessors(2).value(), (std::vector<core::EventId>{1}));
    EXPECT_TRUE(store_->is_processed(2).value());
    EXPECT_FALSE(store_->is_processed(3).value());
    ASSERT_TRUE(store_->get_metrics(2).value().has_value());
    EXPECT_EQ(store_->get_metrics(2).value()->size, 2u);
    EXPECT_EQ(store_->unprocessed_events().value(), (std::vector<core::EventId>{3, 4}));
}

TEST_F(MemoryGraphStoreTest, FailedPreconditionAppliesNothing) {
    WriteBatch first;
    first.processed = {1};
    ASSERT_TRUE(store_->commit(first).ok());
    
    WriteBatch batch;
    batch.processed = {1, 2};
    batch.forest_edges.push_back(ForestEdge{1, 2});
    batch.expect_unprocessed = {1, 2};
    auto result = store_->commit(batch);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error_code(), core::Error::Code::CONFLICT);
    
    EXPECT_FALSE(store_->is_processed(2).value());
    EXPECT_TRUE(store_->forest_successors(1).value().empty());
}

TEST_F(MemoryGraphStoreTest, ExpectTerminalDetectsAbsorbedHead) {
    WriteBatch merge;
    merge.processed = {1, 2};
    merge.forest_edges.push_back(ForestEdge{1, 2});
    ASSERT_TRUE(store_->commit(merge).ok());
    
    WriteBatch stale;
    stale.processed = {3};
    stale.forest_edges.push_back(ForestEdge{1, 3});
    stale.expect_processed = {1};
    stale.expect_terminal = {1};
    auto result = store_->commit(stale);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error_code(), core::Error::Code::CONFLICT);
    EXPECT_FALSE(store_->is_processed(3).value());
}

TEST_F(MemoryGraphStoreTest, CommitRejectsUnknownEvents) {
    WriteBatch batch;
    batch.forest_edges.push_back(ForestEdge{1, 77});
    auto result = store_->commit(batch);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error_code(), core::Error::Code::NOT_FOUND);
}

TEST_F(MemoryGraphStoreTest, PrecedenceRemovalAndAddition) {
    WriteBatch chain;
    chain.precedence_additions = {PrecedenceEdge{1, 3, card_}};
    ASSERT_TRUE(store_->commit(chain).ok());
    
    WriteBatch relink;
    relink.precedence_removals = {PrecedenceEdge{1, 3, card_}};
    relink.precedence_additions = {PrecedenceEdge{1, 2, card_}, PrecedenceEdge{2, 3, card_}};
    ASSERT_TRUE(store_->commit(relink).ok());
    
    auto edges = store_->precedence_edges_of(card_);
    ASSERT_TRUE(edges.ok());
    EXPECT_EQ(edges.value().size(), 2u);
    EXPECT_TRUE(store_->precedence_predecessors(3).value() == std::vector<core::EventId>{2});
    EXPECT_EQ(store_->stats().precedence_edges, 2u);
}

TEST_F(MemoryGraphStoreTest, ResetKeepsEventsAndTouches) {
    WriteBatch batch;
    batch.precedence_additions.push_back(PrecedenceEdge{1, 2, card_});
    batch.forest_edges.push_back(ForestEdge{1, 2});
    batch.processed = {1, 2};
    batch.metrics.emplace_back(2, core::ComponentMetrics{});
    ASSERT_TRUE(store_->commit(batch).ok());
    
    ASSERT_TRUE(store_->reset_derived_state().ok());
    auto stats = store_->stats();
    EXPECT_EQ(stats.events, 4u);
    EXPECT_EQ(stats.touch_edges, 4u);
    EXPECT_EQ(stats.precedence_edges, 0u);
    EXPECT_EQ(stats.forest_edges, 0u);
    EXPECT_EQ(stats.processed_events, 0u);
    EXPECT_EQ(stats.events_with_metrics, 0u);
    EXPECT_EQ(store_->events_touching(card_).value().size(), 4u);
}

TEST_F(MemoryGraphStoreTest, ConcurrentConflictingCommitsHaveOneWinner) {
    WriteBatch head;
    head.processed = {1};
    ASSERT_TRUE(store_->commit(head).ok());
    
    std::atomic<int> winners{0};
    std::vector<std::thread> threads;
    for (core::EventId id : {2, 3, 4}) {
        threads.emplace_back([this, id, &winners]() {
            WriteBatch batch;
            batch.processed = {id};
            batch.forest_edges.push_back(ForestEdge{1, id});
            batch.expect_unprocessed = {id};
            batch.expect_processed = {1};
            batch.expect_terminal = {1};
            if (store_->commit(batch).ok()) {
                winners.fetch_add(1);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(winners.load(), 1);
    EXPECT_EQ(store_->forest_successors(1).value().size(), 1u);
}

} // namespace
} // namespace storage
} // namespace wccforest
