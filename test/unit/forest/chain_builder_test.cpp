#include <gtest/gtest.h>
#include "wccforest/forest/chain_builder.h"
#include "wccforest/storage/memory_graph_store.h"
#include "test_util/graph_fixtures.h"

#include <algorithm>
#include <random>

namespace wccforest {
namespace forest {
namespace {

using testutil::AddEvent;
using testutil::Card;
using testutil::Ip;

std::vector<std::pair<core::EventId, core::EventId>> Edges(const storage::GraphStore& store,
                                                           const core::Entity& entity) {
    std::vector<std::pair<core::EventId, core::EventId>> edges;
    auto result = store.precedence_edges_of(entity);
    EXPECT_TRUE(result.ok());
    for (const auto& edge : result.value()) {
        edges.emplace_back(edge.from, edge.to);
    }
    std::sort(edges.begin(), edges.end());
    return edges;
}

class ChainBuilderTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<storage::MemoryGraphStore>();
    }
    
    std::shared_ptr<storage::MemoryGraphStore> store_;
};

TEST_F(ChainBuilderTest, LinksConsecutiveEventsOnly) {
    AddEvent(*store_, 1, 10, {Card("c")});
    AddEvent(*store_, 2, 20, {Card("c")});
    AddEvent(*store_, 3, 30, {Card("c")});
    AddEvent(*store_, 4, 40, {Card("c")});
    
    ChainBuilder builder(store_);
    auto stats = builder.link_all();
    ASSERT_TRUE(stats.ok()) << stats.error();
    EXPECT_EQ(stats.value().edges_added, 3u);
    EXPECT_EQ(stats.value().edges_removed, 0u);
    EXPECT_EQ(Edges(*store_, Card("c")),
              (std::vector<std::pair<core::EventId, core::EventId>>{{1, 2}, {2, 3}, {3, 4}}));
}

TEST_F(ChainBuilderTest, SingleEventHasNoSelfLoop) {
    AddEvent(*store_, 1, 10, {Card("lonely")});
    ChainBuilder builder(store_);
    auto stats = builder.link_all();
    ASSERT_TRUE(stats.ok());
    EXPECT_EQ(stats.value().edges_added, 0u);
    EXPECT_TRUE(Edges(*store_, Card("lonely")).empty());
}

TEST_F(ChainBuilderTest, RerunIsIdempotent) {
    AddEvent(*store_, 1, 10, {Card("c"), Ip("i")});
    AddEvent(*store_, 2, 20, {Card("c"), Ip("i")});
    ChainBuilder builder(store_);
    ASSERT_TRUE(builder.link_all().ok());
    auto before = store_->stats();
    
    auto again = builder.link_all();
    ASSERT_TRUE(again.ok());
    EXPECT_EQ(again.value().edges_added, 0u);
    EXPECT_EQ(again.value().edges_removed, 0u);
    EXPECT_EQ(store_->stats().precedence_edges, before.precedence_edges);
    EXPECT_EQ(before.precedence_edges, 2u);   // One per entity
}

TEST_F(ChainBuilderTest, EqualTimestampsBreakTiesById) {
    AddEvent(*store_, 9, 10, {Card("c")});
    AddEvent(*store_, 3, 10, {Card("c")});
    ChainBuilder builder(store_);
    ASSERT_TRUE(builder.link_all().ok());
    EXPECT_EQ(Edges(*store_, Card("c")),
              (std::vector<std::pair<core::EventId, core::EventId>>{{3, 9}}));
}

TEST_F(ChainBuilderTest, LateArrivalReplacesSplitEdge) {
    AddEvent(*store_, 1, 10, {Card("c")});
    AddEvent(*store_, 3, 30, {Card("c")});
    ChainBuilder builder(store_);
    ASSERT_TRUE(builder.link_all().ok());
    
    AddEvent(*store_, 2, 20, {Card("c")});
    auto stats = builder.link_entities({Card("c")});
    ASSERT_TRUE(stats.ok());
    EXPECT_EQ(stats.value().edges_removed, 1u);
    EXPECT_EQ(stats.value().edges_added, 2u);
    EXPECT_EQ(Edges(*store_, Card("c")),
              (std::vector<std::pair<core::EventId, core::EventId>>{{1, 2}, {2, 3}}));
}

TEST_F(ChainBuilderTest, AnyInsertionOrderYieldsOnePath) {
    std::vector<core::EventId> ids(30);
    for (size_t i = 0; i < ids.size(); ++i) {
        ids[i] = i + 1;
    }
    std::mt19937 rng(7);
    std::shuffle(ids.begin(), ids.end(), rng);
    
    core::ChainBuilderConfig config;
    config.entities_per_batch = 1;
    ChainBuilder builder(store_, config);
    for (core::EventId id : ids) {
        AddEvent(*store_, id, static_cast<int64_t>(id) * 5, {Card("c")});
        ASSERT_TRUE(builder.link_entities({Card("c")}).ok());
    }
    
    auto edges = Edges(*store_, Card("c"));
    ASSERT_EQ(edges.size(), ids.size() - 1);
    for (size_t i = 0; i < edges.size(); ++i) {
        EXPECT_EQ(edges[i].first, i + 1);
        EXPECT_EQ(edges[i].second, i + 2);
    }
}

TEST_F(ChainBuilderTest, CommitsInChunks) {
    for (core::EventId id = 1; id <= 6; ++id) {
        AddEvent(*store_, id, static_cast<int64_t>(id), {Card("c" + std::to_string(id % 3))});
    }
    core::ChainBuilderConfig config;
    config.entities_per_batch = 2;
    ChainBuilder builder(store_, config);
    auto stats = builder.link_all();
    ASSERT_TRUE(stats.ok());
    EXPECT_EQ(stats.value().entities_scanned, 3u);
    EXPECT_EQ(stats.value().edges_added, 3u);
}

} // namespace
} // namespace forest
} // namespace wccforest
