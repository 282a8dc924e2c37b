#include <gtest/gtest.h>
#include "wccforest/forest/forest_validator.h"
#include "wccforest/forest/chain_builder.h"
#include "wccforest/forest/union_find_forest.h"
#include "wccforest/storage/memory_graph_store.h"
#include "test_util/graph_fixtures.h"

namespace wccforest {
namespace forest {
namespace {

using testutil::AddEvent;
using testutil::Card;
using testutil::Ip;
using testutil::LinkAndMerge;

class ForestValidatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<storage::MemoryGraphStore>();
        AddEvent(*store_, 1, 1, {Card("a")});
        AddEvent(*store_, 2, 2, {Card("a"), Ip("x")});
        AddEvent(*store_, 3, 3, {Ip("x")});
        AddEvent(*store_, 4, 4, {Card("b")});
    }
    
    std::shared_ptr<storage::MemoryGraphStore> store_;
};

TEST_F(ForestValidatorTest, HealthyGraphPasses) {
    LinkAndMerge(store_);
    ForestValidator validator(store_);
    
    auto chains = validator.validate_all_chains();
    ASSERT_TRUE(chains.ok()) << chains.error();
    EXPECT_EQ(chains.value().entities_checked, 3u);
    
    auto forest = validator.validate_forest();
    ASSERT_TRUE(forest.ok()) << forest.error();
    EXPECT_EQ(forest.value().forest_edges_checked, 2u);
    EXPECT_EQ(forest.value().trees, 2u);
    
    auto components = validator.validate_components();
    ASSERT_TRUE(components.ok()) << components.error();
    EXPECT_EQ(components.value().precedence_edges_checked, 2u);
}

TEST_F(ForestValidatorTest, UnlinkedEntityFailsChainCheck) {
    ForestValidator validator(store_);
    auto chains = validator.validate_chains({Card("a")});
    ASSERT_FALSE(chains.ok());
    EXPECT_EQ(chains.error_code(), core::Error::Code::STRUCTURAL_VIOLATION);
    EXPECT_NE(chains.error().find("credit_card:a"), std::string::npos);
    
    // Single-event entities need no edges
    EXPECT_TRUE(validator.validate_chains({Card("b")}).ok());
}

TEST_F(ForestValidatorTest, SkippingEdgeFailsChainCheck) {
    LinkAndMerge(store_);
    storage::WriteBatch shortcut;
    shortcut.precedence_additions = {storage::PrecedenceEdge{1, 3, Ip("x")}};
    ASSERT_TRUE(store_->commit(shortcut).ok());
    
    ForestValidator validator(store_);
    EXPECT_TRUE(validator.validate_chains({Card("a")}).ok());
    auto chains = validator.validate_chains({Ip("x")});
    ASSERT_FALSE(chains.ok());
    EXPECT_EQ(chains.error_code(), core::Error::Code::STRUCTURAL_VIOLATION);
}

TEST_F(ForestValidatorTest, TwoOutgoingEdgesFail) {
    storage::WriteBatch corrupt;
    corrupt.processed = {1, 2, 3};
    corrupt.forest_edges = {storage::ForestEdge{1, 2}, storage::ForestEdge{1, 3}};
    ASSERT_TRUE(store_->commit(corrupt).ok());
    
    ForestValidator validator(store_);
    auto forest = validator.validate_forest();
    ASSERT_FALSE(forest.ok());
    EXPECT_EQ(forest.error_code(), core::Error::Code::STRUCTURAL_VIOLATION);
}

TEST_F(ForestValidatorTest, UnprocessedEndpointFails) {
    storage::WriteBatch corrupt;
    corrupt.processed = {1};
    corrupt.forest_edges = {storage::ForestEdge{1, 2}};
    ASSERT_TRUE(store_->commit(corrupt).ok());
    
    ForestValidator validator(store_);
    auto forest = validator.validate_forest();
    ASSERT_FALSE(forest.ok());
    EXPECT_NE(forest.error().find("unprocessed event 2"), std::string::npos);
}

TEST_F(ForestValidatorTest, CycleFails) {
    storage::WriteBatch corrupt;
    corrupt.processed = {1, 2, 3};
    corrupt.forest_edges = {storage::ForestEdge{1, 2}, storage::ForestEdge{2, 3}, storage::ForestEdge{3, 1}};
    ASSERT_TRUE(store_->commit(corrupt).ok());
    
    ForestValidator validator(store_);
    auto forest = validator.validate_forest();
    ASSERT_FALSE(forest.ok());
    EXPECT_NE(forest.error().find("cycle"), std::string::npos);
}

TEST_F(ForestValidatorTest, PendingEdgesAreNotChecked) {
    ChainBuilder builder(store_);
    ASSERT_TRUE(builder.link_all().ok());
    
    ForestValidator validator(store_);
    auto components = validator.validate_components();
    ASSERT_TRUE(components.ok()) << components.error();
    EXPECT_EQ(components.value().precedence_edges_checked, 0u);
}

TEST_F(ForestValidatorTest, EdgeAcrossTreesFails) {
    // Merged before any chain existed: every event is its own tree
    ASSERT_TRUE(TemporalForest::merge_group(store_, {1, 2, 3, 4}).ok());
    ChainBuilder builder(store_);
    ASSERT_TRUE(builder.link_all().ok());
    
    ForestValidator validator(store_);
    EXPECT_TRUE(validator.validate_forest().ok());
    EXPECT_TRUE(validator.validate_all_chains().ok());
    auto components = validator.validate_components();
    ASSERT_FALSE(components.ok());
    EXPECT_EQ(components.error_code(), core::Error::Code::STRUCTURAL_VIOLATION);
    EXPECT_NE(components.error().find("joins trees"), std::string::npos);
}

} // namespace
} // namespace forest
} // namespace wccforest
