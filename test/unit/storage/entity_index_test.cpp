#include <gtest/gtest.h>
#include "wccforest/storage/entity_index.h"

#include <algorithm>
#include <thread>
#include <vector>

namespace wccforest {
namespace storage {
namespace {

const core::Entity kCard(core::EntityType::CREDIT_CARD, "4111");
const core::Entity kIp(core::EntityType::IP_ADDRESS, "10.0.0.1");

TEST(EntityIndexTest, PostingListIsChronological) {
    EntityIndex index;
    ASSERT_TRUE(index.add_touch(3, 3000, kCard).ok());
    ASSERT_TRUE(index.add_touch(1, 1000, kCard).ok());
    ASSERT_TRUE(index.add_touch(2, 2000, kCard).ok());
    
    auto events = index.events_touching(kCard);
    ASSERT_TRUE(events.ok());
    EXPECT_EQ(events.value(), (std::vector<core::EventId>{1, 2, 3}));
}

TEST(EntityIndexTest, EqualTimestampsOrderById) {
    EntityIndex index;
    ASSERT_TRUE(index.add_touch(9, 1000, kCard).ok());
    ASSERT_TRUE(index.add_touch(4, 1000, kCard).ok());
    
    auto events = index.events_touching(kCard);
    ASSERT_TRUE(events.ok());
    EXPECT_EQ(events.value(), (std::vector<core::EventId>{4, 9}));
}

TEST(EntityIndexTest, AddTouchIsIdempotent) {
    EntityIndex index;
    auto first = index.add_touch(1, 1000, kCard);
    auto second = index.add_touch(1, 1000, kCard);
    ASSERT_TRUE(first.ok());
    ASSERT_TRUE(second.ok());
    EXPECT_TRUE(first.value());
    EXPECT_FALSE(second.value());
    EXPECT_EQ(index.num_touches(), 1u);
}

TEST(EntityIndexTest, ForwardMapping) {
    EntityIndex index;
    ASSERT_TRUE(index.add_touch(1, 1000, kCard).ok());
    ASSERT_TRUE(index.add_touch(1, 1000, kIp).ok());
    
    auto entities = index.entities_of(1);
    ASSERT_TRUE(entities.ok());
    EXPECT_EQ(entities.value().size(), 2u);
    EXPECT_EQ(index.num_entities(), 2u);
    
    auto none = index.entities_of(42);
    ASSERT_TRUE(none.ok());
    EXPECT_TRUE(none.value().empty());
}

TEST(EntityIndexTest, UnknownEntityIsEmpty) {
    EntityIndex index;
    auto events = index.events_touching(core::Entity(core::EntityType::EMAIL, "nobody@example.com"));
    ASSERT_TRUE(events.ok());
    EXPECT_TRUE(events.value().empty());
}

TEST(EntityIndexTest, ConcurrentAddsKeepOrder) {
    EntityIndex index;
    const int per_thread = 200;
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&index, t]() {
            for (int i = 0; i < per_thread; ++i) {
                core::EventId id = static_cast<core::EventId>(t * per_thread + i);
                index.add_touch(id, static_cast<core::Timestamp>(id) * 10, kCard);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    
    auto events = index.events_touching(kCard);
    ASSERT_TRUE(events.ok());
    ASSERT_EQ(events.value().size(), 4u * per_thread);
    EXPECT_TRUE(std::is_sorted(events.value().begin(), events.value().end()));
    EXPECT_GT(index.get_metrics().add_count.load(), 0u);
}

} // namespace
} // namespace storage
} // namespace wccforest
