#include <gtest/gtest.h>
#include <stdexcept>
#include "track_registry.hpp"

TEST(TrackRegistry, CreateAssignsIncreasingIds) {
    TrackRegistry registry(6);
    int a = registry.create({0, 1}, 1);
    int b = registry.create({2, 3}, 1);
    EXPECT_EQ(a, 0);
    EXPECT_EQ(b, 1);

    const Track* track = registry.find(a);
    ASSERT_NE(track, nullptr);
    EXPECT_EQ(track->state, TrackState::Provisional);
    EXPECT_EQ(track->last_update_time, 1);
    EXPECT_EQ(track->hits, 0);
    EXPECT_EQ(registry.owner_of(1), a);
    EXPECT_EQ(registry.owner_of(4), TrackRegistry::kNoTrack);
    EXPECT_TRUE(registry.is_consumed(3));
    EXPECT_FALSE(registry.is_consumed(5));
}

TEST(TrackRegistry, AppendUpdatesLastUpdateTime) {
    TrackRegistry registry(3);
    int id = registry.create({0, 1}, 1);
    registry.append(id, 2, 3);

    const Track* track = registry.find(id);
    EXPECT_EQ(track->items, (std::vector<int>{0, 1, 2}));
    EXPECT_EQ(track->last_update_time, 3);
    EXPECT_EQ(track->hits, 1);
}

TEST(TrackRegistry, RejectsNonIncreasingAppend) {
    TrackRegistry registry(3);
    int id = registry.create({0, 1}, 4);
    EXPECT_THROW(registry.append(id, 2, 4), std::logic_error);
    EXPECT_FALSE(registry.is_consumed(2));
}

TEST(TrackRegistry, ItemBelongsToOneTrackOnly) {
    TrackRegistry registry(4);
    int a = registry.create({0, 1}, 1);
    int b = registry.create({2, 3}, 1);
    EXPECT_THROW(registry.append(b, 1, 2), std::logic_error);
    EXPECT_THROW(registry.create({1}, 2), std::logic_error);
    EXPECT_EQ(registry.find(a)->items.size(), 2u);
}

TEST(TrackRegistry, RemovedTrackKeepsItemsConsumed) {
    TrackRegistry registry(3);
    int id = registry.create({0, 1}, 1);
    registry.remove(id);

    EXPECT_EQ(registry.find(id), nullptr);
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_EQ(registry.owner_of(0), TrackRegistry::kNoTrack);
    EXPECT_TRUE(registry.is_consumed(0));
    EXPECT_THROW(registry.create({0, 2}, 2), std::logic_error);
    EXPECT_THROW(registry.remove(id), std::logic_error);
}

TEST(TrackRegistry, ExpiredTracksAreNotActive) {
    TrackRegistry registry(5);
    int a = registry.create({0, 1}, 1);
    int b = registry.create({2, 3}, 1);
    registry.set_state(a, TrackState::Expired);

    EXPECT_EQ(registry.active_ids(), (std::vector<int>{b}));
    EXPECT_THROW(registry.append(a, 4, 2), std::logic_error);
    EXPECT_EQ(registry.tracks().size(), 2u);
}
