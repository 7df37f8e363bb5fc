#include <gtest/gtest.h>
#include <minirel/storage/clock_replacer.hpp>
#include <minirel/storage/lru_replacer.hpp>

using namespace minirel;

namespace {

void load(Replacer& replacer, size_t frame_id) {
    replacer.record_access(frame_id);
    replacer.set_evictable(frame_id, true);
}

}  // namespace

TEST(LRUReplacerTest, EvictsLeastRecentlyAccessed) {
    LRUReplacer replacer(4);
    load(replacer, 0);
    load(replacer, 1);
    load(replacer, 2);
    EXPECT_EQ(replacer.size(), 3u);

    replacer.record_access(0);

    EXPECT_EQ(replacer.victim(), std::optional<size_t>(1));
    EXPECT_EQ(replacer.victim(), std::optional<size_t>(2));
    EXPECT_EQ(replacer.victim(), std::optional<size_t>(0));
    EXPECT_EQ(replacer.victim(), std::nullopt);
    EXPECT_TRUE(replacer.empty());
}

TEST(LRUReplacerTest, PinnedFramesAreSkipped) {
    LRUReplacer replacer(4);
    load(replacer, 0);
    load(replacer, 1);

    replacer.set_evictable(0, false);
    EXPECT_FALSE(replacer.contains(0));
    EXPECT_TRUE(replacer.contains(1));

    EXPECT_EQ(replacer.victim(), std::optional<size_t>(1));
    EXPECT_EQ(replacer.victim(), std::nullopt);

    // Unpinned again, ranked by its original access
    replacer.set_evictable(0, true);
    EXPECT_EQ(replacer.victim(), std::optional<size_t>(0));
}

TEST(LRUReplacerTest, RemoveStopsTracking) {
    LRUReplacer replacer(2);
    load(replacer, 0);
    load(replacer, 1);

    replacer.remove(0);
    EXPECT_EQ(replacer.size(), 1u);
    EXPECT_EQ(replacer.victim(), std::optional<size_t>(1));
    EXPECT_TRUE(replacer.empty());
}

TEST(LRUReplacerTest, NewFramesStartPinned) {
    LRUReplacer replacer(2);
    replacer.record_access(0);
    EXPECT_EQ(replacer.size(), 0u);
    EXPECT_EQ(replacer.victim(), std::nullopt);
}

TEST(ClockReplacerTest, SweepClearsReferenceBitsFirst) {
    ClockReplacer replacer(3);
    load(replacer, 0);
    load(replacer, 1);
    load(replacer, 2);

    // Every bit is set: one turn clears them, the second picks frame 0
    EXPECT_EQ(replacer.victim(), std::optional<size_t>(0));
    EXPECT_EQ(replacer.hand(), 1u);

    // Frame 0 reloaded; frame 1 already lost its bit
    load(replacer, 0);
    EXPECT_EQ(replacer.victim(), std::optional<size_t>(1));
    EXPECT_EQ(replacer.hand(), 2u);

    // Frame 2 touched again; the hand passes 2 and 0 clearing bits, then wraps to 2
    replacer.record_access(2);
    EXPECT_EQ(replacer.victim(), std::optional<size_t>(2));
    EXPECT_EQ(replacer.hand(), 0u);
}

TEST(ClockReplacerTest, PinnedFramesAreSkipped) {
    ClockReplacer replacer(3);
    load(replacer, 0);
    load(replacer, 1);
    load(replacer, 2);
    replacer.set_evictable(0, false);
    replacer.set_evictable(1, false);

    EXPECT_EQ(replacer.size(), 1u);
    EXPECT_EQ(replacer.victim(), std::optional<size_t>(2));
    EXPECT_EQ(replacer.victim(), std::nullopt);
}

TEST(ClockReplacerTest, SameSequenceSameVictims) {
    ClockReplacer a(4);
    ClockReplacer b(4);
    for (size_t frame : {0, 1, 2, 3, 1, 3}) {
        load(a, frame);
        load(b, frame);
    }

    for (int i = 0; i < 4; ++i) {
        EXPECT_EQ(a.victim(), b.victim());
    }
}

TEST(ReplacerFactoryTest, BuildsRequestedPolicy) {
    auto lru = make_replacer(EvictionPolicy::LRU, 4);
    auto clock = make_replacer(EvictionPolicy::CLOCK, 4);

    EXPECT_NE(dynamic_cast<LRUReplacer*>(lru.get()), nullptr);
    EXPECT_NE(dynamic_cast<ClockReplacer*>(clock.get()), nullptr);
}
