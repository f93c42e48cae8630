#include "random/random_source.h"
#include "../support/scripted_random_source.h"
#include <gtest/gtest.h>
#include <algorithm>
#include <stdexcept>
#include <vector>

TEST(RandomSourceTest, SameSeedSameSequence) {
    MersenneRandomSource a(1234);
    MersenneRandomSource b(1234);
    for (int i = 0; i < 50; i++) {
        EXPECT_EQ(a.uniform_int(1, 299), b.uniform_int(1, 299));
    }
}

TEST(RandomSourceTest, DrawsStayInsideInclusiveRange) {
    MersenneRandomSource rng(7);
    bool saw_lo = false;
    bool saw_hi = false;
    for (int i = 0; i < 2000; i++) {
        int v = rng.uniform_int(0, 6);
        ASSERT_GE(v, 0);
        ASSERT_LE(v, 6);
        saw_lo = saw_lo || v == 0;
        saw_hi = saw_hi || v == 6;
    }
    EXPECT_TRUE(saw_lo);
    EXPECT_TRUE(saw_hi);
}

TEST(RandomSourceTest, EmptyRangeThrows) {
    MersenneRandomSource rng(1);
    EXPECT_THROW(rng.uniform_int(5, 4), std::invalid_argument);
}

TEST(RandomSourceTest, ThreadInstanceIsStablePerThread) {
    RandomSource& first = RandomSource::thread_instance();
    RandomSource& second = RandomSource::thread_instance();
    EXPECT_EQ(&first, &second);
}

TEST(ShuffleKeysTest, WalksFromBackAndSwaps) {
    // i=3 -> j=0, i=2 -> j=2, i=1 -> j=0
    ScriptedRandomSource rng({0, 2, 0});
    std::vector<int> keys = {1, 2, 3, 4};
    shuffle_keys(keys, rng);

    EXPECT_EQ(keys, (std::vector<int>{2, 4, 3, 1}));
    ASSERT_EQ(rng.calls().size(), 3u);
    EXPECT_EQ(rng.calls()[0], std::make_pair(0, 3));
    EXPECT_EQ(rng.calls()[1], std::make_pair(0, 2));
    EXPECT_EQ(rng.calls()[2], std::make_pair(0, 1));
}

TEST(ShuffleKeysTest, ShortInputsDrawNothing) {
    ScriptedRandomSource rng;
    std::vector<int> empty;
    std::vector<int> single = {42};
    shuffle_keys(empty, rng);
    shuffle_keys(single, rng);
    EXPECT_TRUE(rng.calls().empty());
    EXPECT_EQ(single, std::vector<int>{42});
}

TEST(ShuffleKeysTest, KeepsTheSameElements) {
    MersenneRandomSource rng(99);
    std::vector<int> keys = {5, 12, 19, 26, 33, 40, 47};
    std::vector<int> shuffled = keys;
    shuffle_keys(shuffled, rng);
    std::sort(shuffled.begin(), shuffled.end());
    EXPECT_EQ(shuffled, keys);
}
