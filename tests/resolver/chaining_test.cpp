#include "resolver/chaining.h"
#include <gtest/gtest.h>
#include <vector>

TEST(ChainingTest, CollidingKeysShareBucketInOrder) {
    ChainResolution res = resolve_chaining({10, 17, 24, 5}, 7);

    ASSERT_EQ(res.table.size(), 7u);
    EXPECT_EQ(res.table[3], (std::vector<int>{10, 17, 24}));
    EXPECT_EQ(res.table[5], (std::vector<int>{5}));
    for (int i : {0, 1, 2, 4, 6}) {
        EXPECT_TRUE(res.table[i].empty()) << "bucket " << i;
    }

    ASSERT_EQ(res.steps.size(), 4u);
    EXPECT_EQ(res.steps[0].initial_hash, 3);
    EXPECT_EQ(res.steps[2].chain_length, 3);
    EXPECT_EQ(res.steps[3].final_index, 5);
    EXPECT_EQ(res.steps[3].chain_length, 1);
}

TEST(ChainingTest, FormulaIsSolved) {
    ChainResolution res = resolve_chaining({24}, 7);
    EXPECT_EQ(res.steps[0].formula, "24 % 7 = 3");
}

TEST(ChainingTest, NeverFailsAndKeepsEveryKey) {
    std::vector<int> keys;
    for (int k = 1; k <= 40; k++) keys.push_back(k * 7);   // every key hashes to 0
    ChainResolution res = resolve_chaining(keys, 7);

    size_t total = 0;
    for (const auto& bucket : res.table) total += bucket.size();
    EXPECT_EQ(total, keys.size());
    EXPECT_EQ(res.table[0], keys);
    for (const auto& step : res.steps) {
        EXPECT_TRUE(step.placed());
        EXPECT_TRUE(step.probe_sequence.empty());
    }
    EXPECT_EQ(res.steps.back().chain_length, 40);
}
