#include "output/text_renderer.h"
#include <gtest/gtest.h>
#include <sstream>
#include <string>

class TextRendererTest : public ::testing::Test {
protected:
    std::string render(const PuzzleResult& puzzle, bool reveal) {
        std::ostringstream out;
        render_text(out, puzzle, reveal);
        return out.str();
    }

    bool contains(const std::string& text, const std::string& needle) {
        return text.find(needle) != std::string::npos;
    }
};

TEST_F(TextRendererTest, PuzzleModeHidesPlacements) {
    PuzzleResult puzzle = build_puzzle(Technique::LINEAR_PROBING, {10, 17, 24}, 7);
    std::string text = render(puzzle, false);

    EXPECT_TRUE(contains(text, "Linear Probing  (m = 7)"));
    EXPECT_TRUE(contains(text, "Keys: 10 17 24"));
    EXPECT_TRUE(contains(text, "h(10) = 10 mod 7 = ?"));
    EXPECT_TRUE(contains(text, "[ 3] -"));
    EXPECT_FALSE(contains(text, "=> slot"));
}

TEST_F(TextRendererTest, RevealShowsProbesAndTable) {
    PuzzleResult puzzle = build_puzzle(Technique::LINEAR_PROBING, {10, 17, 24}, 7);
    std::string text = render(puzzle, true);

    EXPECT_TRUE(contains(text, "=> slot 5 (probed 3 4 5)"));
    EXPECT_TRUE(contains(text, "[ 4] 17"));
    EXPECT_TRUE(contains(text, "Final table:"));
}

TEST_F(TextRendererTest, ChainsAreDrawnAsLists) {
    PuzzleResult puzzle = build_puzzle(Technique::CHAINING, {10, 17, 24, 5}, 7);
    std::string text = render(puzzle, true);

    EXPECT_TRUE(contains(text, "[ 3] -> 10 -> 17 -> 24 -> null"));
    EXPECT_TRUE(contains(text, "[ 5] -> 5 -> null"));
    EXPECT_TRUE(contains(text, "chain length 3"));
}

TEST_F(TextRendererTest, ErrorStepsAreReported) {
    PuzzleResult puzzle = build_puzzle(Technique::QUADRATIC_PROBING, {4, 8, 12}, 4);
    std::string text = render(puzzle, false);

    EXPECT_TRUE(contains(text, "ERROR: No slot found (quadratic probing exhausted)"));
}
