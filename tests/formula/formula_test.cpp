#include "formula/formula.h"
#include <gtest/gtest.h>
#include <stdexcept>

class FormulaTest : public ::testing::Test {
protected:
    StepRecord makeStep(int key, int initial_hash, int collisions) {
        StepRecord step;
        step.key = key;
        step.initial_hash = initial_hash;
        step.collisions = collisions;
        return step;
    }
};

TEST_F(FormulaTest, LinearHidesHashWhenPlacedAtHome) {
    EXPECT_EQ(linear_probing_formula(makeStep(45, 1, 0), 11), "h(45) = 45 mod 11 = ?");
}

TEST_F(FormulaTest, LinearStatesHashAndProbeRange) {
    EXPECT_EQ(linear_probing_formula(makeStep(24, 3, 2), 7),
              "h(24) = 24 mod 7 = 3 → collision(s), probe i=1..2");
}

TEST_F(FormulaTest, QuadraticSingleProbe) {
    EXPECT_EQ(quadratic_probing_formula(makeStep(9, 2, 0), 7), "h(9) = 9 mod 7 = ?");
}

TEST_F(FormulaTest, QuadraticEnumeratesProbes) {
    EXPECT_EQ(quadratic_probing_formula(makeStep(13, 2, 1), 11),
              "i=0: (2 + 0²) mod 11 = ? | i=1: (2 + 1²) mod 11 = ?");
}

TEST_F(FormulaTest, DoubleHashingNeedsSecondaryHash) {
    EXPECT_THROW(double_hashing_formula(makeStep(10, 3, 0), 7), std::invalid_argument);
}

TEST_F(FormulaTest, DoubleHashingUnsolvedAtHome) {
    StepRecord step = makeStep(40, 1, 0);
    step.h2_value = 5;
    EXPECT_EQ(double_hashing_formula(step, 13), "h1(40) = 40 mod 13 = ? | h2(40) = 1 + (40 mod 12) = ?");
}

TEST_F(FormulaTest, DoubleHashingSolvedHashesOnCollision) {
    StepRecord step = makeStep(40, 1, 2);
    step.h2_value = 5;
    EXPECT_EQ(double_hashing_formula(step, 13),
              "h1(40) = 40 mod 13 = 1 | h2(40) = 1 + (40 mod 12) = 5 | "
              "collision(s) → i=2: (1 + 2×5) mod 13 = ?");
}

TEST_F(FormulaTest, ChainingIsFullySolved) {
    EXPECT_EQ(chaining_formula(makeStep(17, 3, 0), 7), "17 % 7 = 3");
}

TEST_F(FormulaTest, DependsOnlyOnRecordFields) {
    // final_index and probe_sequence do not influence the hint
    StepRecord a = makeStep(24, 3, 2);
    StepRecord b = a;
    b.final_index = 5;
    b.probe_sequence = {3, 4, 5};
    EXPECT_EQ(linear_probing_formula(a, 7), linear_probing_formula(b, 7));
    EXPECT_EQ(quadratic_probing_formula(a, 7), quadratic_probing_formula(b, 7));
}
