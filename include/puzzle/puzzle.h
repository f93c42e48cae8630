#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "config/difficulty.h"
#include "random/random_source.h"
#include "resolver/technique.h"
#include "table/hash_table_types.h"

// One generated puzzle: the keys, the solved table and the insertion trace
struct PuzzleResult {
    Technique technique;
    std::string technique_id;
    std::string technique_label;
    int table_size;
    std::vector<int> keys;
    TableSolution solution;
    std::vector<StepRecord> steps;
    std::string description;
    std::string formula_label;
};

/**
 * Builds a puzzle for the given technique and difficulty.
 *
 * Unknown technique names fall back to linear probing. Unknown difficulty
 * names throw std::invalid_argument. Keys are drawn from rng; with the same
 * draws the result is identical.
 */
PuzzleResult generate_puzzle(std::string_view technique,
                             std::string_view difficulty,
                             RandomSource& rng);

// Same, drawing from RandomSource::thread_instance()
PuzzleResult generate_puzzle(std::string_view technique, std::string_view difficulty);

// Typed entry point used by both overloads above
PuzzleResult generate_puzzle(Technique technique, Difficulty difficulty, RandomSource& rng);

// Resolves an explicit key set without any random draws
PuzzleResult build_puzzle(Technique technique, const std::vector<int>& keys, int table_size);
