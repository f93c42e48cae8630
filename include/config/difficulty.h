#pragma once

#include <string_view>
#include <vector>

enum class Difficulty {
    EASY,
    MEDIUM,
    HARD
};

// Table geometry and key range for one difficulty tier
struct DifficultyProfile {
    int table_size;      // 7, 11, 13: prime so double hashing visits every slot
    int num_keys;        // expected to be <= table_size
    int max_key_value;
};

// Parses "easy" | "medium" | "hard".
// Throws std::invalid_argument for anything else; there is no default tier.
Difficulty parse_difficulty(std::string_view name);

const char* to_string(Difficulty difficulty);

DifficultyProfile difficulty_profile(Difficulty difficulty);

// Forced-collision cluster sizes, one entry per cluster.
// Collision-biased: easy {2}, medium {2, 2}, hard {3, 3, 3}.
std::vector<int> collision_cluster_plan(Difficulty difficulty);

// Quadratic-biased: easy {3}, medium {4, 2}, hard {4, 3}.
std::vector<int> quadratic_cluster_plan(Difficulty difficulty);
