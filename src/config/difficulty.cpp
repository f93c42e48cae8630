#include "config/difficulty.h"

#include <stdexcept>
#include <string>

Difficulty parse_difficulty(std::string_view name) {
    if (name == "easy") return Difficulty::EASY;
    if (name == "medium") return Difficulty::MEDIUM;
    if (name == "hard") return Difficulty::HARD;
    throw std::invalid_argument("Unknown difficulty '" + std::string(name) +
                                "' (expected easy, medium or hard)");
}

const char* to_string(Difficulty difficulty) {
    switch (difficulty) {
        case Difficulty::EASY: return "easy";
        case Difficulty::MEDIUM: return "medium";
        case Difficulty::HARD: return "hard";
    }
    return "easy";
}

DifficultyProfile difficulty_profile(Difficulty difficulty) {
    switch (difficulty) {
        case Difficulty::EASY:   return {7, 4, 99};
        case Difficulty::MEDIUM: return {11, 7, 199};
        case Difficulty::HARD:   return {13, 9, 299};
    }
    return {7, 4, 99};
}

std::vector<int> collision_cluster_plan(Difficulty difficulty) {
    switch (difficulty) {
        case Difficulty::EASY:   return {2};
        case Difficulty::MEDIUM: return {2, 2};
        case Difficulty::HARD:   return {3, 3, 3};
    }
    return {2};
}

std::vector<int> quadratic_cluster_plan(Difficulty difficulty) {
    // Clusters of 3-4 keys sharing h0 push probes out to i=2..3 (offsets 4, 9)
    switch (difficulty) {
        case Difficulty::EASY:   return {3};
        case Difficulty::MEDIUM: return {4, 2};
        case Difficulty::HARD:   return {4, 3};
    }
    return {3};
}
