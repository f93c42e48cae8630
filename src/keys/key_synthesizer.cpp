#include "keys/key_synthesizer.h"

#include <stdexcept>
#include <string>
#include <unordered_set>

namespace {

void validate_arguments(int table_size, int num_keys, int max_key_value) {
    if (table_size <= 0) {
        throw std::invalid_argument("table_size must be positive, got " + std::to_string(table_size));
    }
    if (num_keys < 0) {
        throw std::invalid_argument("num_keys must not be negative, got " + std::to_string(num_keys));
    }
    if (max_key_value < 1) {
        throw std::invalid_argument("max_key_value must be at least 1, got " + std::to_string(max_key_value));
    }
}

std::vector<int> synthesize_keys(const std::vector<int>& cluster_sizes,
                                 int base_lo,
                                 int base_hi,
                                 int table_size,
                                 int num_keys,
                                 int max_key_value,
                                 RandomSource& rng) {
    std::vector<int> keys;
    std::unordered_set<int> used;

    for (int size : cluster_sizes) {
        const int base_hash = rng.uniform_int(base_lo, base_hi);
        for (int j = 0; j < size; j++) {
            const int candidate = base_hash + j * table_size;
            if (candidate >= 1 && candidate <= max_key_value && used.insert(candidate).second) {
                keys.push_back(candidate);
            }
        }
    }

    int attempts = 0;
    while (static_cast<int>(keys.size()) < num_keys && attempts < MAX_FILL_ATTEMPTS) {
        const int candidate = rng.uniform_int(1, max_key_value);
        if (used.insert(candidate).second) {
            keys.push_back(candidate);
        }
        attempts++;
    }

    // Truncating after the shuffle can drop forced-collision keys; that is accepted
    shuffle_keys(keys, rng);
    if (static_cast<int>(keys.size()) > num_keys) {
        keys.resize(num_keys);
    }
    return keys;
}

} // namespace

std::vector<int> synthesize_collision_keys(int table_size,
                                           int num_keys,
                                           int max_key_value,
                                           Difficulty difficulty,
                                           RandomSource& rng) {
    validate_arguments(table_size, num_keys, max_key_value);
    return synthesize_keys(collision_cluster_plan(difficulty), 0, table_size - 1,
                           table_size, num_keys, max_key_value, rng);
}

std::vector<int> synthesize_quadratic_keys(int table_size,
                                           int num_keys,
                                           int max_key_value,
                                           Difficulty difficulty,
                                           RandomSource& rng) {
    validate_arguments(table_size, num_keys, max_key_value);
    if (table_size < 3) {
        throw std::invalid_argument("quadratic key synthesis needs table_size >= 3, got " +
                                    std::to_string(table_size));
    }
    // Extremes 0 and table_size-1 are avoided as base hashes
    return synthesize_keys(quadratic_cluster_plan(difficulty), 1, table_size - 2,
                           table_size, num_keys, max_key_value, rng);
}
