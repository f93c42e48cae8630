#pragma once

#include <vector>

#include "config/difficulty.h"
#include "random/random_source.h"

// Upper bound on random fill draws per synthesis call
constexpr int MAX_FILL_ATTEMPTS = 1000;

/**
 * Keys with forced collisions, for linear probing, double hashing and chaining.
 *
 * Every cluster draws base_hash from [0, table_size-1] and contributes
 * base_hash + j*table_size for j = 0..size-1, so all members share one
 * modulo-table_size hash. Out-of-range or duplicate candidates are skipped.
 * The rest is filled with distinct uniform draws from [1, max_key_value]
 * (at most MAX_FILL_ATTEMPTS draws), then shuffled and truncated to num_keys.
 * The result may be shorter than num_keys if the fill budget runs out.
 */
std::vector<int> synthesize_collision_keys(int table_size,
                                           int num_keys,
                                           int max_key_value,
                                           Difficulty difficulty,
                                           RandomSource& rng);

/**
 * Keys tuned for deep quadratic probe chains. Same fill, shuffle and
 * truncation as synthesize_collision_keys, but with larger clusters and
 * base_hash drawn from [1, table_size-2]. Requires table_size >= 3.
 */
std::vector<int> synthesize_quadratic_keys(int table_size,
                                           int num_keys,
                                           int max_key_value,
                                           Difficulty difficulty,
                                           RandomSource& rng);
