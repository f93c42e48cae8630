#pragma once

#include <vector>
#include "table/hash_table_types.h"

// Step size 1 + (key mod (table_size - 1)), never 0
int secondary_hash(int key, int table_size);

// Inserts keys in order probing (h0 + i*h2(key)) mod table_size.
// Requires table_size >= 2.
ProbeResolution resolve_double_hashing(const std::vector<int>& keys, int table_size);
