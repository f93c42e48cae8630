#pragma once

#include <vector>
#include "table/hash_table_types.h"

// Inserts keys in order probing (h0 + i) mod table_size, i = 0..table_size-1.
// A key that finds no empty slot gets a "Table full" error step.
ProbeResolution resolve_linear_probing(const std::vector<int>& keys, int table_size);
