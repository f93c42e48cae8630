#pragma once

#include <vector>
#include "table/hash_table_types.h"

constexpr const char* QUADRATIC_EXHAUSTED_ERROR = "No slot found (quadratic probing exhausted)";

// Inserts keys in order probing (h0 + i*i) mod table_size, i = 0..table_size-1.
// The offsets need not cover every slot, so a key can fail while empty
// slots remain.
ProbeResolution resolve_quadratic_probing(const std::vector<int>& keys, int table_size);
