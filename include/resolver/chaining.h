#pragma once

#include <vector>
#include "table/hash_table_types.h"

// Appends every key to bucket key mod table_size. Never fails.
ChainResolution resolve_chaining(const std::vector<int>& keys, int table_size);
