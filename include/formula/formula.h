#pragma once

#include <string>
#include "table/hash_table_types.h"

/*
 * Hint strings shown next to each insertion. They are computed only from the
 * fields of an already resolved StepRecord, so they can be checked without
 * replaying the table. Open addressing hints withhold the final slot ("?");
 * the chaining hint is fully solved.
 */

// "h(k) = k mod m = ?" or "h(k) = k mod m = h0 → collision(s), probe i=1..c"
std::string linear_probing_formula(const StepRecord& step, int table_size);

// "h(k) = k mod m = ?" or "i=0: (h0 + 0²) mod m = ? | i=1: ..." up to i=c
std::string quadratic_probing_formula(const StepRecord& step, int table_size);

// Both hash expressions unsolved, or solved h1/h2 plus the unsolved last probe.
// Reads step.h2_value.
std::string double_hashing_formula(const StepRecord& step, int table_size);

// "k % m = h"
std::string chaining_formula(const StepRecord& step, int table_size);
