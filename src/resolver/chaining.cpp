#include "resolver/chaining.h"
#include "resolver/resolver_common.h"
#include "formula/formula.h"

#include <utility>

ChainResolution resolve_chaining(const std::vector<int>& keys, int table_size) {
    require_table_size(table_size, 1, "chaining");

    ChainResolution result;
    result.table.resize(table_size);
    result.steps.reserve(keys.size());

    for (int key : keys) {
        const int bucket = home_slot(key, table_size);
        result.table[bucket].push_back(key);

        StepRecord step;
        step.key = key;
        step.initial_hash = bucket;
        step.final_index = bucket;
        step.chain_length = static_cast<int>(result.table[bucket].size());
        step.formula = chaining_formula(step, table_size);
        result.steps.push_back(std::move(step));
    }
    return result;
}
