#include "resolver/double_hashing.h"
#include "resolver/resolver_common.h"
#include "formula/formula.h"

#include <utility>

int secondary_hash(int key, int table_size) {
    require_table_size(table_size, 2, "double hashing");
    return 1 + home_slot(key, table_size - 1);
}

ProbeResolution resolve_double_hashing(const std::vector<int>& keys, int table_size) {
    require_table_size(table_size, 2, "double hashing");

    ProbeResolution result;
    result.table.assign(table_size, std::nullopt);
    result.steps.reserve(keys.size());

    for (int key : keys) {
        StepRecord step;
        step.key = key;
        step.initial_hash = home_slot(key, table_size);
        const int h2 = secondary_hash(key, table_size);
        step.h2_value = h2;

        bool placed = false;
        for (int i = 0; i < table_size; i++) {
            const int slot = (step.initial_hash + i * h2) % table_size;
            step.probe_sequence.push_back(slot);
            if (!result.table[slot]) {
                result.table[slot] = key;
                step.final_index = slot;
                step.collisions = i;
                step.formula = double_hashing_formula(step, table_size);
                placed = true;
                break;
            }
        }

        if (!placed) {
            StepRecord failed;
            failed.key = key;
            failed.error = TABLE_FULL_ERROR;
            result.steps.push_back(std::move(failed));
            continue;
        }
        result.steps.push_back(std::move(step));
    }
    return result;
}
