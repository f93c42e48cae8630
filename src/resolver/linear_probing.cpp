#include "resolver/linear_probing.h"
#include "resolver/resolver_common.h"
#include "formula/formula.h"

#include <utility>

ProbeResolution resolve_linear_probing(const std::vector<int>& keys, int table_size) {
    require_table_size(table_size, 1, "linear probing");

    ProbeResolution result;
    result.table.assign(table_size, std::nullopt);
    result.steps.reserve(keys.size());

    for (int key : keys) {
        StepRecord step;
        step.key = key;
        step.initial_hash = home_slot(key, table_size);

        bool placed = false;
        for (int probe = 0; probe < table_size; probe++) {
            const int slot = (step.initial_hash + probe) % table_size;
            step.probe_sequence.push_back(slot);
            if (!result.table[slot]) {
                result.table[slot] = key;
                step.final_index = slot;
                step.collisions = probe;
                step.formula = linear_probing_formula(step, table_size);
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
