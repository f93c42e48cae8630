#include "puzzle/puzzle.h"

#include <utility>

#include "keys/key_synthesizer.h"
#include "resolver/chaining.h"
#include "resolver/double_hashing.h"
#include "resolver/linear_probing.h"
#include "resolver/quadratic_probing.h"

namespace {

PuzzleResult make_result(Technique technique, const std::vector<int>& keys, int table_size) {
    const TechniqueInfo& info = technique_info(technique);
    PuzzleResult result{technique,
                        info.id,
                        info.label,
                        table_size,
                        keys,
                        ProbeTable{},
                        {},
                        info.description,
                        info.formula_label};
    return result;
}

void store(PuzzleResult& result, ProbeResolution resolution) {
    result.solution = std::move(resolution.table);
    result.steps = std::move(resolution.steps);
}

void store(PuzzleResult& result, ChainResolution resolution) {
    result.solution = std::move(resolution.table);
    result.steps = std::move(resolution.steps);
}

} // namespace

PuzzleResult build_puzzle(Technique technique, const std::vector<int>& keys, int table_size) {
    PuzzleResult result = make_result(technique, keys, table_size);
    switch (technique) {
        case Technique::QUADRATIC_PROBING:
            store(result, resolve_quadratic_probing(keys, table_size));
            break;
        case Technique::DOUBLE_HASHING:
            store(result, resolve_double_hashing(keys, table_size));
            break;
        case Technique::CHAINING:
            store(result, resolve_chaining(keys, table_size));
            break;
        case Technique::LINEAR_PROBING:
        default:
            store(result, resolve_linear_probing(keys, table_size));
            break;
    }
    return result;
}

PuzzleResult generate_puzzle(Technique technique, Difficulty difficulty, RandomSource& rng) {
    const DifficultyProfile profile = difficulty_profile(difficulty);

    std::vector<int> keys;
    if (technique == Technique::QUADRATIC_PROBING) {
        keys = synthesize_quadratic_keys(profile.table_size, profile.num_keys,
                                         profile.max_key_value, difficulty, rng);
    } else {
        keys = synthesize_collision_keys(profile.table_size, profile.num_keys,
                                         profile.max_key_value, difficulty, rng);
    }
    return build_puzzle(technique, keys, profile.table_size);
}

PuzzleResult generate_puzzle(std::string_view technique,
                             std::string_view difficulty,
                             RandomSource& rng) {
    // Difficulty is parsed first so a bad tier fails before any draw
    const Difficulty tier = parse_difficulty(difficulty);
    return generate_puzzle(parse_technique(technique), tier, rng);
}

PuzzleResult generate_puzzle(std::string_view technique, std::string_view difficulty) {
    return generate_puzzle(technique, difficulty, RandomSource::thread_instance());
}
