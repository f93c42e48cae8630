#pragma once

#include <string>

#include "puzzle/puzzle.h"
#include "table/hash_table_types.h"

// Serializes a puzzle as a single JSON object:
// technique, technique_label, table_size, keys, solution, steps,
// description, formula_label. Empty probe slots are written as null.
std::string to_json(const PuzzleResult& puzzle, bool pretty = false);

// One step document; field set depends on the technique and the error marker
std::string step_to_json(const StepRecord& step, Technique technique);

// Quotes and escapes s as a JSON string literal (UTF-8 passes through)
std::string json_quote(const std::string& s);
