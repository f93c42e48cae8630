#pragma once

#include <ostream>

#include "puzzle/puzzle.h"

// Plain-text diagram of a puzzle: header, keys to insert, one hint line per
// step and the table itself. With reveal_solution false the table is drawn
// empty and placements are left as "?" for the learner.
void render_text(std::ostream& out, const PuzzleResult& puzzle, bool reveal_solution);
