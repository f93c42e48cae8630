#include "output/text_renderer.h"

#include <iomanip>
#include <string>
#include <variant>

namespace {

void print_rule(std::ostream& out, char c) {
    out << std::string(68, c) << "\n";
}

void print_probe_table(std::ostream& out, const ProbeTable& slots, bool reveal) {
    for (size_t i = 0; i < slots.size(); i++) {
        out << "  [" << std::setw(2) << i << "] ";
        if (reveal && slots[i]) {
            out << *slots[i];
        } else {
            out << "-";
        }
        out << "\n";
    }
}

void print_chain_table(std::ostream& out, const ChainTable& buckets, bool reveal) {
    for (size_t i = 0; i < buckets.size(); i++) {
        out << "  [" << std::setw(2) << i << "]";
        if (reveal) {
            for (int key : buckets[i]) {
                out << " -> " << key;
            }
        }
        out << " -> null\n";
    }
}

void print_step(std::ostream& out, size_t index, const StepRecord& step, bool reveal) {
    out << "  " << std::setw(2) << index + 1 << ". insert " << std::setw(3) << step.key << "  ";
    if (step.error) {
        out << "ERROR: " << *step.error << "\n";
        return;
    }
    out << step.formula;
    if (reveal) {
        out << "  => slot " << step.final_index;
        if (!step.probe_sequence.empty() && step.collisions > 0) {
            out << " (probed";
            for (int slot : step.probe_sequence) out << " " << slot;
            out << ")";
        }
        if (step.chain_length) {
            out << ", chain length " << *step.chain_length;
        }
    }
    out << "\n";
}

} // namespace

void render_text(std::ostream& out, const PuzzleResult& puzzle, bool reveal_solution) {
    print_rule(out, '=');
    out << puzzle.technique_label << "  (m = " << puzzle.table_size << ")\n";
    out << puzzle.description << "\n";
    out << "Formula: " << puzzle.formula_label << "\n";
    print_rule(out, '=');

    out << "Keys:";
    for (int key : puzzle.keys) out << " " << key;
    out << "\n\n";

    out << "Steps:\n";
    for (size_t i = 0; i < puzzle.steps.size(); i++) {
        print_step(out, i, puzzle.steps[i], reveal_solution);
    }
    out << "\n";

    out << (reveal_solution ? "Final table:\n" : "Table:\n");
    if (const auto* slots = std::get_if<ProbeTable>(&puzzle.solution)) {
        print_probe_table(out, *slots, reveal_solution);
    } else if (const auto* chains = std::get_if<ChainTable>(&puzzle.solution)) {
        print_chain_table(out, *chains, reveal_solution);
    }
    print_rule(out, '-');
}
