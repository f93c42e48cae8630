#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

constexpr const char* TABLE_FULL_ERROR = "Table full";

// Open addressing table: one key or empty per slot
using ProbeTable = std::vector<std::optional<int>>;

// Separate chaining table: one ordered bucket per slot
using ChainTable = std::vector<std::vector<int>>;

using TableSolution = std::variant<ProbeTable, ChainTable>;

/**
 * One insertion, in insertion order.
 *
 * When error is set the key was not inserted and only key and error carry
 * meaning. probe_sequence includes the final slot and is empty for chaining.
 */
struct StepRecord {
    int key = 0;
    int initial_hash = 0;
    std::optional<int> h2_value;        // double hashing only
    std::vector<int> probe_sequence;
    int final_index = 0;
    int collisions = 0;                 // probes beyond the first
    std::optional<int> chain_length;    // chaining only
    std::string formula;
    std::optional<std::string> error;

    bool placed() const { return !error.has_value(); }
};

struct ProbeResolution {
    ProbeTable table;
    std::vector<StepRecord> steps;
};

struct ChainResolution {
    ChainTable table;
    std::vector<StepRecord> steps;
};
