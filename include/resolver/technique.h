#pragma once

#include <string_view>

enum class Technique {
    LINEAR_PROBING,
    QUADRATIC_PROBING,
    DOUBLE_HASHING,
    CHAINING
};

// Static display text attached to every puzzle of a technique
struct TechniqueInfo {
    const char* id;
    const char* label;
    const char* description;
    const char* formula_label;
};

// Unrecognized names fall back to LINEAR_PROBING, never an error.
Technique parse_technique(std::string_view name);

const TechniqueInfo& technique_info(Technique technique);

inline const char* to_string(Technique technique) {
    return technique_info(technique).id;
}
