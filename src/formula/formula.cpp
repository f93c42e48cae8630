#include "formula/formula.h"

#include <sstream>
#include <stdexcept>

namespace {

void write_modulo(std::ostringstream& oss, const char* fn, int key, int table_size) {
    oss << fn << "(" << key << ") = " << key << " mod " << table_size << " = ";
}

} // namespace

std::string linear_probing_formula(const StepRecord& step, int table_size) {
    std::ostringstream oss;
    write_modulo(oss, "h", step.key, table_size);
    if (step.collisions == 0) {
        oss << "?";
    } else {
        oss << step.initial_hash << " → collision(s), probe i=1.." << step.collisions;
    }
    return oss.str();
}

std::string quadratic_probing_formula(const StepRecord& step, int table_size) {
    std::ostringstream oss;
    if (step.collisions == 0) {
        write_modulo(oss, "h", step.key, table_size);
        oss << "?";
        return oss.str();
    }
    for (int p = 0; p <= step.collisions; p++) {
        if (p > 0) oss << " | ";
        oss << "i=" << p << ": (" << step.initial_hash << " + " << p << "²) mod "
            << table_size << " = ?";
    }
    return oss.str();
}

std::string double_hashing_formula(const StepRecord& step, int table_size) {
    if (!step.h2_value) {
        throw std::invalid_argument("double hashing formula needs h2_value");
    }
    std::ostringstream oss;
    write_modulo(oss, "h1", step.key, table_size);
    if (step.collisions == 0) {
        oss << "? | h2(" << step.key << ") = 1 + (" << step.key << " mod "
            << table_size - 1 << ") = ?";
        return oss.str();
    }
    const int h2 = *step.h2_value;
    oss << step.initial_hash << " | h2(" << step.key << ") = 1 + (" << step.key << " mod "
        << table_size - 1 << ") = " << h2 << " | collision(s) → i=" << step.collisions
        << ": (" << step.initial_hash << " + " << step.collisions << "×" << h2 << ") mod "
        << table_size << " = ?";
    return oss.str();
}

std::string chaining_formula(const StepRecord& step, int table_size) {
    std::ostringstream oss;
    oss << step.key << " % " << table_size << " = " << step.initial_hash;
    return oss.str();
}
