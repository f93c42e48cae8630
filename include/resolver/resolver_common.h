#pragma once

#include <stdexcept>
#include <string>

inline void require_table_size(int table_size, int minimum, const char* technique) {
    if (table_size < minimum) {
        throw std::invalid_argument(std::string(technique) + " needs table_size >= " +
                                    std::to_string(minimum) + ", got " +
                                    std::to_string(table_size));
    }
}

// Non-negative remainder, so a negative key still lands in [0, table_size)
inline int home_slot(int key, int table_size) {
    return ((key % table_size) + table_size) % table_size;
}
