#include "resolver/technique.h"

namespace {

const TechniqueInfo kLinearProbing{
    "linear_probing",
    "Linear Probing",
    "On collision, probe next slot: h(k, i) = (h(k) + i) mod m",
    "h(k, i) = (k mod m + i) mod m"};

const TechniqueInfo kQuadraticProbing{
    "quadratic_probing",
    "Quadratic Probing",
    "On collision, probe with quadratic increments: h(k, i) = (h(k) + i²) mod m",
    "h(k, i) = (k mod m + i²) mod m"};

const TechniqueInfo kDoubleHashing{
    "double_hashing",
    "Double Hashing",
    "On collision, use second hash function: h(k,i) = (h1(k) + i·h2(k)) mod m",
    "h(k,i) = (k mod m + i·(1 + k mod (m-1))) mod m"};

const TechniqueInfo kChaining{
    "chaining",
    "Separate Chaining",
    "Each slot holds a linked list. Colliding keys are chained together.",
    "h(k) = k mod m → append to chain at index"};

} // namespace

Technique parse_technique(std::string_view name) {
    if (name == "quadratic_probing") return Technique::QUADRATIC_PROBING;
    if (name == "double_hashing") return Technique::DOUBLE_HASHING;
    if (name == "chaining") return Technique::CHAINING;
    return Technique::LINEAR_PROBING;
}

const TechniqueInfo& technique_info(Technique technique) {
    switch (technique) {
        case Technique::QUADRATIC_PROBING: return kQuadraticProbing;
        case Technique::DOUBLE_HASHING: return kDoubleHashing;
        case Technique::CHAINING: return kChaining;
        case Technique::LINEAR_PROBING:
        default:
            return kLinearProbing;
    }
}
