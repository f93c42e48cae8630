#include "random/random_source.h"

#include <stdexcept>
#include <string>
#include <utility>

MersenneRandomSource::MersenneRandomSource()
    : engine_(std::random_device{}()) {}

MersenneRandomSource::MersenneRandomSource(uint64_t seed)
    : engine_(seed) {}

int MersenneRandomSource::uniform_int(int lo, int hi) {
    if (lo > hi) {
        throw std::invalid_argument("uniform_int: empty range [" + std::to_string(lo) +
                                    ", " + std::to_string(hi) + "]");
    }
    std::uniform_int_distribution<int> dist(lo, hi);
    return dist(engine_);
}

RandomSource& RandomSource::thread_instance() {
    thread_local MersenneRandomSource instance;
    return instance;
}

void shuffle_keys(std::vector<int>& keys, RandomSource& rng) {
    if (keys.size() < 2) return;
    for (size_t i = keys.size() - 1; i > 0; --i) {
        size_t j = static_cast<size_t>(rng.uniform_int(0, static_cast<int>(i)));
        std::swap(keys[i], keys[j]);
    }
}
