#pragma once

#include <cstdint>
#include <random>
#include <vector>

// Source of uniform integer draws used by the key synthesizers.
// Tests substitute a scripted implementation to get exact expectations.
class RandomSource {
public:
    virtual ~RandomSource() = default;

    // Uniform integer in [lo, hi], both bounds inclusive.
    virtual int uniform_int(int lo, int hi) = 0;

    // Per-thread default source, seeded from std::random_device
    static RandomSource& thread_instance();
};

class MersenneRandomSource : public RandomSource {
public:
    MersenneRandomSource();
    explicit MersenneRandomSource(uint64_t seed);

    int uniform_int(int lo, int hi) override;

private:
    std::mt19937_64 engine_;
};

// Fisher-Yates shuffle driven by a RandomSource.
// Walks i = n-1 .. 1 and swaps keys[i] with keys[j], j drawn from [0, i].
void shuffle_keys(std::vector<int>& keys, RandomSource& rng);
