#pragma once

#include <cstdint>

namespace r8 {

// Linear congruential generator for the RND instruction.
class rand_gen {
    static constexpr uint64_t multiplier = 6364136223846793005ULL;
    static constexpr uint64_t increment = 1442695040888963407ULL;

    uint64_t state;

public:
    static constexpr uint64_t fallback_seed = 5555;

    // seeded from the wall clock in microseconds
    rand_gen(void);
    explicit rand_gen(uint64_t seed) : state(seed) {}

    uint8_t next(void);
};

} // namespace r8
