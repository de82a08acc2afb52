#pragma once

#include <chrono>

#include "r8_prelude.hpp"

namespace r8::timer {

// Fixed-rate pacing for the front-end loop. The core itself never sleeps.
class cycle {
    const std::chrono::duration<double> cycle_duration;
    r8::clock::time_point last_cycle_start;

public:
    explicit cycle(double rate_Hz);

    // true (and a new cycle starts) once a full period has elapsed
    bool is_ready(void);

    // sleep until the current period has elapsed, then start a new one
    void wait_until_ready(void);
};

} // namespace r8::timer
