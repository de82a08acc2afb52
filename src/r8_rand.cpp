#include "r8_rand.hpp"

#include <chrono>

namespace r8 {

namespace {

uint64_t epoch_micros(void)
{
    using namespace std::chrono;
    const auto since_epoch = system_clock::now().time_since_epoch();
    const auto micros = duration_cast<microseconds>(since_epoch).count();
    return micros > 0 ? static_cast<uint64_t>(micros) : rand_gen::fallback_seed;
}

} // namespace

rand_gen::rand_gen(void) : state(epoch_micros()) {}

uint8_t rand_gen::next(void)
{
    state = multiplier * state + increment; // modulo 2^64
    return static_cast<uint8_t>(state & 0xFF);
}

} // namespace r8
