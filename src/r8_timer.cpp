#include "r8_timer.hpp"

#include <thread>

namespace r8::timer {

cycle::cycle(double rate_Hz) : cycle_duration(1.0 / rate_Hz), last_cycle_start(r8::clock::now())
{
}

void cycle::wait_until_ready(void)
{
    const auto release_time =
        last_cycle_start + std::chrono::duration_cast<r8::clock::duration>(cycle_duration);
    std::this_thread::sleep_until(release_time);
    last_cycle_start = r8::clock::now();
}

bool cycle::is_ready(void)
{
    const r8::clock::time_point now = r8::clock::now();
    const auto elapsed = std::chrono::duration_cast<std::chrono::duration<double>>(
        now - last_cycle_start);

    if (elapsed < cycle_duration) return false;

    last_cycle_start = now;
    return true;
}

} // namespace r8::timer
