#pragma once

#include "rtloop/core/time.hpp"

namespace rtloop{
    // // Monotonic clock in ns (CLOCK_MONOTONIC on posix, QPC on windows), never adjusted by NTP
    t_ns monotonic_now() noexcept;

    // // Wall clock ns since Unix epoch -> only for anchoring evidence, never for pacing
    t_ns utc_now() noexcept;

    // // Sleeps the calling thread until the absolute monotonic time t (may overshoot by scheduler latency)
    void sleep_until(t_ns t) noexcept;

    // // Gives up the rest of the time slice
    void yield_now() noexcept;

} // namespace rtloop
