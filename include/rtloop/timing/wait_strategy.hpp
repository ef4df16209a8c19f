#pragma once
#include <cstdint>

#include "rtloop/core/time.hpp"
#include "rtloop/core/clock.hpp"

/*
Goal: block until an absolute monotonic target and report the wake time

    kBusySpin      -> re-read the clock in a tight loop, never yields the core (default, needs a dedicated core)
    kSleepThenSpin -> sleep until target - spin_margin, then spin the rest (shared cores, still sub-ms accurate)
    kYieldSpin     -> spin but give up the time slice on each poll (cooperative, coarser)

    The target grid is the caller's, the strategy only decides how the time until it is burnt
*/
namespace rtloop{
    enum class WaitMode : std::uint8_t{
        kBusySpin,
        kSleepThenSpin,
        kYieldSpin
    };

    // // Injectable clock -> nullptr selects monotonic_now()
    using NowFn = t_ns(*)(void* user);

    inline t_ns read_clock(NowFn now, void* user) noexcept{
        return now ? now(user) : monotonic_now();
    }

    // // Returns the first clock reading >= target
    inline t_ns wait_until(t_ns target, WaitMode mode, dt_ns spin_margin, NowFn now, void* user) noexcept{
        t_ns t = read_clock(now, user);

        switch (mode){
            case WaitMode::kSleepThenSpin:
                // sleep only runs in the process clock domain, an injected clock spins all the way
                if (!now && (target - t) > spin_margin){
                    sleep_until(target - spin_margin);
                    t = read_clock(now, user);
                }
                while (t < target) t = read_clock(now, user);
                return t;

            case WaitMode::kYieldSpin:
                while (t < target){
                    yield_now();
                    t = read_clock(now, user);
                }
                return t;

            case WaitMode::kBusySpin:
            default:
                while (t < target) t = read_clock(now, user);
                return t;
        }
    }

} // namespace rtloop
