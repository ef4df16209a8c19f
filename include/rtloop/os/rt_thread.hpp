#pragma once
#include <cstdint>

#include "rtloop/core/expected.hpp"

/*
Goal: prepare the calling thread for a busy-waiting control loop

    cpu         -> pin to one core (-1 skips), the spin loop then owns that core
    policy      -> kOther keeps the default scheduler, kFifo/kRoundRobin need CAP_SYS_NICE
    priority    -> RT priority for kFifo/kRoundRobin (Linux: 1..99)
    lock_memory -> mlockall(current | future): no page faults in the loop

    steps run in that order; the first failing step is reported as HardwareInitFailed("<step>: <errno text>")
*/
namespace rtloop::os{
    enum class RtSchedPolicy : std::uint8_t{
        kOther = 0,
        kFifo,
        kRoundRobin
    };

    struct RtThreadConfig{
        int cpu{-1};
        RtSchedPolicy policy{RtSchedPolicy::kOther};
        int priority{0};
        bool lock_memory{false};
    };

    Outcome configure_current_thread(const RtThreadConfig& cfg) noexcept;

    // // number of online cores, 0 if unknown
    int online_cpus() noexcept;

} // namespace rtloop::os
