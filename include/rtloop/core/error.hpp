#pragma once

#include <span>
#include <cstddef>
#include <cstdint>

#include "rtloop/core/time.hpp"
#include "rtloop/core/status.hpp"

/*
Goal: one error value for everything the loop core can surface to its caller

    code      -> taxonomy slot (Status)
    expected  -> deadline the cycle was measured against (kDeadlineMiss only)
    actual    -> measured latency of that cycle (kDeadlineMiss only)
    cycle_index -> grid index k of the late cycle (kDeadlineMiss only, 0 otherwise)
    reason    -> short inline text, truncated, no heap (hardware / control loop errors)

    RT safe: trivially copyable, fixed size, never allocates
*/
namespace rtloop{
    struct Error{
        static constexpr std::size_t kReasonCap = 64;

        Status code{Status::kControlLoopError};
        dt_ns expected{0};
        dt_ns actual{0};
        std::uint64_t cycle_index{0};
        char reason[kReasonCap]{};

        // // Factories for the taxonomy
        static Error hardware_init_failed(const char* why) noexcept{
            Error e;
            e.code = Status::kHardwareInitFailed;
            e.set_reason(why);
            return e;
        }

        static Error real_time_violation(dt_ns expected_ns, dt_ns actual_ns, std::uint64_t grid_index = 0) noexcept{
            Error e;
            e.code = Status::kDeadlineMiss;
            e.expected = expected_ns;
            e.actual = actual_ns;
            e.cycle_index = grid_index;
            return e;
        }

        static Error sensor_data_unavailable() noexcept{
            Error e;
            e.code = Status::kSensorDataUnavailable;
            return e;
        }

        static Error control_loop(const char* why) noexcept{
            Error e;
            e.code = Status::kControlLoopError;
            e.set_reason(why);
            return e;
        }

        // // lifecycle / config codes without payload (kInvalidArg, kNotReady, ...)
        static Error from_status(Status s) noexcept{
            Error e;
            e.code = s;
            return e;
        }

        bool is_real_time_violation() const noexcept{
            return code == Status::kDeadlineMiss;
        }
        bool is_hardware_init_failed() const noexcept{
            return code == Status::kHardwareInitFailed;
        }
        bool is_sensor_data_unavailable() const noexcept{
            return code == Status::kSensorDataUnavailable;
        }
        bool is_control_loop_error() const noexcept{
            return code == Status::kControlLoopError;
        }

        // // how far the cycle overshot its deadline, 0 for other codes
        dt_ns overshoot() const noexcept{
            return (is_real_time_violation() && actual > expected) ? (actual - expected) : 0;
        }

        // // copies up to kReasonCap-1 chars, always terminated
        void set_reason(const char* why) noexcept{
            if (!why){
                reason[0] = '\0';
                return;
            }
            std::size_t n = 0;
            while (n + 1 < kReasonCap && why[n] != '\0'){
                reason[n] = why[n];
                ++n;
            }
            reason[n] = '\0';
        }
    };

    static_assert(sizeof(Error) <= 96, "keep error small/fixed");

    /*
    Writes a one line description of e into out (always terminated when out is non empty)
    eg: "RealTimeViolation: expected=1000000ns actual=1204331ns"
    returns number of chars written, excluding terminator
    */
    std::size_t format_error(const Error& e, std::span<char> out) noexcept;

} // namespace rtloop
