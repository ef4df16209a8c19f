#pragma once

#include <cmath>

#include "rtloop/core/types.hpp"
#include "rtloop/core/status.hpp"
#include "rtloop/core/expected.hpp"
#include "rtloop/safety/clip.hpp"

/*
Goal: single axis PID with output saturation and integral anti-windup

    e      = setpoint - measured
    I      = clamp(I + e*dt, -L, L)       <- the accumulator itself is clamped (anti-windup); only when dt > 0
    D      = (e - e_prev) / dt,  0 when dt <= 0 (zero length cycle, no division)
    e_prev = e                            <- advances whatever dt is
    u      = clamp(kp*e + ki*I + kd*D, -L, L)

    extreme finite inputs can overflow e to +-inf: a zero gain contributes 0 (never 0*inf),
    clamp_symmetric pins inf/NaN to the limit, so I and u stay finite and in range

    gains and L are fixed for the instance's life; reset() clears I and e_prev only
    dt in seconds
*/
namespace rtloop::control::pid{

    struct PidConfig{
        Scalar kp{0};
        Scalar ki{0};
        Scalar kd{0};
        Scalar output_limit{1};
    };

    class PidController{
        public:
            // // limit is used as a magnitude; use make() to reject bad configs instead
            PidController(Scalar kp, Scalar ki, Scalar kd, Scalar output_limit) noexcept
                : kp_(kp), ki_(ki), kd_(kd), limit_(std::abs(output_limit)) {}

            explicit PidController(const PidConfig& c) noexcept
                : PidController(c.kp, c.ki, c.kd, c.output_limit) {}

            // // Validated construction: finite gains, finite limit > 0
            [[nodiscard]] static Expected<PidController> make(const PidConfig& c) noexcept{
                if (!std::isfinite(c.kp) || !std::isfinite(c.ki) || !std::isfinite(c.kd)) return Expected<PidController>::failure(Status::kInvalidArg);
                if (!std::isfinite(c.output_limit) || !(c.output_limit > 0)) return Expected<PidController>::failure(Status::kInvalidArg);
                return Expected<PidController>::emplace(c);
            }

            [[nodiscard]] Scalar compute(Scalar setpoint, Scalar measured, Scalar dt) noexcept{
                const Scalar e = setpoint - measured;

                // anti-windup: clamp the accumulator, not just the output
                if (dt > 0) integral_ = safety::clamp_symmetric(integral_ + e * dt, limit_).val;

                const Scalar derivative = (dt > 0) ? (e - prev_error_) / dt : Scalar(0);
                prev_error_ = std::isnan(e) ? Scalar(0) : e;

                const Scalar p_term = term_(kp_, e);
                const Scalar i_term = term_(ki_, integral_);
                const Scalar d_term = term_(kd_, derivative);
                const safety::Clip out = safety::clamp_symmetric(p_term + i_term + d_term, limit_);
                saturated_ = out.hit;
                return out.val;
            }

            void reset() noexcept{
                integral_ = 0;
                prev_error_ = 0;
                saturated_ = false;
            }

            // // helper functions
            Scalar kp() const noexcept{
                return kp_;
            }
            Scalar ki() const noexcept{
                return ki_;
            }
            Scalar kd() const noexcept{
                return kd_;
            }
            Scalar output_limit() const noexcept{
                return limit_;
            }
            Scalar integral() const noexcept{
                return integral_;
            }
            Scalar previous_error() const noexcept{
                return prev_error_;
            }

            // // last compute() output hit the limit
            bool saturated() const noexcept{
                return saturated_;
            }

        private:
            static Scalar term_(Scalar gain, Scalar x) noexcept{
                return (gain == Scalar(0)) ? Scalar(0) : gain * x;
            }

            Scalar kp_{0}, ki_{0}, kd_{0};
            Scalar limit_{0};

            Scalar integral_{0};
            Scalar prev_error_{0};
            bool saturated_{false};
    };

    using PController = PidController;    // // with ki=kd=0
    using PIController = PidController;   // // with kd=0
    using PDController = PidController;   // // with ki=0

} // namespace rtloop::control::pid
