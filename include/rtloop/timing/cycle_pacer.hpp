#pragma once

#include <mutex>
#include <cstdint>

#include "rtloop/core/time.hpp"
#include "rtloop/core/error.hpp"
#include "rtloop/core/expected.hpp"
#include "rtloop/io/logger.hpp"
#include "rtloop/timing/rt_stats.hpp"
#include "rtloop/timing/wait_strategy.hpp"

/*
Goal: pace one loop iteration per period on a fixed absolute grid

    grid: start_ + k * period_, start_ captured once at construction
    each wait targets the next grid point after "now" -> rounding never accumulates (no drift)
    stats are recorded for every cycle, on time or late, before a violation is reported
*/
namespace rtloop{

    // // Per cycle measurement handed back on success
    struct CycleTiming{
        std::uint64_t cycle_index{0};   // grid point index k that was waited for
        t_ns cycle_start{0};            // clock when wait_next_cycle() was entered
        t_ns target{0};                 // start_ + k * period
        t_ns wake{0};                   // first clock reading >= target
        t_ns latency{0};                // wake - cycle_start
        dt_ns period{0};                // deadline the latency is measured against
    };

    using OnViolationFn = void(*)(const Error& e, void* user);

    // //  Optional callbacks: Default No callback, process monotonic clock
    struct PacerHooks{
        NowFn now{nullptr};
        OnViolationFn on_violation{nullptr};
        void* user{nullptr};
    };

    struct PacerConfig{
        WaitMode wait_mode{WaitMode::kBusySpin};

        // // kSleepThenSpin: how long before the target to wake up and start spinning
        dt_ns spin_margin{200'000};

        PacerHooks hooks{};

        // // violations are logged at kWarn when set, non owning
        LoggerSink* logger{nullptr};
    };

    class CyclePacer{
        public:
            explicit CyclePacer(double frequency_hz, const PacerConfig& cfg = {}) noexcept
                : cfg_(cfg), hz_(frequency_hz), period_(period_from_hz(frequency_hz)){
                    if (cfg_.spin_margin < 0) cfg_.spin_margin = 0;
                    start_ = read_clock(cfg_.hooks.now, cfg_.hooks.user);
            }

            CyclePacer(const CyclePacer&) = delete;
            CyclePacer& operator=(const CyclePacer&) = delete;

            // // false when the frequency could not be turned into a >= 1 ns period
            bool valid() const noexcept{
                return period_ > 0;
            }

            /*
            1. cycle_start = now
            2. next boundary = cycle_start + (period - (cycle_start - start) mod period)
            3. wait (per WaitMode) until the boundary
            4. latency = wake - cycle_start, stats.update(latency, period) unconditionally
            5. latency > period -> RealTimeViolation{period, latency}
            */
            [[nodiscard]] Expected<CycleTiming> wait_next_cycle() noexcept{
                if (!valid()) return Expected<CycleTiming>::failure(Status::kInvalidArg);

                const t_ns cycle_start = read_clock(cfg_.hooks.now, cfg_.hooks.user);
                const t_ns elapsed = cycle_start - start_;

                // floor mod, an injected clock may read before start_
                t_ns rem = elapsed % period_;
                if (rem < 0) rem += period_;

                const t_ns target = cycle_start + (period_ - rem);
                const std::int64_t k = (elapsed - rem) / period_ + 1;

                const t_ns wake = wait_until(target, cfg_.wait_mode, cfg_.spin_margin, cfg_.hooks.now, cfg_.hooks.user);
                const t_ns latency = wake - cycle_start;

                {
                    std::lock_guard<std::mutex> lk(stats_mtx_);
                    stats_.update(latency, period_);
                    if (last_k_ >= 0 && k > last_k_ + 1) stats_.skipped_cycles += static_cast<std::uint64_t>(k - last_k_ - 1);
                }
                last_k_ = k;

                if (latency > period_){
                    const Error e = Error::real_time_violation(period_, latency, static_cast<std::uint64_t>(k));
                    report_violation_(e, wake);
                    return Expected<CycleTiming>::failure(e);
                }

                return Expected<CycleTiming>::success(CycleTiming{
                    .cycle_index = static_cast<std::uint64_t>(k),
                    .cycle_start = cycle_start,
                    .target = target,
                    .wake = wake,
                    .latency = latency,
                    .period = period_
                });
            }

            // // copy under the guard, never a live reference
            [[nodiscard]] RtStats get_stats() const noexcept{
                std::lock_guard<std::mutex> lk(stats_mtx_);
                return stats_;
            }

            dt_ns period() const noexcept{
                return period_;
            }

            double frequency_hz() const noexcept{
                return hz_;
            }

            t_ns start_reference() const noexcept{
                return start_;
            }

            WaitMode wait_mode() const noexcept{
                return cfg_.wait_mode;
            }

        private:
            void report_violation_(const Error& e, t_ns t) noexcept{
                if (cfg_.logger){
                    char line[128];
                    (void)format_error(e, line);
                    cfg_.logger->log(LogLevel::kWarn, line, t);
                }
                if (cfg_.hooks.on_violation) cfg_.hooks.on_violation(e, cfg_.hooks.user);
            }

            PacerConfig cfg_{};
            double hz_{0.0};
            dt_ns period_{0};
            t_ns start_{0};

            // last grid index waited for, -1 before the first wait
            std::int64_t last_k_{-1};

            mutable std::mutex stats_mtx_;
            RtStats stats_{};
    };

} // namespace rtloop
