#pragma once

#include <cstddef>
#include <cstdint>

namespace rtloop::tools::detail{
    /*
    Recorder side accumulator over written cycles
        latency reservoir -> last kLatCap latencies, percentiles on demand
        iae -> sum |setpoint - measured|, tvu -> total variation of the output
    */
    struct CycleAcc{
        double iae{0.0};
        double tvu{0.0};
        double last_u{0.0};
        bool have_u{false};

        std::uint64_t recorded{0};
        std::uint64_t violations{0};

        // Latency reservoir (ring)
        static constexpr std::size_t kLatCap = 2048;
        double lat_us[kLatCap];

        // samples held, next write index
        std::size_t lat_count{0};
        std::size_t lat_head{0};

        double p50_lat_us{0.0}, p95_lat_us{0.0}, p99_lat_us{0.0};

        void on_cycle(double setpoint, double measured, double output, bool violation) noexcept;

        // ignores negative / non finite samples
        void on_latency_us(double us) noexcept;

        void finalize_latency_percentiles() noexcept;

        void reset() noexcept;
    };
} // namespace rtloop::tools::detail
