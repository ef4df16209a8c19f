#pragma once

#include <limits>
#include <cstdint>

#include "rtloop/core/time.hpp"

namespace rtloop{
    /*
    Running latency statistics of one pacer
        empty state: min = max t_ns (sentinel), max = avg = 0, counters = 0
        avg is the exact running mean in integer ns: avg' = (avg*n + latency) / (n+1)
            -> integer division, truncates toward zero on every update (reproducible, not rounded)
        invariants once cycles_count >= 1: min <= avg <= max, deadline_misses <= cycles_count
    */
    struct RtStats{
        t_ns min_latency{std::numeric_limits<t_ns>::max()};
        t_ns max_latency{0};
        t_ns avg_latency{0};

        // // incremented by exactly one per update
        std::uint64_t cycles_count{0};

        // // updates with latency > deadline
        std::uint64_t deadline_misses{0};

        // // grid points passed without a wait (caller overran whole periods), fed by the pacer
        std::uint64_t skipped_cycles{0};

        void update(t_ns latency, dt_ns deadline) noexcept{
            if (latency < min_latency) min_latency = latency;
            if (latency > max_latency) max_latency = latency;

            const t_ns n = static_cast<t_ns>(cycles_count);
            avg_latency = (avg_latency * n + latency) / (n + 1);

            ++cycles_count;
            if (latency > deadline) ++deadline_misses;
        }

        bool has_data() const noexcept{
            return cycles_count != 0;
        }

        double miss_ratio() const noexcept{
            return cycles_count ? static_cast<double>(deadline_misses) / static_cast<double>(cycles_count) : 0.0;
        }
    };

} // namespace rtloop
