#include <cmath>
#include <algorithm>

#include "cycle_acc.hpp"

namespace rtloop::tools::detail{
    void CycleAcc::on_cycle(double setpoint, double measured, double output, bool violation) noexcept{
        iae += std::abs(setpoint - measured);

        if (have_u) tvu += std::abs(output - last_u);
        last_u = output;
        have_u = true;

        ++recorded;
        if (violation) ++violations;
    }

    void CycleAcc::on_latency_us(double us) noexcept{
        if (!std::isfinite(us) || us < 0.0) return;
        lat_us[lat_head] = us;
        lat_head = (lat_head + 1) % kLatCap;
        if (lat_count < kLatCap) ++lat_count;
    }

    void CycleAcc::finalize_latency_percentiles() noexcept{
        if (lat_count == 0){
            p50_lat_us = p95_lat_us = p99_lat_us = 0.0;
            return;
        }

        // linear order out of the ring, then sort; cap = 2048 keeps it bounded
        double buf[kLatCap];
        const std::size_t n = lat_count;
        const std::size_t start = (lat_count == kLatCap) ? lat_head : 0;

        for (std::size_t i=0; i<n; ++i){
            buf[i] = lat_us[(start + i) % kLatCap];
        }

        std::sort(buf, buf + n);

        // linear interpolation between closest ranks
        auto q = [&](double p)->double{
            const double pos = p * static_cast<double>(n - 1);
            const std::size_t lo = static_cast<std::size_t>(pos);
            const std::size_t hi = std::min(lo + 1, n - 1);
            const double frac = pos - static_cast<double>(lo);
            return buf[lo] + (buf[hi] - buf[lo]) * frac;
        };

        p50_lat_us = q(0.50);
        p95_lat_us = q(0.95);
        p99_lat_us = q(0.99);
    }

    void CycleAcc::reset() noexcept{
        iae = tvu = 0.0;
        last_u = 0.0;
        have_u = false;

        recorded = 0;
        violations = 0;

        lat_count = 0;
        lat_head = 0;
        p50_lat_us = p95_lat_us = p99_lat_us = 0.0;
    }
} // namespace rtloop::tools::detail
