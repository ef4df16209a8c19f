#pragma once
#include <cmath>
#include <cstdint>

namespace rtloop{
    // // Standardized time unit across the whole toolkit in Nanoseconds

    using t_ns = std::int64_t;
    using dt_ns = std::int64_t;

    inline constexpr t_ns kNsPerSec = 1'000'000'000;

    // // cycles per second -> fixed period in ns, rounded to nearest
    // // 0 => unusable (non finite, <= 0, or period rounds below 1 ns)
    inline dt_ns period_from_hz(double hz) noexcept{
        if (!std::isfinite(hz) || hz <= 0.0) return 0;
        const double p = std::round(1e9 / hz);
        if (!(p >= 1.0) || p > 9.0e18) return 0;
        return static_cast<dt_ns>(p);
    }

    inline constexpr double to_seconds(dt_ns d) noexcept{
        return static_cast<double>(d) * 1e-9;
    }

} // namespace rtloop
