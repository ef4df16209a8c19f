#pragma once
#include <cmath>
#include <limits>

#include "rtloop/core/types.hpp"

namespace rtloop::safety{
    struct Clip{
        Scalar val; // final clamped value
        bool   hit; // was clamped?
        Scalar mag; // how far outside the limit it was
    };

    // // clamp v into [-limit, limit]; limit is taken as a magnitude
    // // NaN goes to the limit on its sign bit side, mag = inf
    inline Clip clamp_symmetric(Scalar v, Scalar limit) noexcept{
        const Scalar hi = std::abs(limit);
        const Scalar lo = -hi;
        if (std::isnan(v)) return {std::signbit(v) ? lo : hi, true, std::numeric_limits<Scalar>::infinity()};
        if (v > hi) return {hi, true, v - hi};
        if (v < lo) return {lo, true, lo - v};
        return {v, false, Scalar(0)};
    }

} // namespace rtloop::safety
