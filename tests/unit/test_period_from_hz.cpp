#include <cmath>
#include <limits>
#include <cassert>

#include "rtloop/core/time.hpp"

using namespace rtloop;

int main(){
    assert(period_from_hz(1000.0) == 1'000'000);
    assert(period_from_hz(1.0) == kNsPerSec);
    assert(period_from_hz(3.0) == 333'333'333);    // rounded to nearest
    assert(period_from_hz(60.0) == 16'666'667);
    assert(period_from_hz(0.5) == 2 * kNsPerSec);

    // unusable frequencies
    assert(period_from_hz(0.0) == 0);
    assert(period_from_hz(-100.0) == 0);
    assert(period_from_hz(std::numeric_limits<double>::quiet_NaN()) == 0);
    assert(period_from_hz(std::numeric_limits<double>::infinity()) == 0);
    assert(period_from_hz(3e9) == 0);               // < 1 ns after rounding
    assert(period_from_hz(1e-12) == 0);             // overflows the ns range

    assert(std::abs(to_seconds(1'500'000) - 0.0015) < 1e-15);
    return 0;
}
