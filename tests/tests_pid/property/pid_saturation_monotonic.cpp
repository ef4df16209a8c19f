#include <cmath>
#include <limits>
#include <vector>
#include <cassert>

#include "rtloop/safety/clip.hpp"
#include "rtloop/control/pid/pid.hpp"

using namespace rtloop;

int main(){
    std::vector<Scalar> u{-2.0, -0.5, 0.0, 0.5, 3.0};

    // Monotonicity : |clamp(u, tight)| <= |clamp(u, loose)| component wise
    for (Scalar v : u){
        const safety::Clip loose = safety::clamp_symmetric(v, 2.0);
        const safety::Clip tight = safety::clamp_symmetric(v, 0.75);
        assert(std::abs(tight.val) <= std::abs(loose.val) + 1e-15);
        assert(!loose.hit || tight.hit);
        if (tight.hit) assert(std::abs(std::abs(v) - 0.75 - tight.mag) < 1e-12);
    }

    // non-finite values land on the limit with their sign
    {
        const Scalar inf = std::numeric_limits<Scalar>::infinity();
        const Scalar nan = std::numeric_limits<Scalar>::quiet_NaN();
        const safety::Clip p = safety::clamp_symmetric(inf, 2.0);
        assert(p.val == 2.0 && p.hit);
        const safety::Clip n = safety::clamp_symmetric(-inf, 2.0);
        assert(n.val == -2.0 && n.hit);
        const safety::Clip q = safety::clamp_symmetric(nan, 2.0);
        assert(std::abs(q.val) == 2.0 && q.hit && std::isinf(q.mag));
        const safety::Clip qn = safety::clamp_symmetric(-nan, 2.0);
        assert(std::abs(qn.val) == 2.0 && qn.hit);
    }

    // same controller state, tighter limit -> never a larger output magnitude
    control::pid::PidController loose(3.0, 1.0, 0.1, 2.0), tight(3.0, 1.0, 0.1, 0.75);
    for (int k=0; k<200; ++k){
        const Scalar sp = std::sin(0.05 * k) * 4.0;
        const Scalar y = std::cos(0.03 * k);
        const Scalar a = loose.compute(sp, y, 0.01);
        const Scalar b = tight.compute(sp, y, 0.01);
        assert(std::abs(b) <= 0.75);
        assert(std::abs(a) <= 2.0);
    }
    return 0;
}
