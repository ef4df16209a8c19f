#include <cmath>
#include <limits>
#include <initializer_list>
#include <random>
#include <cassert>

#include "rtloop/control/pid/pid.hpp"

using namespace rtloop;
using namespace rtloop::control::pid;

/*
for any gains, inputs and dt:
    |output|   <= output_limit
    |integral| <= output_limit
    output finite whenever inputs are finite, including +-max where e overflows to +-inf
*/
int main(){
    std::mt19937_64 rng(0x5eed);
    std::uniform_real_distribution<Scalar> gain(-50.0, 50.0);
    std::uniform_real_distribution<Scalar> sig(-1e3, 1e3);
    std::uniform_real_distribution<Scalar> lim(1e-3, 100.0);
    std::uniform_real_distribution<Scalar> step(-1e-3, 0.1);

    for (int trial=0; trial<200; ++trial){
        const Scalar L = lim(rng);
        PidController pid(gain(rng), gain(rng), gain(rng), L);

        for (int k=0; k<500; ++k){
            // every 50th step a zero length cycle
            const Scalar dt = (k % 50 == 0) ? Scalar(0) : step(rng);
            const Scalar u = pid.compute(sig(rng), sig(rng), dt);
            assert(std::isfinite(u));
            assert(std::abs(u) <= L);
            assert(std::abs(pid.integral()) <= L);
            if (pid.saturated()) assert(std::abs(u) == L);
        }
    }

    // e = max - (-max) overflows to inf; state must not go NaN, with or without dt
    const Scalar M = std::numeric_limits<Scalar>::max();
    for (Scalar dt : {Scalar(0), Scalar(0.01)}){
        PidController p(1.0, 0.0, 0.0, 10.0);
        assert(p.compute(M, -M, dt) == 10.0);
        assert(p.saturated());
        assert(std::isfinite(p.integral()) && std::abs(p.integral()) <= 10.0);
        assert(!std::isnan(p.previous_error()));

        assert(p.compute(-M, M, dt) == -10.0);
        assert(std::isfinite(p.integral()) && std::abs(p.integral()) <= 10.0);

        // next ordinary cycle is back to plain P action
        assert(p.compute(1.0, 0.0, 0.01) == 1.0);
        assert(!p.saturated());

        // all three terms live: bounded through the spike, finite once inputs are ordinary again
        PidController q(2.0, 1.0, 0.5, 5.0);
        Scalar u = q.compute(M, -M, dt);
        assert(std::isfinite(u) && std::abs(u) <= 5.0);
        assert(std::isfinite(q.integral()) && std::abs(q.integral()) <= 5.0);
        u = q.compute(-M, M, dt);
        assert(std::isfinite(u) && std::abs(u) <= 5.0);
        for (int k=0; k<3; ++k){
            u = q.compute(0.1, 0.0, 0.01);
            assert(std::isfinite(u) && std::abs(u) <= 5.0);
            assert(std::isfinite(q.integral()) && std::abs(q.integral()) <= 5.0);
            assert(std::isfinite(q.previous_error()));
        }
    }
    return 0;
}
