#include <cmath>
#include <cassert>

#include "rtloop/control/pid/pid.hpp"

using namespace rtloop;
using namespace rtloop::control::pid;

static bool near(Scalar a, Scalar b, Scalar tol = 1e-12){
    return std::abs(a - b) <= tol;
}

int main(){
    // within limit, then clamped
    {
        PidController p(1.0, 0.0, 0.0, 10.0);
        assert(p.compute(5.0, 0.0, 0.01) == 5.0);
        assert(!p.saturated());

        PidController q(1.0, 0.0, 0.0, 3.0);
        assert(q.compute(5.0, 0.0, 0.01) == 3.0);
        assert(q.saturated());
        assert(PidController(1.0, 0.0, 0.0, 3.0).compute(-5.0, 0.0, 0.01) == -3.0);
    }

    // I term accumulates e*dt, D term is the error slope
    {
        PidController p(0.0, 2.0, 0.0, 100.0);
        (void)p.compute(1.0, 0.0, 0.5);
        assert(near(p.integral(), 0.5));
        const Scalar u = p.compute(1.0, 0.0, 0.5);
        assert(near(p.integral(), 1.0));
        assert(near(u, 2.0));

        PidController d(0.0, 0.0, 1.0, 100.0);
        const Scalar u1 = d.compute(1.0, 0.0, 0.1);   // (1 - 0) / 0.1
        assert(near(u1, 10.0));
        const Scalar u2 = d.compute(1.0, 0.5, 0.1);   // (0.5 - 1) / 0.1
        assert(near(u2, -5.0));
        assert(near(d.previous_error(), 0.5));
    }

    // dt == 0: no derivative, no integration, error still advances
    {
        PidController p(1.0, 1.0, 1.0, 100.0);
        const Scalar u = p.compute(2.0, 0.0, 0.0);
        assert(std::isfinite(u));
        assert(near(u, 2.0));
        assert(p.integral() == 0.0);
        assert(near(p.previous_error(), 2.0));

        // negative dt is treated the same for D
        PidController n(0.0, 0.0, 1.0, 100.0);
        assert(n.compute(1.0, 0.0, -0.01) == 0.0);
    }

    // anti-windup: the accumulator itself stays inside the limit
    {
        PidController p(0.0, 1.0, 0.0, 2.0);
        for (int i=0; i<1000; ++i) (void)p.compute(10.0, 0.0, 0.1);
        assert(p.integral() == 2.0);

        // error reversal pulls the output back right away, no unwinding period
        const Scalar u = p.compute(0.0, 10.0, 0.1);
        assert(near(p.integral(), 1.0));
        assert(near(u, 1.0));
    }

    // reset == fresh controller with the same gains
    {
        PidController a(1.2, 0.7, 0.05, 5.0);
        PidController fresh(1.2, 0.7, 0.05, 5.0);
        for (int i=0; i<20; ++i) (void)a.compute(1.0, 0.1 * i, 0.01);
        a.reset();
        assert(a.integral() == 0.0 && a.previous_error() == 0.0);
        assert(a.kp() == 1.2 && a.ki() == 0.7 && a.kd() == 0.05 && a.output_limit() == 5.0);
        for (int i=0; i<20; ++i){
            const Scalar sp = std::sin(0.3 * i), y = 0.05 * i;
            assert(a.compute(sp, y, 0.01) == fresh.compute(sp, y, 0.01));
        }
    }

    // limit is a magnitude
    {
        PidController p(1.0, 0.0, 0.0, -3.0);
        assert(p.output_limit() == 3.0);
        assert(p.compute(5.0, 0.0, 0.01) == 3.0);
    }
    return 0;
}
