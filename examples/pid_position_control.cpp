#include <cstdio>

#include "rtloop/all.hpp"

using namespace rtloop;
using namespace rtloop::control::pid;

/*
1. Compute P + I + D against the measured position
2. Saturate to [-1, 1], integral clamped to the same bound
3. Send u
4. Plant integrates u
5. Repeat it 100x, no pacing: the control law alone
*/
int main(){
    const dt_ns dt = 1'000'000;
    const Scalar dt_s = static_cast<Scalar>(to_seconds(dt)); // 0.001

    auto made = PidController::make(PidConfig{.kp=2.0, .ki=1.0, .kd=0.1, .output_limit=1.0});
    if (!made){
        char msg[96];
        (void)format_error(made.error(), msg);
        std::fprintf(stderr, "pid config rejected: %s\n", msg);
        return 1;
    }
    PidController pid = made.take();

    Scalar y = 0.0;
    const Scalar r = 1.0;

    for (int k=0; k<100; ++k){
        const Scalar u = pid.compute(r, y, dt_s);

        y += 20.0 * dt_s * u;            // scales correctly if dt changes

        std::printf("%d, u=%.6f, y=%.6f%s\n", k, static_cast<double>(u), static_cast<double>(y), pid.saturated() ? " (sat)" : "");
    }
    return 0;
}
