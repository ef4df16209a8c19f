#include <cassert>

#include "rtloop/core/error.hpp"
#include "rtloop/core/expected.hpp"
#include "rtloop/safety/watchdog.hpp"

using namespace rtloop;
using namespace rtloop::safety;

int main(){
    MissWatchdog wd(3);
    assert(!wd.tripped());

    // two misses, recovery resets the run
    assert(!wd.observe(true));
    assert(!wd.observe(true));
    assert(wd.consecutive_misses() == 2);
    assert(!wd.observe(false));
    assert(wd.consecutive_misses() == 0);
    assert(wd.misses() == 2);

    // three in a row trips, and it latches
    wd.observe(true);
    wd.observe(true);
    assert(wd.observe(true));
    assert(wd.tripped());
    assert(wd.observe(false));
    assert(wd.tripped());
    assert(wd.cycles() == 7);

    wd.reset();
    assert(!wd.tripped() && wd.misses() == 0 && wd.cycles() == 0);

    // pacer outcomes: only RealTimeViolation counts as a miss
    const auto miss = Expected<CycleTiming>::failure(Error::real_time_violation(1000, 2000));
    const auto invalid = Expected<CycleTiming>::failure(Status::kInvalidArg);
    const auto on_time = Expected<CycleTiming>::success(CycleTiming{});
    wd.observe(miss);
    wd.observe(invalid);
    wd.observe(on_time);
    assert(wd.misses() == 1 && wd.consecutive_misses() == 0 && wd.cycles() == 3);

    // threshold 0 never trips
    MissWatchdog never(0);
    for (int i=0; i<100; ++i) never.observe(true);
    assert(!never.tripped() && never.misses() == 100);
    return 0;
}
