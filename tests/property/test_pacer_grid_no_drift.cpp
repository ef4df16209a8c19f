#include <random>
#include <cassert>
#include <cstdint>

#include "rtloop/timing/cycle_pacer.hpp"

using namespace rtloop;

/*
Clock with random read to read spacing: cycle starts land anywhere inside the period
the targets must still sit exactly on start + k*period after many cycles (no accumulated rounding)
*/
struct JitterClock{
    t_ns t{123'456};
    std::mt19937_64 rng{42};
    std::uniform_int_distribution<dt_ns> gap{1, 40'000};

    static t_ns read(void* user) noexcept{
        auto* c = static_cast<JitterClock*>(user);
        const t_ns now = c->t;
        c->t += c->gap(c->rng);
        return now;
    }
};

int main(){
    // 7 kHz -> 142857.14 ns, period rounds to 142857
    JitterClock clk;
    PacerConfig cfg{};
    cfg.hooks.now = &JitterClock::read;
    cfg.hooks.user = &clk;

    CyclePacer p(7000.0, cfg);
    assert(p.period() == 142'857);
    const t_ns start = p.start_reference();

    std::uniform_int_distribution<dt_ns> work(0, 400'000);
    std::mt19937_64 wrng(7);

    std::uint64_t on_time = 0, late = 0, last_k = 0;
    for (int i=0; i<20'000; ++i){
        auto r = p.wait_next_cycle();
        if (r.has_value()){
            const CycleTiming& c = r.value();
            assert(c.target == start + static_cast<t_ns>(c.cycle_index) * p.period());
            assert(c.target > c.cycle_start);
            assert(c.target - c.cycle_start <= p.period());
            assert(c.wake >= c.target);
            assert(c.cycle_index > last_k);
            last_k = c.cycle_index;
            ++on_time;
        } else {
            assert(r.error().is_real_time_violation());
            assert(r.error().expected == p.period());
            ++late;
        }

        // simulated work of random length, sometimes several periods
        clk.t += work(wrng);
    }

    const RtStats st = p.get_stats();
    assert(st.cycles_count == on_time + late);
    assert(st.deadline_misses == late);
    assert(st.skipped_cycles > 0);
    return 0;
}
