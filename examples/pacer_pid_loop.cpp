#include <atomic>
#include <thread>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>

#include "rtloop/all.hpp"
#include "rtloop/os/rt_thread.hpp"
#include "rtloop/tools/recorder.hpp"

using namespace rtloop;
using namespace rtloop::control::pid;

/*
One complete loop:
    sensor thread  -> simulated first order plant, publishes position into a StateSlot
    control thread -> wait_next_cycle -> read latest sample -> PID -> actuator command -> evidence

usage: pacer_pid_loop [hz] [seconds] [--record <dir>] [--cpu N] [--fifo PRIO]
*/

struct Plant{
    std::atomic<double> command{0.0};
    StateSlot<double> position;
};

int main(int argc, char** argv){
    double hz = 1000.0;
    double seconds = 2.0;
    const char* record_dir = nullptr;
    os::RtThreadConfig rt{};

    for (int i=1; i<argc; ++i){
        if (!std::strcmp(argv[i], "--record") && i+1<argc) record_dir = argv[++i];
        else if (!std::strcmp(argv[i], "--cpu") && i+1<argc) rt.cpu = std::atoi(argv[++i]);
        else if (!std::strcmp(argv[i], "--fifo") && i+1<argc){
            rt.policy = os::RtSchedPolicy::kFifo;
            rt.priority = std::atoi(argv[++i]);
        }
        else if (i == 1) hz = std::atof(argv[i]);
        else if (i == 2) seconds = std::atof(argv[i]);
    }

    StderrSink log(LogLevel::kInfo, "pacer_pid_loop");

    PacerConfig pcfg{};
    pcfg.wait_mode = WaitMode::kSleepThenSpin;
    pcfg.logger = &log;
    CyclePacer pacer(hz, pcfg);
    if (!pacer.valid()){
        std::fprintf(stderr, "unusable loop frequency: %g Hz\n", hz);
        return 2;
    }

    auto made = PidController::make(PidConfig{.kp=4.0, .ki=2.0, .kd=0.05, .output_limit=1.0});
    if (!made) return 3;
    PidController pid = made.take();

    std::unique_ptr<tools::Recorder> rec;
    if (record_dir){
        tools::RecorderOptions ro;
        ro.out_dir = record_dir;
        ro.dt_ns_hint = pacer.period();
        ro.loop_id = "pacer_pid_loop";
        rec = tools::Recorder::open(ro);
        rec->write_buildinfo();
        rec->write_time_anchor(monotonic_now(), utc_now());
    }

    Plant plant;
    std::atomic<bool> stop{false};

    // sensor side: own cadence, integrates the last command
    std::thread sensor([&]{
        double y = 0.0;
        t_ns last = monotonic_now();
        while (!stop.load(std::memory_order_acquire)){
            const t_ns now = monotonic_now();
            y += 20.0 * to_seconds(now - last) * plant.command.load(std::memory_order_relaxed);
            last = now;
            plant.position.write(y, now);
            sleep_until(now + 250'000);
        }
    });

    // best effort: a loop without RT privileges still runs, only with more jitter
    const Outcome o = os::configure_current_thread(rt);
    if (!o){
        char msg[96];
        (void)format_error(o.error(), msg);
        log.log(LogLevel::kWarn, msg, monotonic_now());
    }

    safety::MissWatchdog wd(50);
    const Scalar dt_s = static_cast<Scalar>(to_seconds(pacer.period()));
    const double setpoint = 1.0;
    const std::uint64_t cycles = static_cast<std::uint64_t>(seconds * hz);

    for (std::uint64_t k=0; k<cycles; ++k){
        auto r = pacer.wait_next_cycle();
        if (wd.observe(r)){
            log.log(LogLevel::kError, "too many consecutive deadline misses, stopping", monotonic_now());
            break;
        }

        auto sample = require(plant.position);
        if (!sample){
            // sensor not up yet: hold the actuator
            plant.command.store(0.0, std::memory_order_relaxed);
            continue;
        }

        const Scalar u = pid.compute(setpoint, sample.value().value, dt_s);
        plant.command.store(u, std::memory_order_relaxed);

        if (rec){
            tools::CycleSample cs = tools::timing_sample(r, monotonic_now());
            cs.setpoint = setpoint;
            cs.measured = sample.value().value;
            cs.output = u;
            cs.saturated = pid.saturated();
            rec->write_cycle(cs);
        }
    }

    stop.store(true, std::memory_order_release);
    sensor.join();

    const RtStats st = pacer.get_stats();
    if (rec){
        rec->write_stats(st);
        rec->flush();
    }

    std::printf("cycles=%llu misses=%llu skipped=%llu min=%lldns avg=%lldns max=%lldns\n",
                static_cast<unsigned long long>(st.cycles_count),
                static_cast<unsigned long long>(st.deadline_misses),
                static_cast<unsigned long long>(st.skipped_cycles),
                static_cast<long long>(st.has_data() ? st.min_latency : 0),
                static_cast<long long>(st.avg_latency),
                static_cast<long long>(st.max_latency));
    return wd.tripped() ? 4 : 0;
}
