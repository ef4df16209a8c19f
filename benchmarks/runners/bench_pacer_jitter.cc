#include <vector>
#include <string>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <algorithm>

#include "rtloop/all.hpp"
#include "rtloop/os/rt_thread.hpp"

using namespace rtloop;

// // Wake jitter percentiles + min/max, ns
struct Stats{
    /*
    Jitter profile of wake - target (how late the wait returned past its grid point):

    p50 = median, half the wakes were earlier
    p95 / p99 / p999 = tail, only 5% / 1% / 0.1% of wakes were later than this
    jmin / jmax = extremes
    */
    double p50, p95, p99, p999, jmin, jmax;
};

static Stats summarize(std::vector<double>& ns){
    std::sort(ns.begin(), ns.end());
    const std::size_t n = ns.size();
    if (n == 0) return {0, 0, 0, 0, 0, 0};

    auto q = [&](double p) -> double{
        const double pos = p * static_cast<double>(n - 1u);
        return ns[static_cast<std::size_t>(pos)];
    };

    return {
        q(0.50),
        q(0.95),
        q(0.99),
        q(0.999),
        ns.front(),
        ns.back()
    };
}

static const char* mode_name(WaitMode m){
    switch (m){
        case WaitMode::kBusySpin:      return "busy_spin";
        case WaitMode::kSleepThenSpin: return "sleep_then_spin";
        case WaitMode::kYieldSpin:     return "yield_spin";
    }
    return "?";
}

/*
usage: bench_pacer_jitter [hz] [iters] [--cpu N] [--fifo PRIO] [--mlock] [--no-header]
one row per wait mode: wake jitter percentiles + pacer stats for the same run
*/
int main(int argc, char** argv){
    double hz = 1000.0;
    int iters = 5000;
    bool opt_no_header = false;
    os::RtThreadConfig rt{};
    rt.cpu = 0;

    if (argc > 1) hz = std::atof(argv[1]);
    if (argc > 2) iters = std::atoi(argv[2]);
    for (int i=3; i<argc; ++i){
        if (std::strcmp(argv[i], "--cpu") == 0 && i+1 < argc) rt.cpu = std::atoi(argv[++i]);
        else if (std::strcmp(argv[i], "--fifo") == 0 && i+1 < argc){
            rt.policy = os::RtSchedPolicy::kFifo;
            rt.priority = std::atoi(argv[++i]);
        }
        else if (std::strcmp(argv[i], "--mlock") == 0) rt.lock_memory = true;
        else if (std::strcmp(argv[i], "--no-header") == 0) opt_no_header = true;
    }
    if (iters <= 0) return 2;

    // pinning / RT class are best effort: an unprivileged run still produces numbers
    StderrSink log(LogLevel::kInfo, "bench_pacer_jitter");
    const Outcome o = os::configure_current_thread(rt);
    if (!o){
        char msg[96];
        (void)format_error(o.error(), msg);
        log.log(LogLevel::kWarn, msg, monotonic_now());
    }

    if (!opt_no_header){
        std::puts("mode, hz, period_ns, iters, p50, p95, p99, p999, jmin, jmax, misses, skipped, avg_latency_ns");
    }

    const WaitMode modes[] = {WaitMode::kBusySpin, WaitMode::kSleepThenSpin, WaitMode::kYieldSpin};
    for (WaitMode m : modes){
        PacerConfig cfg{};
        cfg.wait_mode = m;
        CyclePacer pacer(hz, cfg);
        if (!pacer.valid()){
            std::fprintf(stderr, "unusable frequency %g\n", hz);
            return 2;
        }

        // jitter buffer sized up front, nothing allocates inside the loop
        std::vector<double> jitter;
        jitter.reserve(static_cast<std::size_t>(iters));

        // warmup: first waits pay for page faults and cold caches
        for (int k=0; k<100; ++k) (void)pacer.wait_next_cycle();
        const RtStats warm = pacer.get_stats();

        for (int k=0; k<iters; ++k){
            auto r = pacer.wait_next_cycle();
            if (r) jitter.push_back(static_cast<double>(r.value().wake - r.value().target));
        }

        const RtStats st = pacer.get_stats();
        const Stats S = summarize(jitter);
        std::printf(
            "%s, %.1f, %lld, %d, %.0f, %.0f, %.0f, %.0f, %.0f, %.0f, %llu, %llu, %lld\n",
            mode_name(m),
            hz,
            static_cast<long long>(pacer.period()),
            iters,
            S.p50, S.p95, S.p99, S.p999, S.jmin, S.jmax,
            static_cast<unsigned long long>(st.deadline_misses - warm.deadline_misses),
            static_cast<unsigned long long>(st.skipped_cycles - warm.skipped_cycles),
            static_cast<long long>(st.avg_latency)
        );
    }
    return 0;
}
