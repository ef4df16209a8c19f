#include <cstring>
#include <thread>
#include <cassert>

#include "rtloop/os/rt_thread.hpp"

using namespace rtloop;
using namespace rtloop::os;

int main(){
    // nothing requested -> nothing to fail, on every platform
    {
        const Outcome o = configure_current_thread(RtThreadConfig{});
        assert(o.has_value());
        assert(o.status() == Status::kOK);
    }

#if defined(__linux__)
    assert(online_cpus() >= 1);

    // core index past the cpu set: rejected before touching the thread
    {
        RtThreadConfig cfg{};
        cfg.cpu = 1 << 20;
        const Outcome o = configure_current_thread(cfg);
        assert(!o.has_value());
        assert(o.error().is_hardware_init_failed());
        assert(std::strcmp(o.error().reason, "pthread_setaffinity_np: Invalid argument") == 0);
    }

    // priority outside the FIFO range
    {
        RtThreadConfig cfg{};
        cfg.policy = RtSchedPolicy::kFifo;
        cfg.priority = 0;
        const Outcome o = configure_current_thread(cfg);
        assert(!o.has_value());
        assert(o.status() == Status::kHardwareInitFailed);
        assert(std::strcmp(o.error().reason, "sched_setscheduler: Invalid argument") == 0);
    }

    // errno text is per call: two threads failing at once each get their own reason
    {
        char a[Error::kReasonCap]{}, b[Error::kReasonCap]{};
        auto worker = [](char* out, int cpu, RtSchedPolicy pol){
            for (int i=0; i<200; ++i){
                RtThreadConfig cfg{};
                cfg.cpu = cpu;
                cfg.policy = pol;
                cfg.priority = 0;
                const Outcome o = configure_current_thread(cfg);
                if (!o.has_value()) std::memcpy(out, o.error().reason, Error::kReasonCap);
            }
        };
        std::thread t1(worker, a, 1 << 20, RtSchedPolicy::kOther);
        std::thread t2(worker, b, -1, RtSchedPolicy::kRoundRobin);
        t1.join();
        t2.join();
        assert(std::strcmp(a, "pthread_setaffinity_np: Invalid argument") == 0);
        assert(std::strcmp(b, "sched_setscheduler: Invalid argument") == 0);
    }
#endif
    return 0;
}
