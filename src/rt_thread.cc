#include <cerrno>
#include <cstdio>
#include <cstring>

#include "rtloop/os/rt_thread.hpp"

#if defined(__linux__)
    #include <pthread.h>
    #include <sched.h>
    #include <unistd.h>
    #include <sys/mman.h>
#endif

namespace rtloop::os{
    namespace{
        #if defined(__linux__)
        // // strerror_r comes in two flavours: XSI returns int and fills buf, GNU returns the text
        [[maybe_unused]] const char* errno_text(int rc, const char* buf) noexcept{
            return (rc == 0) ? buf : "unknown error";
        }
        [[maybe_unused]] const char* errno_text(const char* text, const char*) noexcept{
            return text ? text : "unknown error";
        }
        #endif

        // // "<step>: <strerror(err)>" into an Error, no heap, no shared strerror buffer
        Error step_failed(const char* step, int err) noexcept{
            char buf[Error::kReasonCap];
            #if defined(__linux__)
                char text[64];
                text[0] = '\0';
                std::snprintf(buf, sizeof(buf), "%s: %s", step, errno_text(strerror_r(err, text, sizeof(text)), text));
            #else
                std::snprintf(buf, sizeof(buf), "%s: %s", step, std::strerror(err));
            #endif
            return Error::hardware_init_failed(buf);
        }
    }

    #if defined(__linux__)
    Outcome configure_current_thread(const RtThreadConfig& cfg) noexcept{
        // // 1- CPU pinning: keeps the spinning thread and its caches on one core
        if (cfg.cpu >= 0){
            if (cfg.cpu >= CPU_SETSIZE) return Outcome::failure(step_failed("pthread_setaffinity_np", EINVAL));
            cpu_set_t set;
            CPU_ZERO(&set);
            CPU_SET(cfg.cpu, &set);
            const int rc = pthread_setaffinity_np(pthread_self(), sizeof(set), &set);
            if (rc != 0) return Outcome::failure(step_failed("pthread_setaffinity_np", rc));
        }

        // // 2- RT scheduling class
        if (cfg.policy != RtSchedPolicy::kOther){
            const int pol = (cfg.policy == RtSchedPolicy::kFifo) ? SCHED_FIFO : SCHED_RR;
            const int lo = sched_get_priority_min(pol);
            const int hi = sched_get_priority_max(pol);
            if (cfg.priority < lo || cfg.priority > hi) return Outcome::failure(step_failed("sched_setscheduler", EINVAL));

            sched_param sp{};
            sp.sched_priority = cfg.priority;
            const int rc = pthread_setschedparam(pthread_self(), pol, &sp);
            if (rc != 0) return Outcome::failure(step_failed("sched_setscheduler", rc));
        }

        // // 3- no page faults once the loop runs
        if (cfg.lock_memory){
            if (mlockall(MCL_CURRENT | MCL_FUTURE) != 0) return Outcome::failure(step_failed("mlockall", errno));
        }

        return Outcome::ok();
    }

    int online_cpus() noexcept{
        const long n = sysconf(_SC_NPROCESSORS_ONLN);
        return n > 0 ? static_cast<int>(n) : 0;
    }

    #else
    Outcome configure_current_thread(const RtThreadConfig& cfg) noexcept{
        // nothing requested -> nothing to fail
        if (cfg.cpu < 0 && cfg.policy == RtSchedPolicy::kOther && !cfg.lock_memory) return Outcome::ok();
        return Outcome::failure(Error::hardware_init_failed("rt thread setup: unsupported platform"));
    }

    int online_cpus() noexcept{
        return 0;
    }
    #endif

} // namespace rtloop::os
